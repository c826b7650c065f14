#include <catch2/catch.hpp>
#include "codec/codec_context.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace rdc;
using namespace rdc::codec;
using rdc::core::ErrorCode;

namespace {

// In-memory backend: "compresses" by prefixing a marker byte, "decompresses"
// into a solid RGB24 frame whose colour is the first input byte. An input
// starting with 0xBA is treated as malformed.
struct FakeCounters {
    int opens = 0;
    int closes = 0;
};

class FakeBackend final : public ICodecBackend {
public:
    FakeBackend(std::shared_ptr<FakeCounters> counters, bool encode_only = false)
        : counters_(std::move(counters)), encode_only_(encode_only) {}

    const char* name() const noexcept override { return "fake"; }
    bool supports(Direction dir) const noexcept override { return !encode_only_ || dir == Direction::Encode; }

    Status open(Direction, const Geometry& geometry) override {
        if(geometry.width > 4096) return core::make_error(ErrorCode::UnsupportedGeometry, "too wide");
        geometry_ = geometry;
        ++counters_->opens;
        return {};
    }

    Result<EncodedRegion> compress(ConstByteView rgb, int32_t) override {
        out_.assign(1, 0x42);
        out_.insert(out_.end(), rgb.begin(), rgb.end());
        keyframe_ = !keyframe_;
        return EncodedRegion{out_.data(), out_.size(), keyframe_};
    }

    Result<DecodedRegion> decompress(ConstByteView coded) override {
        if(coded[0] == 0xBA) return core::make_error(ErrorCode::DecodeError, "bad stream");
        int32_t w = geometry_.width;
        if(coded[0] == 0xEE) w += 2;
        const int32_t stride = w * 3;
        out_.assign(static_cast<size_t>(stride) * static_cast<size_t>(geometry_.height), coded[0]);
        return DecodedRegion{out_.data(), out_.size(), w, geometry_.height, stride};
    }

    void close() noexcept override { ++counters_->closes; }

private:
    std::shared_ptr<FakeCounters> counters_;
    bool encode_only_;
    Geometry geometry_;
    std::vector<uint8_t> out_;
    bool keyframe_ = false;
};

std::unique_ptr<CodecContext> make_context(std::shared_ptr<FakeCounters> counters, bool encode_only = false) {
    return std::make_unique<CodecContext>(std::make_unique<FakeBackend>(std::move(counters), encode_only));
}

pixel::FrameView rgb_frame(const std::vector<uint8_t>& bytes, int32_t w, int32_t h, int32_t stride) {
    return pixel::FrameView{ConstByteView(bytes.data(), bytes.size()), w, h, stride, pixel::PixelLayout::RGB24};
}

} // namespace

TEST_CASE("context lifecycle moves Uninitialized to Ready to Destroyed") {
    auto counters = std::make_shared<FakeCounters>();
    auto ctx = make_context(counters);
    REQUIRE(ctx->state() == ContextState::Uninitialized);

    REQUIRE(ctx->init(16, 8, Direction::Encode));
    REQUIRE(ctx->state() == ContextState::Ready);
    REQUIRE(ctx->geometry().width == 16);
    REQUIRE(ctx->direction() == Direction::Encode);
    REQUIRE(std::string(ctx->backend_name()) == "fake");

    auto again = ctx->init(16, 8, Direction::Encode);
    REQUIRE_FALSE(again);
    REQUIRE(again.error().code == ErrorCode::InvalidState);

    REQUIRE(ctx->cleanup());
    REQUIRE(ctx->state() == ContextState::Destroyed);
    REQUIRE(counters->closes == 1);
}

TEST_CASE("process and cleanup after cleanup fail with InvalidState") {
    auto counters = std::make_shared<FakeCounters>();
    auto ctx = make_context(counters);
    REQUIRE(ctx->init(4, 2, Direction::Encode));
    REQUIRE(ctx->cleanup());

    std::vector<uint8_t> rgb(4 * 3 * 2);
    auto p = ctx->process(rgb_frame(rgb, 4, 2, 12));
    REQUIRE_FALSE(p);
    REQUIRE(p.error().code == ErrorCode::InvalidState);

    auto c = ctx->cleanup();
    REQUIRE_FALSE(c);
    REQUIRE(c.error().code == ErrorCode::InvalidState);
    REQUIRE(counters->closes == 1);
}

TEST_CASE("process before init fails with InvalidState") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    std::vector<uint8_t> coded = {1, 2, 3};
    auto p = ctx->process(ConstByteView(coded.data(), coded.size()));
    REQUIRE_FALSE(p);
    REQUIRE(p.error().code == ErrorCode::InvalidState);
    REQUIRE(ctx->cleanup().error().code == ErrorCode::InvalidState);
}

TEST_CASE("init rejects bad geometry and stays Uninitialized") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    auto zero = ctx->init(0, 480, Direction::Encode);
    REQUIRE_FALSE(zero);
    REQUIRE(zero.error().code == ErrorCode::UnsupportedGeometry);

    auto wide = ctx->init(8192, 480, Direction::Encode);
    REQUIRE_FALSE(wide);
    REQUIRE(wide.error().code == ErrorCode::UnsupportedGeometry);
    REQUIRE(ctx->state() == ContextState::Uninitialized);

    REQUIRE(ctx->init(640, 480, Direction::Encode));
}

TEST_CASE("init refuses a direction the backend lacks") {
    auto ctx = make_context(std::make_shared<FakeCounters>(), true);
    auto r = ctx->init(64, 64, Direction::Decode);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == ErrorCode::UnsupportedBackend);
}

TEST_CASE("encoder bound to 640x480 rejects a stride implying another width") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    REQUIRE(ctx->init(640, 480, Direction::Encode));

    std::vector<uint8_t> rgb(320 * 3 * 480);
    auto r = ctx->process(rgb_frame(rgb, 640, 480, 320 * 3));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == ErrorCode::SizeMismatch);

    auto other = ctx->process(rgb_frame(rgb, 320, 480, 320 * 3));
    REQUIRE_FALSE(other);
    REQUIRE(other.error().code == ErrorCode::SizeMismatch);
    REQUIRE(ctx->stats().failed_calls == 2);
    REQUIRE(ctx->state() == ContextState::Ready);
}

TEST_CASE("encoder checks layout and buffer length") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    REQUIRE(ctx->init(4, 2, Direction::Encode));

    std::vector<uint8_t> argb(4 * 4 * 2);
    pixel::FrameView f{ConstByteView(argb.data(), argb.size()), 4, 2, 16, pixel::PixelLayout::ARGB32};
    auto layout = ctx->process(f);
    REQUIRE_FALSE(layout);
    REQUIRE(layout.error().code == ErrorCode::UnsupportedLayout);

    std::vector<uint8_t> short_rgb(4 * 3 * 2 - 1);
    auto shortage = ctx->process(rgb_frame(short_rgb, 4, 2, 12));
    REQUIRE_FALSE(shortage);
    REQUIRE(shortage.error().code == ErrorCode::InvalidBufferSize);
}

TEST_CASE("encoder output handle goes stale on the next call") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    REQUIRE(ctx->init(2, 2, Direction::Encode));

    // Row padding is accepted and passed through.
    std::vector<uint8_t> rgb(8 * 2, 3);
    auto first = ctx->process(rgb_frame(rgb, 2, 2, 8));
    REQUIRE(first);
    REQUIRE(first->valid());
    REQUIRE(first->info().keyframe);
    REQUIRE_FALSE(first->info().pixels);
    auto copy = first->copy_out();
    REQUIRE(copy);
    REQUIRE(copy->size() == 1 + 16);
    REQUIRE((*copy)[0] == 0x42);

    auto second = ctx->process(rgb_frame(rgb, 2, 2, 8));
    REQUIRE(second);
    REQUIRE_FALSE(first->valid());
    REQUIRE(first->view().error().code == ErrorCode::InvalidState);
    REQUIRE_FALSE(second->info().keyframe);

    // A failing call also retires the last good output.
    auto bad = ctx->process(rgb_frame(rgb, 3, 2, 9));
    REQUIRE_FALSE(bad);
    REQUIRE_FALSE(second->valid());

    REQUIRE(ctx->stats().frames_processed == 2);
    REQUIRE(ctx->stats().bytes_in == 32);
    REQUIRE(ctx->stats().bytes_out == 34);
}

TEST_CASE("decoder recovers after a DecodeError") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    REQUIRE(ctx->init(4, 2, Direction::Decode));

    std::vector<uint8_t> garbage = {0xBA, 0xD0};
    auto bad = ctx->process(ConstByteView(garbage.data(), garbage.size()));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().code == ErrorCode::DecodeError);
    REQUIRE(ctx->state() == ContextState::Ready);

    std::vector<uint8_t> good = {0x20};
    auto out = ctx->process(ConstByteView(good.data(), good.size()));
    REQUIRE(out);
    REQUIRE(out->info().pixels);
    REQUIRE(out->info().width == 4);
    REQUIRE(out->info().height == 2);
    REQUIRE(out->info().stride == 12);
    auto frame = out->copy_frame();
    REQUIRE(frame);
    REQUIRE(frame->data == std::vector<uint8_t>(24, 0x20));
    REQUIRE(ctx->stats().failed_calls == 1);
    REQUIRE(ctx->stats().frames_processed == 1);
}

TEST_CASE("decoder rejects empty input and resized streams") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    REQUIRE(ctx->init(4, 2, Direction::Decode));

    auto empty = ctx->process(ConstByteView());
    REQUIRE_FALSE(empty);
    REQUIRE(empty.error().code == ErrorCode::InvalidBufferSize);

    std::vector<uint8_t> resized = {0xEE};
    auto r = ctx->process(ConstByteView(resized.data(), resized.size()));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == ErrorCode::SizeMismatch);
}

TEST_CASE("calling the wrong direction is an InvalidState") {
    auto ctx = make_context(std::make_shared<FakeCounters>());
    REQUIRE(ctx->init(4, 2, Direction::Decode));
    std::vector<uint8_t> rgb(24);
    auto r = ctx->process(rgb_frame(rgb, 4, 2, 12));
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == ErrorCode::InvalidState);
}

TEST_CASE("destroying a Ready context closes the backend and stales handles") {
    auto counters = std::make_shared<FakeCounters>();
    binding::OutputHandle handle;
    {
        auto ctx = make_context(counters);
        REQUIRE(ctx->init(2, 2, Direction::Encode));
        std::vector<uint8_t> rgb(12, 1);
        auto out = ctx->process(rgb_frame(rgb, 2, 2, 6));
        REQUIRE(out);
        handle = *out;
        REQUIRE(handle.valid());
    }
    REQUIRE(counters->opens == 1);
    REQUIRE(counters->closes == 1);
    REQUIRE_FALSE(handle.valid());
}

TEST_CASE("separate contexts are independent") {
    auto a = make_context(std::make_shared<FakeCounters>());
    auto b = make_context(std::make_shared<FakeCounters>());
    REQUIRE(a->init(2, 2, Direction::Encode));
    REQUIRE(b->init(2, 2, Direction::Encode));
    std::vector<uint8_t> rgb(12, 5);
    auto ha = a->process(rgb_frame(rgb, 2, 2, 6));
    auto hb = b->process(rgb_frame(rgb, 2, 2, 6));
    REQUIRE(ha);
    REQUIRE(hb);
    REQUIRE(ha->valid());
    REQUIRE(hb->valid());
}
