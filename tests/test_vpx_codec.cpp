#include <catch2/catch.hpp>
#include "codec/codec_context.hpp"
#include <cstdlib>
#include <string>
#include <vector>

using namespace rdc;
using namespace rdc::codec;
using rdc::core::ErrorCode;

namespace {

constexpr int32_t kW = 64;
constexpr int32_t kH = 64;

std::vector<uint8_t> solid_rgb(int32_t w, int32_t h, uint8_t r, uint8_t g, uint8_t b) {
    std::vector<uint8_t> px(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);
    for(size_t i = 0; i < px.size(); i += 3) {
        px[i] = r;
        px[i + 1] = g;
        px[i + 2] = b;
    }
    return px;
}

pixel::FrameView rgb_view(const std::vector<uint8_t>& px, int32_t w, int32_t h) {
    return pixel::FrameView{ConstByteView(px.data(), px.size()), w, h, w * 3, pixel::PixelLayout::RGB24};
}

bool near(int a, int b, int tolerance) { return std::abs(a - b) <= tolerance; }

config::Settings vp8_settings() {
    config::Settings s;
    s.vpx_codec = config::VpxCodec::VP8;
    return s;
}

} // namespace

TEST_CASE("vpx encoder refuses odd dimensions") {
    CodecContext ctx(BackendKind::Vpx, vp8_settings());
    auto r = ctx.init(63, 64, Direction::Encode);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == ErrorCode::UnsupportedGeometry);
    REQUIRE(ctx.state() == ContextState::Uninitialized);
}

TEST_CASE("vpx encode then decode restores a solid frame") {
    auto enc = open_context(BackendKind::Vpx, Direction::Encode, kW, kH, vp8_settings());
    REQUIRE(enc);
    auto dec = open_context(BackendKind::Vpx, Direction::Decode, kW, kH, vp8_settings());
    REQUIRE(dec);

    const auto px = solid_rgb(kW, kH, 100, 150, 200);
    auto packet = (*enc)->process(rgb_view(px, kW, kH));
    REQUIRE(packet);
    REQUIRE(packet->info().keyframe);
    auto coded = packet->copy_out();
    REQUIRE(coded);
    REQUIRE_FALSE(coded->empty());

    auto out = (*dec)->process(ConstByteView(coded->data(), coded->size()));
    REQUIRE(out);
    REQUIRE(out->info().width == kW);
    REQUIRE(out->info().height == kH);
    REQUIRE(out->info().stride == kW * 3);
    auto frame = out->copy_frame();
    REQUIRE(frame);
    REQUIRE(frame->data.size() == px.size());

    const size_t centre = (static_cast<size_t>(kH / 2) * kW + kW / 2) * 3;
    REQUIRE(near(frame->data[centre], 100, 12));
    REQUIRE(near(frame->data[centre + 1], 150, 12));
    REQUIRE(near(frame->data[centre + 2], 200, 12));

    REQUIRE((*enc)->cleanup());
    REQUIRE((*dec)->cleanup());
}

TEST_CASE("vpx encoder produces output for consecutive frames") {
    auto enc = open_context(BackendKind::Vpx, Direction::Encode, kW, kH, vp8_settings());
    REQUIRE(enc);
    binding::OutputHandle previous;
    for(int i = 0; i < 5; ++i) {
        const auto px = solid_rgb(kW, kH, static_cast<uint8_t>(i * 40), 80, 120);
        auto packet = (*enc)->process(rgb_view(px, kW, kH));
        REQUIRE(packet);
        REQUIRE(packet->valid());
        if(i > 0) REQUIRE_FALSE(previous.valid());
        previous = *packet;
    }
    REQUIRE((*enc)->stats().frames_processed == 5);
    REQUIRE((*enc)->stats().bytes_in == 5 * kW * kH * 3);
}

TEST_CASE("vpx decoder reports garbage and keeps decoding") {
    auto enc = open_context(BackendKind::Vpx, Direction::Encode, kW, kH, vp8_settings());
    REQUIRE(enc);
    auto dec = open_context(BackendKind::Vpx, Direction::Decode, kW, kH, vp8_settings());
    REQUIRE(dec);

    // Keyframe bit set with a wrong start code.
    const std::vector<uint8_t> garbage(32, 0x00);
    auto bad = (*dec)->process(ConstByteView(garbage.data(), garbage.size()));
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().code == ErrorCode::DecodeError);
    REQUIRE((*dec)->state() == ContextState::Ready);

    const auto px = solid_rgb(kW, kH, 10, 20, 30);
    auto packet = (*enc)->process(rgb_view(px, kW, kH));
    REQUIRE(packet);
    auto coded = packet->copy_out();
    REQUIRE(coded);
    auto good = (*dec)->process(ConstByteView(coded->data(), coded->size()));
    REQUIRE(good);
    REQUIRE(good->info().pixels);
}

TEST_CASE("vpx decoder flags a stream of a different size") {
    auto enc = open_context(BackendKind::Vpx, Direction::Encode, 32, 32, vp8_settings());
    REQUIRE(enc);
    auto dec = open_context(BackendKind::Vpx, Direction::Decode, kW, kH, vp8_settings());
    REQUIRE(dec);

    const auto px = solid_rgb(32, 32, 1, 2, 3);
    auto packet = (*enc)->process(rgb_view(px, 32, 32));
    REQUIRE(packet);
    auto coded = packet->copy_out();
    REQUIRE(coded);
    auto out = (*dec)->process(ConstByteView(coded->data(), coded->size()));
    REQUIRE_FALSE(out);
    REQUIRE(out.error().code == ErrorCode::SizeMismatch);
}

TEST_CASE("vp9 encodes and decodes") {
    config::Settings s;
    s.vpx_codec = config::VpxCodec::VP9;
    auto enc = open_context(BackendKind::Vpx, Direction::Encode, kW, kH, s);
    REQUIRE(enc);
    REQUIRE(std::string((*enc)->backend_name()) == "vpx/vp9");
    auto dec = open_context(BackendKind::Vpx, Direction::Decode, kW, kH, s);
    REQUIRE(dec);

    const auto px = solid_rgb(kW, kH, 60, 60, 60);
    auto packet = (*enc)->process(rgb_view(px, kW, kH));
    REQUIRE(packet);
    auto coded = packet->copy_out();
    REQUIRE(coded);
    auto out = (*dec)->process(ConstByteView(coded->data(), coded->size()));
    REQUIRE(out);
    REQUIRE(out->info().width == kW);
}
