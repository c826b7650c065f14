#include "codec/backend.hpp"
#include "codec/colorspace.hpp"
#include "core/log.hpp"
#include <climits>
#include <cstring>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
}

namespace rdc::codec {

using core::ErrorCode;
using core::make_error;

namespace {

std::string av_error_text(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// libavcodec decoder (h264 unless configured otherwise). Decode only; the
// frame is converted from whatever pixel format the decoder emits to RGB24.
class AvcodecBackend final : public ICodecBackend {
public:
    explicit AvcodecBackend(const config::Settings& settings) : decoder_name_(settings.avcodec_decoder) {}
    ~AvcodecBackend() override { close(); }

    const char* name() const noexcept override { return "avcodec"; }

    bool supports(Direction dir) const noexcept override { return dir == Direction::Decode; }

    Status open(Direction dir, const Geometry& geometry) override;
    Result<EncodedRegion> compress(ConstByteView, int32_t) override {
        return make_error(ErrorCode::UnsupportedBackend, "avcodec backend does not encode");
    }
    Result<DecodedRegion> decompress(ConstByteView coded) override;

    void close() noexcept override {
        if(frame_) av_frame_free(&frame_);
        if(packet_) av_packet_free(&packet_);
        if(ctx_) avcodec_free_context(&ctx_);
        input_.clear();
        output_.clear();
    }

private:
    std::string decoder_name_;
    Geometry geometry_;
    AVCodecContext* ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    ColorspaceConverter csc_;
    std::vector<uint8_t> input_;  // host bytes plus AV_INPUT_BUFFER_PADDING_SIZE zeroes
    std::vector<uint8_t> output_;
};

Status AvcodecBackend::open(Direction dir, const Geometry& geometry) {
    if(dir != Direction::Decode) {
        return make_error(ErrorCode::UnsupportedBackend, "avcodec backend does not encode");
    }
    geometry_ = geometry;
    if(av_image_check_size(static_cast<unsigned int>(geometry.width), static_cast<unsigned int>(geometry.height), 0, nullptr) < 0) {
        std::string msg = "avcodec rejects frame size " + std::to_string(geometry.width) + "x" + std::to_string(geometry.height);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }

    const AVCodec* codec = avcodec_find_decoder_by_name(decoder_name_.c_str());
    if(!codec) {
        std::string msg = "avcodec decoder '" + decoder_name_ + "' is not available";
        log::error("codec: " + msg);
        return make_error(ErrorCode::UnsupportedBackend, std::move(msg));
    }

    ctx_ = avcodec_alloc_context3(codec);
    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if(!ctx_ || !packet_ || !frame_) {
        close();
        log::error("codec: avcodec allocation failed");
        return make_error(ErrorCode::UnsupportedBackend, "avcodec allocation failed");
    }
    ctx_->width = geometry.width;
    ctx_->height = geometry.height;
    ctx_->thread_count = 1;
    ctx_->flags |= AV_CODEC_FLAG_LOW_DELAY;

    const int ret = avcodec_open2(ctx_, codec, nullptr);
    if(ret < 0) {
        close();
        std::string msg = "avcodec_open2(" + decoder_name_ + ") failed: " + av_error_text(ret);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }
    return {};
}

Result<DecodedRegion> AvcodecBackend::decompress(ConstByteView coded) {
    if(coded.size() > static_cast<size_t>(INT_MAX - AV_INPUT_BUFFER_PADDING_SIZE)) {
        return make_error(ErrorCode::DecodeError, "compressed frame too large for avcodec");
    }
    // Decoders may over-read up to the padding size past the packet end.
    input_.assign(coded.size() + AV_INPUT_BUFFER_PADDING_SIZE, 0);
    std::memcpy(input_.data(), coded.data(), coded.size());
    packet_->data = input_.data();
    packet_->size = static_cast<int>(coded.size());

    int ret = avcodec_send_packet(ctx_, packet_);
    av_packet_unref(packet_);
    if(ret < 0) {
        std::string msg = "avcodec_send_packet failed: " + av_error_text(ret);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::DecodeError, std::move(msg));
    }

    ret = avcodec_receive_frame(ctx_, frame_);
    if(ret == AVERROR(EAGAIN)) {
        log::warn("codec: avcodec consumed the packet without producing a frame");
        return make_error(ErrorCode::DecodeError, "decoder needs more input before it can produce a frame");
    }
    if(ret < 0) {
        std::string msg = "avcodec_receive_frame failed: " + av_error_text(ret);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::DecodeError, std::move(msg));
    }

    const int32_t w = frame_->width;
    const int32_t h = frame_->height;
    const int32_t stride = w * 3;
    output_.resize(static_cast<size_t>(stride) * static_cast<size_t>(h));
    uint8_t* dst[4] = {output_.data(), nullptr, nullptr, nullptr};
    const int dst_stride[4] = {stride, 0, 0, 0};
    Status converted = csc_.convert(w, h, static_cast<AVPixelFormat>(frame_->format), frame_->data, frame_->linesize,
                                    AV_PIX_FMT_RGB24, dst, dst_stride);
    av_frame_unref(frame_);
    if(!converted) {
        return make_error(ErrorCode::DecodeError, converted.error().message);
    }
    return DecodedRegion{output_.data(), output_.size(), w, h, stride};
}

} // namespace

std::unique_ptr<ICodecBackend> create_avcodec_backend(const config::Settings& settings) {
    return std::make_unique<AvcodecBackend>(settings);
}

} // namespace rdc::codec
