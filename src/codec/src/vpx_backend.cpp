#include "codec/backend.hpp"
#include "codec/colorspace.hpp"
#include "core/log.hpp"
#include <climits>
#include <string>
#include <vector>

extern "C" {
#include <vpx/vpx_encoder.h>
#include <vpx/vpx_decoder.h>
#include <vpx/vp8cx.h>
#include <vpx/vp8dx.h>
}

namespace rdc::codec {

using core::ErrorCode;
using core::make_error;

namespace {

std::string vpx_error_text(vpx_codec_ctx_t* ctx, vpx_codec_err_t rc) {
    std::string msg = vpx_codec_err_to_string(rc);
    if(ctx) {
        if(const char* detail = vpx_codec_error_detail(ctx)) {
            msg += " (";
            msg += detail;
            msg += ")";
        }
    }
    return msg;
}

// libvpx frontend for VP8/VP9. Encoder input goes RGB24 -> I420 through
// swscale; decoder output goes I420 -> RGB24 the same way.
class VpxBackend final : public ICodecBackend {
public:
    explicit VpxBackend(const config::Settings& settings) : settings_(settings) {}
    ~VpxBackend() override { close(); }

    const char* name() const noexcept override {
        return settings_.vpx_codec == config::VpxCodec::VP9 ? "vpx/vp9" : "vpx/vp8";
    }

    bool supports(Direction) const noexcept override { return true; }

    Status open(Direction dir, const Geometry& geometry) override {
        direction_ = dir;
        geometry_ = geometry;
        return dir == Direction::Encode ? open_encoder() : open_decoder();
    }

    Result<EncodedRegion> compress(ConstByteView rgb, int32_t stride) override;
    Result<DecodedRegion> decompress(ConstByteView coded) override;

    void close() noexcept override {
        if(image_allocated_) {
            vpx_img_free(&image_);
            image_allocated_ = false;
        }
        if(codec_open_) {
            vpx_codec_destroy(&codec_);
            codec_open_ = false;
        }
        output_.clear();
        output_.shrink_to_fit();
    }

private:
    Status open_encoder();
    Status open_decoder();

    config::Settings settings_;
    Direction direction_ = Direction::Encode;
    Geometry geometry_;
    vpx_codec_ctx_t codec_{};
    vpx_image_t image_{};
    bool codec_open_ = false;
    bool image_allocated_ = false;
    vpx_codec_pts_t pts_ = 0;
    ColorspaceConverter csc_;
    std::vector<uint8_t> output_;
};

Status VpxBackend::open_encoder() {
    const int w = geometry_.width, h = geometry_.height;
    // I420 chroma planes are subsampled 2x2; libvpx only encodes even sizes.
    if((w % 2) != 0 || (h % 2) != 0) {
        std::string msg = "vpx encoder needs even dimensions, got " + std::to_string(w) + "x" + std::to_string(h);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }

    vpx_codec_iface_t* iface = settings_.vpx_codec == config::VpxCodec::VP9 ? vpx_codec_vp9_cx() : vpx_codec_vp8_cx();
    vpx_codec_enc_cfg_t cfg;
    vpx_codec_err_t rc = vpx_codec_enc_config_default(iface, &cfg, 0);
    if(rc != VPX_CODEC_OK) {
        std::string msg = std::string("vpx default encoder config failed: ") + vpx_codec_err_to_string(rc);
        log::error("codec: " + msg);
        return make_error(ErrorCode::UnsupportedBackend, std::move(msg));
    }

    cfg.g_w = static_cast<unsigned int>(w);
    cfg.g_h = static_cast<unsigned int>(h);
    cfg.g_timebase.num = 1;
    cfg.g_timebase.den = 1000;
    cfg.g_threads = static_cast<unsigned int>(settings_.vpx_threads);
    cfg.g_lag_in_frames = 0; // one packet out per frame in
    cfg.g_pass = VPX_RC_ONE_PASS;
    cfg.g_error_resilient = VPX_ERROR_RESILIENT_DEFAULT;
    cfg.rc_end_usage = VPX_CBR;
    cfg.rc_target_bitrate = static_cast<unsigned int>(settings_.vpx_bitrate_kbps);
    cfg.kf_mode = VPX_KF_AUTO;

    rc = vpx_codec_enc_init(&codec_, iface, &cfg, 0);
    if(rc != VPX_CODEC_OK) {
        std::string msg = "vpx encoder init failed for " + std::to_string(w) + "x" + std::to_string(h) + ": " +
                          vpx_error_text(&codec_, rc);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }
    codec_open_ = true;

    if(!vpx_img_alloc(&image_, VPX_IMG_FMT_I420, cfg.g_w, cfg.g_h, 1)) {
        close();
        std::string msg = "vpx_img_alloc failed for " + std::to_string(w) + "x" + std::to_string(h);
        log::error("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }
    image_allocated_ = true;
    pts_ = 0;
    return {};
}

Status VpxBackend::open_decoder() {
    vpx_codec_iface_t* iface = settings_.vpx_codec == config::VpxCodec::VP9 ? vpx_codec_vp9_dx() : vpx_codec_vp8_dx();
    vpx_codec_dec_cfg_t cfg{};
    cfg.threads = static_cast<unsigned int>(settings_.vpx_threads);
    cfg.w = static_cast<unsigned int>(geometry_.width);
    cfg.h = static_cast<unsigned int>(geometry_.height);

    vpx_codec_err_t rc = vpx_codec_dec_init(&codec_, iface, &cfg, 0);
    if(rc != VPX_CODEC_OK) {
        std::string msg = "vpx decoder init failed: " + vpx_error_text(&codec_, rc);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }
    codec_open_ = true;
    return {};
}

Result<EncodedRegion> VpxBackend::compress(ConstByteView rgb, int32_t stride) {
    const uint8_t* src[4] = {rgb.data(), nullptr, nullptr, nullptr};
    const int src_stride[4] = {stride, 0, 0, 0};
    uint8_t* dst[4] = {image_.planes[VPX_PLANE_Y], image_.planes[VPX_PLANE_U], image_.planes[VPX_PLANE_V], nullptr};
    const int dst_stride[4] = {image_.stride[VPX_PLANE_Y], image_.stride[VPX_PLANE_U], image_.stride[VPX_PLANE_V], 0};
    if(auto ok = csc_.convert(geometry_.width, geometry_.height, AV_PIX_FMT_RGB24, src, src_stride,
                              AV_PIX_FMT_YUV420P, dst, dst_stride); !ok) {
        return make_error(ErrorCode::EncodeError, ok.error().message);
    }

    vpx_codec_err_t rc = vpx_codec_encode(&codec_, &image_, pts_, 1, 0, settings_.vpx_deadline_us);
    if(rc != VPX_CODEC_OK) {
        std::string msg = "vpx_codec_encode failed: " + vpx_error_text(&codec_, rc);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::EncodeError, std::move(msg));
    }
    ++pts_;

    output_.clear();
    bool keyframe = false;
    vpx_codec_iter_t iter = nullptr;
    while(const vpx_codec_cx_pkt_t* pkt = vpx_codec_get_cx_data(&codec_, &iter)) {
        if(pkt->kind != VPX_CODEC_CX_FRAME_PKT) continue;
        const auto* buf = static_cast<const uint8_t*>(pkt->data.frame.buf);
        output_.insert(output_.end(), buf, buf + pkt->data.frame.sz);
        if(pkt->data.frame.flags & VPX_FRAME_IS_KEY) keyframe = true;
    }
    return EncodedRegion{output_.data(), output_.size(), keyframe};
}

Result<DecodedRegion> VpxBackend::decompress(ConstByteView coded) {
    if(coded.size() > UINT_MAX) {
        return make_error(ErrorCode::DecodeError, "compressed frame too large for libvpx");
    }
    vpx_codec_err_t rc = vpx_codec_decode(&codec_, coded.data(), static_cast<unsigned int>(coded.size()), nullptr, 0);
    if(rc != VPX_CODEC_OK) {
        std::string msg = "vpx_codec_decode failed: " + vpx_error_text(&codec_, rc);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::DecodeError, std::move(msg));
    }

    vpx_codec_iter_t iter = nullptr;
    vpx_image_t* img = vpx_codec_get_frame(&codec_, &iter);
    if(!img) {
        log::warn("codec: vpx stream produced no frame");
        return make_error(ErrorCode::DecodeError, "vpx stream produced no frame");
    }
    if(img->fmt != VPX_IMG_FMT_I420) {
        std::string msg = "unsupported vpx image format " + std::to_string(static_cast<int>(img->fmt));
        log::warn("codec: " + msg);
        return make_error(ErrorCode::DecodeError, std::move(msg));
    }

    const int32_t w = static_cast<int32_t>(img->d_w);
    const int32_t h = static_cast<int32_t>(img->d_h);
    const int32_t stride = w * 3;
    output_.resize(static_cast<size_t>(stride) * static_cast<size_t>(h));

    const uint8_t* src[4] = {img->planes[VPX_PLANE_Y], img->planes[VPX_PLANE_U], img->planes[VPX_PLANE_V], nullptr};
    const int src_stride[4] = {img->stride[VPX_PLANE_Y], img->stride[VPX_PLANE_U], img->stride[VPX_PLANE_V], 0};
    uint8_t* dst[4] = {output_.data(), nullptr, nullptr, nullptr};
    const int dst_stride[4] = {stride, 0, 0, 0};
    if(auto ok = csc_.convert(w, h, AV_PIX_FMT_YUV420P, src, src_stride, AV_PIX_FMT_RGB24, dst, dst_stride); !ok) {
        return make_error(ErrorCode::DecodeError, ok.error().message);
    }
    return DecodedRegion{output_.data(), output_.size(), w, h, stride};
}

} // namespace

std::unique_ptr<ICodecBackend> create_vpx_backend(const config::Settings& settings) {
    return std::make_unique<VpxBackend>(settings);
}

} // namespace rdc::codec
