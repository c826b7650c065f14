#include "codec/codec_registry.hpp"
#include "codec/colorspace.hpp"
#include "core/log.hpp"

extern "C" {
#include <vpx/vpx_codec.h>
#include <vpx/vp8cx.h>
#include <vpx/vp8dx.h>
#include <libavcodec/avcodec.h>
#include <libavcodec/version.h>
#include <libswscale/swscale.h>
}

namespace rdc::codec {

std::vector<CodecInfo> available_codecs(const config::Settings& settings) {
    const bool vp9 = settings.vpx_codec == config::VpxCodec::VP9;
    const std::string vpx_name = config::vpx_codec_name(settings.vpx_codec);

    std::vector<CodecInfo> out;
    out.push_back(CodecInfo{"enc_vpx", "vpx encoder",
                            (vp9 ? vpx_codec_vp9_cx() : vpx_codec_vp8_cx()) != nullptr, vpx_name});
    out.push_back(CodecInfo{"dec_vpx", "vpx decoder",
                            (vp9 ? vpx_codec_vp9_dx() : vpx_codec_vp8_dx()) != nullptr, vpx_name});
    out.push_back(CodecInfo{"dec_avcodec", "avcodec decoder",
                            avcodec_find_decoder_by_name(settings.avcodec_decoder.c_str()) != nullptr,
                            settings.avcodec_decoder});
    out.push_back(CodecInfo{"csc_swscale", "swscale colorspace conversion", ::swscale_version() > 0, "rgb24<->yuv420p"});

    for(const auto& c : out) {
        log::debug("codec: " + c.name + " (" + c.description + "): " + (c.available ? "found" : "missing") +
                   " [" + c.detail + "]");
    }
    return out;
}

bool has_codec(const std::string& name, const config::Settings& settings) {
    for(const auto& c : available_codecs(settings)) {
        if(c.name == name) return c.available;
    }
    return false;
}

std::map<std::string, std::string> codec_versions() {
    std::map<std::string, std::string> out;
    out["vpx"] = vpx_codec_version_str();
    out["avcodec"] = LIBAVCODEC_IDENT;
    out["swscale"] = swscale_ident();
    return out;
}

} // namespace rdc::codec
