#pragma once
#include "codec/codec_types.hpp"
#include "core/config.hpp"
#include <map>
#include <string>
#include <vector>

namespace rdc::codec {

struct CodecInfo {
    std::string name;        // "enc_vpx", "dec_vpx", "dec_avcodec", "csc_swscale"
    std::string description;
    bool available = false;  // library present and the configured codec usable
    std::string detail;      // e.g. "vp8" or the avcodec decoder name
};

// Probes each linked library once per call; cheap enough for startup or CLI use.
std::vector<CodecInfo> available_codecs(const config::Settings& settings = config::current());

bool has_codec(const std::string& name, const config::Settings& settings = config::current());

// "vpx", "avcodec", "swscale" -> version strings.
std::map<std::string, std::string> codec_versions();

} // namespace rdc::codec
