#include "core/config.hpp"
#include <cstdlib>
#include <mutex>
#include <optional>

namespace rdc::config {

namespace {

std::mutex g_settings_mutex;
std::optional<Settings> g_settings;

bool parse_flag(const std::string& v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<long> parse_long(const std::string& v) {
    if(v.empty()) return std::nullopt;
    char* end = nullptr;
    long out = std::strtol(v.c_str(), &end, 10);
    if(end == nullptr || *end != '\0') return std::nullopt;
    return out;
}

void warn_invalid(const char* var, const std::string& value) {
    log::warn(std::string("config: ignoring invalid ") + var + "='" + value + "'");
}

} // namespace

const char* vpx_codec_name(VpxCodec codec) noexcept {
    return codec == VpxCodec::VP9 ? "vp9" : "vp8";
}

Settings load_from_env(const EnvLookup& getenv_fn) {
    Settings s;
    auto get = [&](const char* name) -> std::optional<std::string> {
        const char* raw = getenv_fn(name);
        if(raw == nullptr) return std::nullopt;
        return std::string(raw);
    };

    if(auto v = get("RDC_LOG_LEVEL")) {
        if(auto lvl = log::parse_level(*v)) s.log_level = *lvl;
        else warn_invalid("RDC_LOG_LEVEL", *v);
    }
    if(auto v = get("RDC_LOG_JSON")) s.log_json = parse_flag(*v);
    if(auto v = get("RDC_CODEC_DEBUG")) s.codec_debug = parse_flag(*v);

    if(auto v = get("RDC_VPX_CODEC")) {
        if(*v == "vp8") s.vpx_codec = VpxCodec::VP8;
        else if(*v == "vp9") s.vpx_codec = VpxCodec::VP9;
        else warn_invalid("RDC_VPX_CODEC", *v);
    }
    if(auto v = get("RDC_VPX_DEADLINE_US")) {
        auto n = parse_long(*v);
        if(n && *n >= 0) s.vpx_deadline_us = static_cast<unsigned long>(*n);
        else warn_invalid("RDC_VPX_DEADLINE_US", *v);
    }
    if(auto v = get("RDC_VPX_THREADS")) {
        auto n = parse_long(*v);
        if(n && *n >= 1 && *n <= 64) s.vpx_threads = static_cast<int>(*n);
        else warn_invalid("RDC_VPX_THREADS", *v);
    }
    if(auto v = get("RDC_VPX_BITRATE_KBPS")) {
        auto n = parse_long(*v);
        if(n && *n > 0) s.vpx_bitrate_kbps = static_cast<int>(*n);
        else warn_invalid("RDC_VPX_BITRATE_KBPS", *v);
    }
    if(auto v = get("RDC_AVCODEC_DECODER")) {
        if(!v->empty()) s.avcodec_decoder = *v;
        else warn_invalid("RDC_AVCODEC_DECODER", *v);
    }
    return s;
}

Settings load_from_env() {
    return load_from_env([](const char* name) { return std::getenv(name); });
}

const Settings& current() {
    std::scoped_lock lock(g_settings_mutex);
    if(!g_settings) g_settings = load_from_env();
    return *g_settings;
}

void set_current(const Settings& settings) {
    std::scoped_lock lock(g_settings_mutex);
    g_settings = settings;
}

void apply_logging(const Settings& settings) noexcept {
    log::Level lvl = settings.log_level;
    if(settings.codec_debug && static_cast<int>(lvl) > static_cast<int>(log::Level::Debug)) {
        lvl = log::Level::Debug;
    }
    log::set_level(lvl);
    log::set_json_mode(settings.log_json);
}

} // namespace rdc::config
