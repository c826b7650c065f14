#pragma once
#include "core/log.hpp"
#include <string>
#include <functional>

namespace rdc::config {

enum class VpxCodec { VP8, VP9 };

// libvpx VPX_DL_REALTIME; larger values trade latency for quality.
inline constexpr unsigned long kVpxRealtimeDeadline = 1;

struct Settings {
    log::Level log_level = log::Level::Info;
    bool log_json = false;
    bool codec_debug = false;           // RDC_CODEC_DEBUG: lifecycle tracing at debug level

    VpxCodec vpx_codec = VpxCodec::VP8;
    unsigned long vpx_deadline_us = kVpxRealtimeDeadline;
    int vpx_threads = 1;
    int vpx_bitrate_kbps = 2500;

    std::string avcodec_decoder = "h264";
};

// Reads RDC_* variables through `getenv`. Unknown or malformed values keep
// the default and log a warning naming the variable.
using EnvLookup = std::function<const char*(const char*)>;
Settings load_from_env(const EnvLookup& getenv_fn);
Settings load_from_env();

// Process-wide settings. First call loads from the environment.
const Settings& current();
void set_current(const Settings& settings);

// Applies log_level / log_json / codec_debug to rdc::log.
void apply_logging(const Settings& settings) noexcept;

const char* vpx_codec_name(VpxCodec codec) noexcept;

} // namespace rdc::config
