#pragma once
#include <string>
#include <functional>
#include <optional>

namespace rdc::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replaces the default spdlog output. Pass an empty function to restore it.
// A custom sink receives every message regardless of the configured level.
void set_sink(SinkFn sink) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

// Minimum level forwarded to spdlog (default Info).
void set_level(Level lvl) noexcept;
Level level() noexcept;

// JSON-lines output on stderr instead of spdlog's pattern.
void set_json_mode(bool enabled) noexcept;
bool json_mode() noexcept;

const char* level_name(Level lvl) noexcept;
// Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical".
std::optional<Level> parse_level(const std::string& name) noexcept;

void trace(const std::string& msg) noexcept;
void debug(const std::string& msg) noexcept;
void info(const std::string& msg) noexcept;
void warn(const std::string& msg) noexcept;
void error(const std::string& msg) noexcept;
void critical(const std::string& msg) noexcept;

} // namespace rdc::log
