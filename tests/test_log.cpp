#include <catch2/catch.hpp>
#include "core/log.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct SinkCapture {
    std::vector<std::pair<rdc::log::Level, std::string>> lines;
    SinkCapture() {
        rdc::log::set_sink([this](rdc::log::Level lvl, const std::string& msg) { lines.emplace_back(lvl, msg); });
    }
    ~SinkCapture() { rdc::log::set_sink({}); }
};

} // namespace

TEST_CASE("log sink receives messages with their level") {
    SinkCapture cap;
    rdc::log::info("hello");
    rdc::log::error("broken");
    REQUIRE(cap.lines.size() == 2);
    REQUIRE(cap.lines[0].first == rdc::log::Level::Info);
    REQUIRE(cap.lines[0].second == "hello");
    REQUIRE(cap.lines[1].first == rdc::log::Level::Error);
}

TEST_CASE("log level names parse back") {
    using rdc::log::Level;
    for(Level l : {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Critical}) {
        auto parsed = rdc::log::parse_level(rdc::log::level_name(l));
        REQUIRE(parsed);
        REQUIRE(*parsed == l);
    }
    REQUIRE(rdc::log::parse_level("warning") == Level::Warn);
    REQUIRE_FALSE(rdc::log::parse_level("loud"));
}

TEST_CASE("log level and json mode are settable") {
    const auto prev = rdc::log::level();
    rdc::log::set_level(rdc::log::Level::Warn);
    REQUIRE(rdc::log::level() == rdc::log::Level::Warn);
    rdc::log::set_level(prev);

    rdc::log::set_json_mode(true);
    REQUIRE(rdc::log::json_mode());
    rdc::log::set_json_mode(false);
    REQUIRE_FALSE(rdc::log::json_mode());
}

TEST_CASE("json mode writes one timestamped line per message") {
    std::ostringstream captured;
    auto* prev_buf = std::clog.rdbuf(captured.rdbuf());
    const auto prev_level = rdc::log::level();
    rdc::log::set_level(rdc::log::Level::Info);
    rdc::log::set_json_mode(true);
    rdc::log::warn("say \"hi\"");
    rdc::log::set_json_mode(false);
    rdc::log::set_level(prev_level);
    std::clog.rdbuf(prev_buf);

    const std::string line = captured.str();
    REQUIRE(line.rfind("{\"ts\":\"", 0) == 0);
    REQUIRE(line.find("\"level\":\"warn\"") != std::string::npos);
    REQUIRE(line.find("\"msg\":\"say \\\"hi\\\"\"}") != std::string::npos);
    REQUIRE(line.back() == '\n');
}
