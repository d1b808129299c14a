#include <catch2/catch_test_macros.hpp>
#include <strata/core/log.hpp>
#include <string>
#include <vector>

using namespace strata::core;

namespace {

struct CaptureSink : ILogSink {
    std::vector<std::pair<LogLevel, std::string>> entries;

    void log(LogLevel level, const std::string&, const std::string& message) override {
        entries.emplace_back(level, message);
    }
};

} // anonymous namespace

TEST_CASE("Log sinks receive messages", "[core][log]") {
    CaptureSink sink;
    add_log_sink(&sink);
    LogLevel previous = get_log_level();
    set_log_level(LogLevel::Trace);

    SECTION("Plain message") {
        log(LogLevel::Info, "hello");
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].first == LogLevel::Info);
        REQUIRE(sink.entries[0].second == "hello");
    }

    SECTION("Formatted message") {
        log(LogLevel::Warn, "layer {} at z={}", "overlay", 3);
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].second == "layer overlay at z=3");
    }

    SECTION("Messages below the level are filtered") {
        set_log_level(LogLevel::Error);
        log(LogLevel::Info, "dropped");
        log(LogLevel::Debug, "dropped {}", 1);
        log(LogLevel::Error, "kept");
        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].second == "kept");
    }

    set_log_level(previous);
    remove_log_sink(&sink);
}

TEST_CASE("Sinks receive the component prefix as category", "[core][log]") {
    struct CategorySink : ILogSink {
        std::vector<std::string> categories;
        void log(LogLevel, const std::string& category, const std::string&) override {
            categories.push_back(category);
        }
    } sink;

    add_log_sink(&sink);
    add_log_sink(&sink);    // Registered once

    log(LogLevel::Fatal, "LayerManager: added ui layer 0 at z=1");
    log(LogLevel::Fatal, "no prefix here");
    log(LogLevel::Fatal, "two words: not a component");

    remove_log_sink(&sink);

    REQUIRE(sink.categories.size() == 3);
    REQUIRE(sink.categories[0] == "LayerManager");
    REQUIRE(sink.categories[1] == "strata");
    REQUIRE(sink.categories[2] == "strata");
}

TEST_CASE("Removed sinks stop receiving", "[core][log]") {
    CaptureSink sink;
    add_log_sink(&sink);
    remove_log_sink(&sink);

    log(LogLevel::Fatal, "nobody listens");
    REQUIRE(sink.entries.empty());
}

TEST_CASE("Log level names", "[core][log]") {
    REQUIRE(std::string(log_level_name(LogLevel::Trace)) == "trace");
    REQUIRE(std::string(log_level_name(LogLevel::Warn)) == "warn");
    REQUIRE(std::string(log_level_name(LogLevel::Fatal)) == "fatal");
}
