#include <strata/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace strata::core {

namespace {

std::atomic<LogLevel> s_log_level{LogLevel::Info};
std::vector<ILogSink*> s_log_sinks;
std::mutex s_sink_mutex;

// "LayerManager: added ..." -> "LayerManager"; messages without an
// identifier prefix fall under "strata"
std::string_view message_category(std::string_view message) {
    size_t colon = message.find(':');
    if (colon == 0 || colon == std::string_view::npos) return "strata";

    std::string_view prefix = message.substr(0, colon);
    bool identifier = std::all_of(prefix.begin(), prefix.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
    return identifier ? prefix : std::string_view("strata");
}

} // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load(std::memory_order_relaxed)) return;
    if (!message) message = "";

#ifdef _WIN32
    OutputDebugStringA(message);
    OutputDebugStringA("\n");
#endif
    std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
    std::fprintf(stream, "[%s] %s\n", log_level_name(level), message);

    std::string category(message_category(message));
    std::string text(message);

    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        sink->log(level, category, text);
    }
}

void set_log_level(LogLevel level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() {
    return s_log_level.load(std::memory_order_relaxed);
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (std::find(s_log_sinks.begin(), s_log_sinks.end(), sink) == s_log_sinks.end()) {
        s_log_sinks.push_back(sink);
    }
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink), s_log_sinks.end());
}

} // namespace strata::core
