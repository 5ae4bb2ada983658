#include <opbridge/util/log.h>

#include <fmt/format.h>

#include <cstdio>

namespace opbridge {

    namespace {
        LogLevel &active_level() {
            static LogLevel level{LogLevel::Info};
            return level;
        }

        LogSink &active_sink() {
            static LogSink sink;
            return sink;
        }
    }  // namespace

    void set_log_level(LogLevel level) { active_level() = level; }

    LogLevel log_level() { return active_level(); }

    void set_log_sink(LogSink sink) { active_sink() = std::move(sink); }

    void reset_log_sink() { active_sink() = nullptr; }

    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warning: return "warning";
            case LogLevel::Error: return "error";
            case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    bool log_enabled(LogLevel level) {
        return level != LogLevel::Off && static_cast<uint8_t>(level) >= static_cast<uint8_t>(active_level());
    }

    void log_message(LogLevel level, std::string_view message) {
        if (!log_enabled(level)) return;
        if (auto &sink = active_sink(); sink) {
            sink(level, message);
            return;
        }
        fmt::print(stderr, "[opbridge] {}: {}\n", to_string(level), message);
    }

}  // namespace opbridge
