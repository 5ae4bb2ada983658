#ifndef OPBRIDGE_UTIL_LOG_H
#define OPBRIDGE_UTIL_LOG_H

#include <opbridge/opbridge_export.h>

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

namespace opbridge {

    enum class LogLevel : uint8_t {
        Debug,
        Info,
        Warning,
        Error,
        Off,
    };

    /**
     * Receives every message at or above the active level. When no sink is installed
     * messages are printed to stderr as "[opbridge] <level>: <message>".
     */
    using LogSink = std::function<void(LogLevel, std::string_view)>;

    OPBRIDGE_EXPORT void set_log_level(LogLevel level);
    [[nodiscard]] OPBRIDGE_EXPORT LogLevel log_level();

    OPBRIDGE_EXPORT void set_log_sink(LogSink sink);
    OPBRIDGE_EXPORT void reset_log_sink();

    [[nodiscard]] OPBRIDGE_EXPORT std::string_view to_string(LogLevel level);
    [[nodiscard]] OPBRIDGE_EXPORT bool log_enabled(LogLevel level);

    OPBRIDGE_EXPORT void log_message(LogLevel level, std::string_view message);

    template<typename... Ts>
    void log(LogLevel level, fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        if (!log_enabled(level)) return;
        log_message(level, fmt::format(fmt_str, std::forward<Ts>(xs)...));
    }

    template<typename... Ts>
    void log_debug(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log(LogLevel::Debug, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_info(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log(LogLevel::Info, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_warning(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log(LogLevel::Warning, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log(LogLevel::Error, fmt_str, std::forward<Ts>(xs)...);
    }

} // namespace opbridge

#endif // OPBRIDGE_UTIL_LOG_H
