#ifndef OPGRAPH_UTIL_LOG_H
#define OPGRAPH_UTIL_LOG_H

#include <opgraph/opgraph_base.h>

#include <cstdio>

namespace opgraph {

    enum class LogLevel : char8_t {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3,
        OFF = 4
    };

    /**
     * Process wide threshold, messages below it are discarded. Defaults to WARNING.
     */
    OPGRAPH_EXPORT void set_log_level(LogLevel level);

    [[nodiscard]] OPGRAPH_EXPORT LogLevel log_level();

    [[nodiscard]] OPGRAPH_EXPORT std::string_view to_string(LogLevel level);

    [[nodiscard]] inline bool is_log_enabled(LogLevel level) {
        return level != LogLevel::OFF && static_cast<char8_t>(level) >= static_cast<char8_t>(log_level());
    }

    OPGRAPH_EXPORT void write_log(LogLevel level, std::string_view msg);

    template<typename... Ts>
    void log_message(LogLevel level, fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        if (!is_log_enabled(level)) { return; }
        write_log(level, fmt::format(fmt_str, std::forward<Ts>(xs)...));
    }

    template<typename... Ts>
    void log_debug(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log_message(LogLevel::DEBUG, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_info(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log_message(LogLevel::INFO, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_warning(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log_message(LogLevel::WARNING, fmt_str, std::forward<Ts>(xs)...);
    }

    template<typename... Ts>
    void log_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        log_message(LogLevel::ERROR, fmt_str, std::forward<Ts>(xs)...);
    }

} // namespace opgraph

#endif // OPGRAPH_UTIL_LOG_H
