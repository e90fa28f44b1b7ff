#include <opgraph/util/log.h>

namespace opgraph {
    namespace {
        // The engine runs on a single thread (see the store's access rules), a plain static is sufficient.
        LogLevel _log_level{LogLevel::WARNING};
    }

    void set_log_level(LogLevel level) { _log_level = level; }

    LogLevel log_level() { return _log_level; }

    std::string_view to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::OFF: return "OFF";
        }
        return "UNKNOWN";
    }

    void write_log(LogLevel level, std::string_view msg) {
        fmt::print(stderr, "[opgraph] {}: {}\n", to_string(level), msg);
    }
} // namespace opgraph
