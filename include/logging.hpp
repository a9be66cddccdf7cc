#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace mender {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

// Accepts the level names in any case ("debug", "WARN", ...).
bool parse_log_level(const char* name, LogLevel& out);

// Process-wide logger. Lines go to stderr unless a sink is set; the minimum
// level starts from MENDER_LOG_LEVEL when that names a valid level.
class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl != LogLevel::OFF && lvl >= level_.load(); }
    void set_sink(std::FILE* sink);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger();
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::FILE* sink_ = nullptr;
    static const char* level_str(LogLevel lvl);
};

} // namespace mender
