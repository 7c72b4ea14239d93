#pragma once

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <string>

namespace mangashelf {

// Leveled logger writing timestamped lines to stderr.
// Instances are passed by const reference (or shared_ptr) into the engine;
// there is no process-wide logger.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    // "error", "warn", "info", "debug" (case-sensitive).
    // Returns false and leaves level untouched on unknown names.
    static bool parse_level(const std::string& name, Level& level) {
        if (name == "error") { level = kError; return true; }
        if (name == "warn")  { level = kWarn;  return true; }
        if (name == "info")  { level = kInfo;  return true; }
        if (name == "debug") { level = kDebug; return true; }
        return false;
    }

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;

    static void log_impl(const char* tag, const char* fmt, va_list ap) {
        std::time_t now = std::time(nullptr);
        std::tm tm_utc;
        ::gmtime_r(&now, &tm_utc);
        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);

        std::fprintf(stderr, "%s [%s] ", ts, tag);
        std::vfprintf(stderr, fmt, ap);
        std::fprintf(stderr, "\n");
    }
};

} // namespace mangashelf
