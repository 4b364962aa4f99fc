#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off,
};

const char* logLevelName(LogLevel l);
std::optional<LogLevel> parseLogLevel(const std::string& s);

// Line logger handed to the parts that want to report what they do.
//
// There is no global instance: whoever owns the world creates one (usually
// over std::cerr) and passes a pointer down. A null sink means "quiet".
// Output format: "[LEVEL] message\n".
class DiagSink {
public:
    explicit DiagSink(std::ostream& out, LogLevel minLevel = LogLevel::Info);

    void setLevel(LogLevel l) { level_ = l; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel l) const { return l != LogLevel::Off && l >= level_; }

    void log(LogLevel l, const std::string& msg);

    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

    // Number of lines actually written.
    uint64_t linesWritten() const { return lines_; }

private:
    std::ostream* out_;
    LogLevel level_;
    uint64_t lines_ = 0;
};

// Null-tolerant helpers so call sites don't have to check the pointer.
inline void logDebug(DiagSink* d, const std::string& msg) { if (d) d->debug(msg); }
inline void logInfo(DiagSink* d, const std::string& msg) { if (d) d->info(msg); }
inline void logWarn(DiagSink* d, const std::string& msg) { if (d) d->warn(msg); }
inline void logError(DiagSink* d, const std::string& msg) { if (d) d->error(msg); }
