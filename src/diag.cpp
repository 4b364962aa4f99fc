#include "diag.hpp"
#include "common.hpp"

#include <ostream>

const char* logLevelName(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

std::optional<LogLevel> parseLogLevel(const std::string& s) {
    const std::string v = toLower(trim(s));
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "off" || v == "none") return LogLevel::Off;
    return std::nullopt;
}

DiagSink::DiagSink(std::ostream& out, LogLevel minLevel)
    : out_(&out), level_(minLevel) {}

void DiagSink::log(LogLevel l, const std::string& msg) {
    if (!enabled(l)) return;
    (*out_) << "[" << logLevelName(l) << "] " << msg << "\n";
    ++lines_;
}
