#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <string>


const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "OFF";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return std::nullopt;
}

StreamLogSink::StreamLogSink(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

bool StreamLogSink::enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= min_level_;
}

void StreamLogSink::write(LogLevel level, std::string_view message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << '[' << to_string(level) << "] " << message << '\n';
}
