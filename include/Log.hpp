#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>


enum class LogLevel : int { Trace, Debug, Info, Warning, Error, Off };

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);

// Observability only: nothing in the engine reads back what it logged.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual bool enabled(LogLevel level) const = 0;
    virtual void write(LogLevel level, std::string_view message) = 0;
};

class NullLogSink final : public ILogSink {
public:
    bool enabled(LogLevel) const override { return false; }
    void write(LogLevel, std::string_view) override {}
};

// Writes "[LEVEL] message" lines; safe to share between replay workers.
class StreamLogSink final : public ILogSink {
public:
    StreamLogSink(std::ostream& out, LogLevel min_level);

    bool enabled(LogLevel level) const override;
    void write(LogLevel level, std::string_view message) override;

private:
    std::ostream& out_;
    const LogLevel min_level_;
    std::mutex mutex_;
};
