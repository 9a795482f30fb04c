#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <homelib/core/result.hpp>

namespace homelib {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

[[nodiscard]] const char* LogLevelName(LogLevel level);

// "debug", "info", "warn" or "warning", "error"; case does not matter.
[[nodiscard]] Result<LogLevel, std::string> ParseLogLevel(std::string_view text);

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// ---------------------------------------------------------------------------
// ConsoleSink: one readable line per message.
//
//   plain:  2026-10-19T08:15:02.417Z [WARN] [config] Cannot open log file
//   colour: 08:15:02 WARN  [config] Cannot open log file
// ---------------------------------------------------------------------------
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// {"ts":..,"level":..,"component":..,"message":..} per line.
class JsonSink : public LogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ostream& out_;
};

// JSON lines appended to --log-file. A path that cannot be opened leaves
// the sink closed and silent.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::ofstream file_;
    JsonSink lines_;
};

class MultiSink : public LogSink {
public:
    void Add(std::unique_ptr<LogSink> sink);
    [[nodiscard]] std::size_t Size() const { return sinks_.size(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// Filters by level and serialises writes to the sink.
class Logger {
public:
    Logger(std::unique_ptr<LogSink> sink, LogLevel min_level);

    [[nodiscard]] bool Enabled(LogLevel level) const noexcept {
        return level >= min_level_.load(std::memory_order_relaxed);
    }

    void Write(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<LogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. main() installs it once the configuration is known;
// until then messages go nowhere.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<LogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace homelib
