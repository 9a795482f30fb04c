#include <homelib/core/log.hpp>

#include <homelib/core/ansi.hpp>
#include <homelib/core/types.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace homelib {

namespace {

// Wall-clock time for the compact colour format.
std::string LocalClock() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

Result<LogLevel, std::string> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Result<LogLevel, std::string>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel, std::string>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") {
        return Result<LogLevel, std::string>::Ok(LogLevel::Warn);
    }
    if (lower == "error") return Result<LogLevel, std::string>::Ok(LogLevel::Error);
    return Result<LogLevel, std::string>::Err(
        "Unknown log level '" + std::string(text) + "'");
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    if (!use_color_) {
        out_ << CurrentTimestamp() << " [" << LogLevelName(level) << "] [" << component
             << "] " << message << '\n';
        return;
    }

    const char* color = LevelColor(level);
    std::string tag = LogLevelName(level);
    tag.resize(5, ' ');
    out_ << ansi::kDim << LocalClock() << ansi::kReset << ' '
         << color << tag << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {{"ts", CurrentTimestamp()},
                           {"level", LogLevelName(level)},
                           {"component", std::string(component)},
                           {"message", std::string(message)}};
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::app), lines_(file_) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    lines_.Write(level, component, message);
    file_.flush();
}

void MultiSink::Add(std::unique_ptr<LogSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void MultiSink::Write(LogLevel level, std::string_view component,
                      std::string_view message) {
    for (auto& sink : sinks_) sink->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<LogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Write(LogLevel level, std::string_view component,
                   std::string_view message) {
    if (!Enabled(level)) return;
    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

class DiscardSink : public LogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<DiscardSink>(),
                                                LogLevel::Error);
    return slot;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<LogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Error, component, message);
}

} // namespace homelib
