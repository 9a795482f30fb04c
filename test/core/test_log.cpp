#include <catch2/catch_test_macros.hpp>

#include <homelib/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace homelib;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>* into = nullptr)
        : into_(into ? into : &messages) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        into_->push_back({level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;

private:
    std::vector<CapturedMessage>* into_;
};

std::string TempLogPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// ===========================================================================
// LogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("Warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("warn").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);

    auto bad = ParseLogLevel("trace");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error() == "Unknown log level 'trace'");
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one JSON line per message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "lifecycle", "Deleted book \"Dune\"");
    sink.Write(LogLevel::Warn, "store", "busy");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"component\":\"lifecycle\"") != std::string::npos);
    CHECK(output.find("Deleted book \\\"Dune\\\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "io", "line1\nline2\ttab back\\slash");

    auto output = oss.str();
    CHECK(output.find("line1\\nline2\\ttab") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
}

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "store", "opened library.db");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[store]") != std::string::npos);
    CHECK(output.find("opened library.db") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ConsoleSink: color mode tags levels", "[log]") {
    std::ostringstream warn_oss, error_oss;
    ConsoleSink warn_sink(true, warn_oss);
    ConsoleSink error_sink(true, error_oss);

    warn_sink.Write(LogLevel::Warn, "config", "Cannot open log file");
    error_sink.Write(LogLevel::Error, "lifecycle", "DeleteBook failed");

    CHECK(warn_oss.str().find("\033[33m") != std::string::npos);
    // Error level tag and message text are both red.
    auto out = error_oss.str();
    auto first = out.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(out.find("\033[1;31m", first + 1) != std::string::npos);
}

// ===========================================================================
// FileSink / MultiSink
// ===========================================================================

TEST_CASE("FileSink: appends JSON lines to the file", "[log][file]") {
    auto path = TempLogPath("homelib_test_filesink.log");
    std::remove(path.c_str());
    {
        FileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "lifecycle", "first");
    }
    {
        FileSink sink(path);
        sink.Write(LogLevel::Debug, "lifecycle", "second");
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].find("\"message\":\"first\"") != std::string::npos);
    CHECK(lines[1].find("\"level\":\"DEBUG\"") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unopenable path drops writes", "[log][file]") {
    FileSink sink("/nonexistent-dir/homelib/test.log");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "x", "dropped");
}

TEST_CASE("MultiSink: every message reaches each sink", "[log]") {
    std::vector<CapturedMessage> console;
    std::vector<CapturedMessage> file;
    MultiSink sinks;
    sinks.Add(std::make_unique<CaptureSink>(&console));
    sinks.Add(nullptr);
    sinks.Add(std::make_unique<CaptureSink>(&file));
    CHECK(sinks.Size() == 2);

    sinks.Write(LogLevel::Warn, "mcp", "unknown method");

    REQUIRE(console.size() == 1);
    REQUIRE(file.size() == 1);
    CHECK(console[0].component == "mcp");
    CHECK(file[0].message == "unknown method");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: drops messages below the minimum level", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(&captured), LogLevel::Warn);

    logger.Write(LogLevel::Debug, "engine", "impact for b1");
    logger.Write(LogLevel::Info, "lifecycle", "Deleted book \"Dune\"");
    logger.Write(LogLevel::Warn, "config", "Cannot open log file");
    logger.Write(LogLevel::Error, "store", "database is locked");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[1].component == "store");
    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    CHECK(logger.Enabled(LogLevel::Error));
}

TEST_CASE("Logger: concurrent writers lose nothing", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(&captured), LogLevel::Debug);

    constexpr int kWriters = 6;
    constexpr int kPerWriter = 150;

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&logger, w]() {
            for (int i = 0; i < kPerWriter; ++i) {
                logger.Write(LogLevel::Info, "writer-" + std::to_string(w),
                             "entry " + std::to_string(i));
            }
        });
    }
    for (auto& writer : writers) writer.join();

    CHECK(captured.size() == static_cast<size_t>(kWriters * kPerWriter));
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: free functions reach the installed sink", "[log][global]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("lifecycle", "filtered");
    LogInfo("lifecycle", "Deleted author \"Jane\"");
    LogWarn("config", "Cannot open log file");
    LogError("store", "disk full");

    REQUIRE(sink_ptr->messages.size() == 3);
    CHECK(sink_ptr->messages[0].component == "lifecycle");
    CHECK(sink_ptr->messages[2].level == LogLevel::Error);

    // Leave a quiet logger behind for the other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
