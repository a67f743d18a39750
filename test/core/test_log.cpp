#include <catch2/catch_test_macros.hpp>

#include <toolmux/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace toolmux;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<CapturedMessage>& out_;
};

std::string TempLogPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path();
    return (dir / (name + "-" + std::to_string(::getpid()) + ".log")).string();
}

std::vector<std::string> ReadLines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one parseable object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Warn, "orchestrator", "Dropping endpoint 'kube'");
    sink.Write(LogLevel::Debug, "sse", "event: endpoint");

    std::istringstream lines(oss.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0]["level"] == "WARN");
    CHECK(parsed[0]["component"] == "orchestrator");
    CHECK(parsed[0]["message"] == "Dropping endpoint 'kube'");
    CHECK(parsed[0]["ts"].get<std::string>().back() == 'Z');
    CHECK(parsed[1]["level"] == "DEBUG");
}

TEST_CASE("JsonSink: escapes quotes, newlines and control bytes", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    const std::string message = "line1\nline2\t\"quoted\" back\\slash \x01";
    sink.Write(LogLevel::Info, "esc", message);

    auto parsed = nlohmann::json::parse(oss.str());
    CHECK(parsed["message"] == message);
}

TEST_CASE("JsonSink: invalid UTF-8 is replaced, not thrown", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    REQUIRE_NOTHROW(sink.Write(LogLevel::Warn, "stdio", "stderr: \xff\xfe tail"));

    auto parsed = nlohmann::json::parse(oss.str());
    const auto text = parsed["message"].get<std::string>();
    CHECK(text.rfind("stderr: ", 0) == 0);
    CHECK(text.find("tail") != std::string::npos);
    CHECK(oss.str().rfind("{\"ts\":", 0) == 0);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "stdio", "spawned 'kube-mcp'");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[stdio]") != std::string::npos);
    CHECK(output.find("spawned 'kube-mcp'") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode uses ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "sse", "stream closed");

    auto output = oss.str();
    CHECK(output.find("\033[") != std::string::npos);
    CHECK(output.find("stream closed") != std::string::npos);
    CHECK(output.back() == '\n');
}

// ===========================================================================
// FileSink / TeeSink
// ===========================================================================

TEST_CASE("FileSink: appends JSON lines", "[log]") {
    auto path = TempLogPath("toolmux-filesink");
    std::remove(path.c_str());
    {
        FileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "a", "first");
    }
    {
        FileSink sink(path);
        sink.Write(LogLevel::Error, "b", "second");
    }

    auto lines = ReadLines(path);
    REQUIRE(lines.size() == 2);
    CHECK(nlohmann::json::parse(lines[0])["message"] == "first");
    CHECK(nlohmann::json::parse(lines[1])["level"] == "ERROR");
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unopenable path is reported, writes are ignored", "[log]") {
    FileSink sink("/nonexistent-dir/toolmux/log.jsonl");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Info, "a", "dropped");
}

TEST_CASE("TeeSink: forwards to every child in order", "[log]") {
    std::vector<CapturedMessage> first;
    std::vector<CapturedMessage> second;
    std::vector<std::unique_ptr<ILogSink>> children;
    children.push_back(std::make_unique<CaptureSink>(first));
    children.push_back(std::make_unique<CaptureSink>(second));
    TeeSink tee(std::move(children));

    tee.Write(LogLevel::Warn, "notify", "queue full");

    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);
    CHECK(first[0].message == "queue full");
    CHECK(second[0].component == "notify");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below min_level", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(captured.empty());

    logger.SetLevel(LogLevel::Debug);
    logger.Debug("c", "passes");
    REQUIRE(captured.size() == 1);
    CHECK(captured[0].message == "passes");
}

TEST_CASE("Logger: concurrent writers are serialized", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug);

    constexpr int kThreads = 6;
    constexpr int kMessagesPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("reader-" + std::to_string(t), std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(captured.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("InitGlobalLogger: free functions reach the installed sink", "[log]") {
    std::vector<CapturedMessage> captured;
    InitGlobalLogger(std::make_unique<CaptureSink>(captured), LogLevel::Info);

    LogDebug("g", "hidden");
    LogInfo("g", "shown");
    LogError("g", "also shown");

    // Replace before `captured` goes out of scope.
    InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), LogLevel::Error);

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].message == "shown");
    CHECK(captured[1].level == LogLevel::Error);
}
