#include <catch2/catch_test_macros.hpp>

#include <toolmux/mcp/rpc_channel.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace toolmux;
using namespace std::chrono_literals;

namespace {

// ===========================================================================
// Helper: a channel whose sender records every outgoing message and may
// answer it inline through Dispatch, the way a transport reader would.
// ===========================================================================

class LoopbackChannel {
public:
    using Responder = std::function<void(RpcChannel&, const nlohmann::json&)>;

    explicit LoopbackChannel(Responder responder = {})
        : responder_(std::move(responder)),
          channel_("loop", [this](const std::string& message, const Deadline& deadline) {
              return Send(message, deadline);
          }) {}

    RpcChannel& channel() { return channel_; }

    std::vector<nlohmann::json> Sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    // Expiry of the deadline handed to each send, in order.
    std::vector<Deadline::Clock::time_point> SendDeadlines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return deadlines_;
    }

    void FailSends(bool fail) { fail_sends_ = fail; }

private:
    Result<void, Error> Send(const std::string& message, const Deadline& deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            deadlines_.push_back(deadline.ExpiresAt());
        }
        if (fail_sends_) {
            return Result<void, Error>::Err(
                Error{"send", "loop", std::nullopt, "broken pipe", ErrorCategory::Transport});
        }
        auto parsed = nlohmann::json::parse(message);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(parsed);
        }
        if (responder_) {
            responder_(channel_, parsed);
        }
        return Result<void, Error>::Ok();
    }

    Responder responder_;
    std::mutex mutex_;
    std::vector<nlohmann::json> sent_;
    std::vector<Deadline::Clock::time_point> deadlines_;
    std::atomic<bool> fail_sends_{false};
    RpcChannel channel_;
};

void EchoResult(RpcChannel& channel, const nlohmann::json& request) {
    if (!request.contains("id")) return;
    nlohmann::json reply = {
        {"jsonrpc", "2.0"},
        {"id", request["id"]},
        {"result", {{"echo", request["method"]}}},
    };
    channel.Dispatch(reply.dump());
}

} // anonymous namespace

// ===========================================================================
// Request / response correlation
// ===========================================================================

TEST_CASE("RpcChannel: request envelope and result", "[mcp][rpc]") {
    LoopbackChannel loop(EchoResult);
    auto result = loop.channel().Request("tools/list", nlohmann::json::object(),
                                         Deadline::AfterSeconds(5));
    REQUIRE(result.IsOk());
    CHECK(result.Value()["echo"] == "tools/list");

    auto sent = loop.Sent();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["jsonrpc"] == "2.0");
    CHECK(sent[0]["method"] == "tools/list");
    CHECK(sent[0]["id"].is_number_integer());
    CHECK(sent[0]["params"].is_object());
    CHECK(loop.channel().PendingCount() == 0);
}

TEST_CASE("RpcChannel: ids increase per request", "[mcp][rpc]") {
    LoopbackChannel loop(EchoResult);
    REQUIRE(loop.channel().Request("a", {}, Deadline::AfterSeconds(5)).IsOk());
    REQUIRE(loop.channel().Request("b", {}, Deadline::AfterSeconds(5)).IsOk());
    auto sent = loop.Sent();
    REQUIRE(sent.size() == 2);
    CHECK(sent[1]["id"].get<int64_t>() > sent[0]["id"].get<int64_t>());
}

TEST_CASE("RpcChannel: response from another thread wakes the caller", "[mcp][rpc]") {
    std::thread reader;
    LoopbackChannel loop([&reader](RpcChannel& channel, const nlohmann::json& request) {
        auto id = request["id"];
        reader = std::thread([&channel, id] {
            std::this_thread::sleep_for(30ms);
            channel.Dispatch(nlohmann::json{{"jsonrpc", "2.0"}, {"id", id},
                                            {"result", {{"ok", true}}}}.dump());
        });
    });
    auto result = loop.channel().Request("slow", {}, Deadline::AfterSeconds(5));
    reader.join();
    REQUIRE(result.IsOk());
    CHECK(result.Value()["ok"] == true);
}

TEST_CASE("RpcChannel: JSON-RPC error becomes a transport error", "[mcp][rpc]") {
    LoopbackChannel loop([](RpcChannel& channel, const nlohmann::json& request) {
        channel.Dispatch(nlohmann::json{
            {"jsonrpc", "2.0"}, {"id", request["id"]},
            {"error", {{"code", -32602}, {"message", "Unknown tool"}}}}.dump());
    });
    auto result = loop.channel().Request("tools/call", {}, Deadline::AfterSeconds(5));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(result.Error().message == "JSON-RPC error -32602: Unknown tool");
    CHECK(result.Error().operation == "tools/call");
}

TEST_CASE("RpcChannel: response without result or error is a decode error", "[mcp][rpc]") {
    LoopbackChannel loop([](RpcChannel& channel, const nlohmann::json& request) {
        channel.Dispatch(nlohmann::json{{"jsonrpc", "2.0"}, {"id", request["id"]}}.dump());
    });
    auto result = loop.channel().Request("x", {}, Deadline::AfterSeconds(5));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Decode);
}

TEST_CASE("RpcChannel: batch responses are dispatched", "[mcp][rpc]") {
    LoopbackChannel loop([](RpcChannel& channel, const nlohmann::json& request) {
        auto batch = nlohmann::json::array();
        batch.push_back(nlohmann::json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
        batch.push_back(nlohmann::json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", 1}});
        channel.Dispatch(batch.dump());
    });
    auto result = loop.channel().Request("x", {}, Deadline::AfterSeconds(5));
    REQUIRE(result.IsOk());
    CHECK(result.Value() == 1);
}

// ===========================================================================
// Deadlines and failures
// ===========================================================================

TEST_CASE("RpcChannel: unanswered request times out", "[mcp][rpc]") {
    LoopbackChannel loop;
    auto started = std::chrono::steady_clock::now();
    auto result = loop.channel().Request("initialize", {}, Deadline::After(100ms));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(std::chrono::steady_clock::now() - started >= 100ms);
    CHECK(loop.channel().PendingCount() == 0);
}

TEST_CASE("RpcChannel: cancelling the deadline ends the wait", "[mcp][rpc]") {
    LoopbackChannel loop;
    auto deadline = Deadline::AfterSeconds(60);
    std::thread canceller([deadline] {
        std::this_thread::sleep_for(30ms);
        deadline.Cancel();
    });
    auto result = loop.channel().Request("initialize", {}, deadline);
    canceller.join();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(result.Error().message.find("cancelled") != std::string::npos);
}

TEST_CASE("RpcChannel: the caller's deadline is handed to the sender", "[mcp][rpc]") {
    LoopbackChannel loop(EchoResult);
    auto deadline = Deadline::AfterSeconds(7);
    REQUIRE(loop.channel().Request("tools/call", {}, deadline).IsOk());
    REQUIRE(loop.channel().Notify("notifications/initialized", {}, deadline).IsOk());

    auto deadlines = loop.SendDeadlines();
    REQUIRE(deadlines.size() == 2);
    CHECK(deadlines[0] == deadline.ExpiresAt());
    CHECK(deadlines[1] == deadline.ExpiresAt());
}

TEST_CASE("RpcChannel: expired deadline fails before sending", "[mcp][rpc]") {
    LoopbackChannel loop(EchoResult);
    auto deadline = Deadline::AfterSeconds(60);
    deadline.Cancel();

    auto result = loop.channel().Request("tools/call", {}, deadline);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(loop.Sent().empty());
    CHECK(loop.channel().PendingCount() == 0);
}

TEST_CASE("RpcChannel: send failure is returned without waiting", "[mcp][rpc]") {
    LoopbackChannel loop;
    loop.FailSends(true);
    auto result = loop.channel().Request("x", {}, Deadline::AfterSeconds(60));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "broken pipe");
    CHECK(loop.channel().PendingCount() == 0);
}

TEST_CASE("RpcChannel: FailPending fails waiting and later requests", "[mcp][rpc]") {
    LoopbackChannel loop;
    std::thread killer([&loop] {
        std::this_thread::sleep_for(30ms);
        loop.channel().FailPending(Error{"stream", "loop", std::nullopt,
                                         "stream closed", ErrorCategory::Transport});
    });
    auto waiting = loop.channel().Request("tools/list", {}, Deadline::AfterSeconds(60));
    killer.join();
    REQUIRE(waiting.IsErr());
    CHECK(waiting.Error().message == "stream closed");
    CHECK(waiting.Error().operation == "tools/list");

    auto later = loop.channel().Request("tools/call", {}, Deadline::AfterSeconds(60));
    REQUIRE(later.IsErr());
    CHECK(later.Error().operation == "tools/call");
    CHECK(loop.channel()
              .Notify("notifications/initialized", {}, Deadline::AfterSeconds(1))
              .IsErr());
}

// ===========================================================================
// Incoming notifications and server requests
// ===========================================================================

TEST_CASE("RpcChannel: notifications reach the handler", "[mcp][rpc]") {
    LoopbackChannel loop;
    std::vector<Notification> seen;
    loop.channel().SetNotificationHandler([&](const Notification& n) { seen.push_back(n); });

    loop.channel().Dispatch(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"name":"log","output":{"line":"hi"}}})");
    loop.channel().Dispatch(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");

    REQUIRE(seen.size() == 2);
    CHECK(seen[0].method == "notifications/message");
    CHECK(seen[0].params["name"] == "log");
    CHECK(seen[1].params.empty());
}

TEST_CASE("RpcChannel: server ping is answered, other requests rejected", "[mcp][rpc]") {
    LoopbackChannel loop;
    loop.channel().Dispatch(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    loop.channel().Dispatch(R"({"jsonrpc":"2.0","id":9,"method":"sampling/createMessage"})");

    auto sent = loop.Sent();
    REQUIRE(sent.size() == 2);
    CHECK(sent[0]["id"] == "srv-1");
    CHECK(sent[0]["result"].is_object());
    CHECK(sent[1]["id"] == 9);
    CHECK(sent[1]["error"]["code"] == -32601);

    // Replies from the reader thread carry their own short budget.
    auto latest = Deadline::Clock::now() + RpcChannel::kReplyBudget;
    for (const auto& expiry : loop.SendDeadlines()) {
        CHECK(expiry <= latest);
        CHECK(expiry > Deadline::Clock::now());
    }
}

TEST_CASE("RpcChannel: garbage and stray responses are ignored", "[mcp][rpc]") {
    LoopbackChannel loop;
    loop.channel().Dispatch("not json");
    loop.channel().Dispatch("[1, 2]");
    loop.channel().Dispatch(R"({"jsonrpc":"2.0","id":4242,"result":{}})");
    loop.channel().Dispatch(R"({"jsonrpc":"2.0"})");
    CHECK(loop.Sent().empty());
    CHECK(loop.channel().PendingCount() == 0);
}
