#pragma once

#include <toolmux/core/deadline.hpp>
#include <toolmux/core/result.hpp>
#include <toolmux/mcp/i_mcp_session.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace toolmux {

// ---------------------------------------------------------------------------
// RpcChannel — JSON-RPC 2.0 request/response correlation over any transport.
//
// Outgoing messages go through the Sender, which must give up once the
// deadline passes; incoming raw messages are handed
// to Dispatch() by the transport's reader thread. Request() blocks the caller
// until the matching response arrives, the deadline passes, or the transport
// reports itself dead via FailPending().
//
// Server-initiated requests are answered here: "ping" with an empty result,
// anything else with JSON-RPC error -32601.
// ---------------------------------------------------------------------------
class RpcChannel {
public:
    using Sender = std::function<Result<void, Error>(const std::string& message,
                                                     const Deadline& deadline)>;

    // Budget for answering a server-initiated request from the reader thread.
    static constexpr std::chrono::milliseconds kReplyBudget{5000};

    RpcChannel(std::string endpoint, Sender sender);

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    [[nodiscard]] Result<nlohmann::json, Error> Request(const std::string& method,
                                                        nlohmann::json params,
                                                        const Deadline& deadline);

    [[nodiscard]] Result<void, Error> Notify(const std::string& method,
                                             nlohmann::json params,
                                             const Deadline& deadline);

    /// Feed one raw JSON-RPC message (or batch) received from the transport.
    void Dispatch(std::string_view raw);

    /// Fail every waiting request and every later one with `error`.
    void FailPending(const Error& error);

    void SetNotificationHandler(NotificationHandler handler);

    [[nodiscard]] size_t PendingCount() const;

private:
    struct Pending {
        std::string method;
        std::optional<Result<nlohmann::json, Error>> outcome;
    };

    void DispatchOne(const nlohmann::json& message);
    void HandleResponse(const nlohmann::json& message);
    void HandleServerRequest(const nlohmann::json& message);
    void HandleNotification(const nlohmann::json& message);

    std::string endpoint_;
    Sender sender_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int64_t next_id_ = 1;
    std::map<int64_t, Pending> pending_;
    std::optional<Error> failure_;
    NotificationHandler handler_;
};

} // namespace toolmux
