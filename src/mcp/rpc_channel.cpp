#include <toolmux/mcp/rpc_channel.hpp>

#include <toolmux/core/log.hpp>

namespace toolmux {

namespace {

constexpr int kMethodNotFound = -32601;

nlohmann::json Envelope() {
    return nlohmann::json{{"jsonrpc", "2.0"}};
}

std::string DescribeRpcError(const nlohmann::json& error) {
    std::string message = "JSON-RPC error";
    if (error.is_object()) {
        if (error.contains("code") && error["code"].is_number_integer()) {
            message += " " + std::to_string(error["code"].get<int64_t>());
        }
        if (error.contains("message") && error["message"].is_string()) {
            message += ": " + error["message"].get<std::string>();
        }
    }
    return message;
}

} // anonymous namespace

RpcChannel::RpcChannel(std::string endpoint, Sender sender)
    : endpoint_(std::move(endpoint)), sender_(std::move(sender)) {}

// ---------------------------------------------------------------------------
// Outgoing
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> RpcChannel::Request(const std::string& method,
                                                  nlohmann::json params,
                                                  const Deadline& deadline) {
    int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_.has_value()) {
            auto error = *failure_;
            error.operation = method;
            return Result<nlohmann::json, Error>::Err(std::move(error));
        }
        if (deadline.Expired()) {
            return Result<nlohmann::json, Error>::Err(
                Error{method, endpoint_, std::nullopt,
                      deadline.IsCancelled() ? "cancelled before sending"
                                             : "deadline passed before sending",
                      ErrorCategory::Timeout});
        }
        id = next_id_++;
        pending_[id].method = method;
    }

    auto message = Envelope();
    message["id"] = id;
    message["method"] = method;
    message["params"] = std::move(params);

    LogDebug("rpc", endpoint_ + " -> " + method + " #" + std::to_string(id));
    auto sent = sender_(message.dump(), deadline);
    if (sent.IsErr()) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        return Result<nlohmann::json, Error>::Err(std::move(sent).Error());
    }

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        auto it = pending_.find(id);
        if (it->second.outcome.has_value()) {
            auto outcome = std::move(*it->second.outcome);
            pending_.erase(it);
            return outcome;
        }
        if (deadline.Expired()) {
            pending_.erase(it);
            const auto* why = deadline.IsCancelled()
                ? "cancelled while waiting for a response"
                : "timed out waiting for a response";
            return Result<nlohmann::json, Error>::Err(
                Error{method, endpoint_, std::nullopt, why, ErrorCategory::Timeout});
        }
        cv_.wait_for(lock, deadline.NextSlice());
    }
}

Result<void, Error> RpcChannel::Notify(const std::string& method,
                                       nlohmann::json params,
                                       const Deadline& deadline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_.has_value()) {
            auto error = *failure_;
            error.operation = method;
            return Result<void, Error>::Err(std::move(error));
        }
    }
    auto message = Envelope();
    message["method"] = method;
    if (!params.is_null()) {
        message["params"] = std::move(params);
    }
    return sender_(message.dump(), deadline);
}

// ---------------------------------------------------------------------------
// Incoming
// ---------------------------------------------------------------------------
void RpcChannel::Dispatch(std::string_view raw) {
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        LogWarn("rpc", endpoint_ + ": dropping malformed message: " +
                           std::string(raw.substr(0, 200)));
        return;
    }
    if (parsed.is_array()) {
        for (const auto& message : parsed) {
            DispatchOne(message);
        }
        return;
    }
    DispatchOne(parsed);
}

void RpcChannel::DispatchOne(const nlohmann::json& message) {
    if (!message.is_object()) {
        LogWarn("rpc", endpoint_ + ": dropping non-object message");
        return;
    }
    const bool has_method = message.contains("method") && message["method"].is_string();
    const bool has_id = message.contains("id") && !message["id"].is_null();

    if (has_method && has_id) {
        HandleServerRequest(message);
    } else if (has_method) {
        HandleNotification(message);
    } else if (has_id) {
        HandleResponse(message);
    } else {
        LogWarn("rpc", endpoint_ + ": dropping message without id or method");
    }
}

void RpcChannel::HandleResponse(const nlohmann::json& message) {
    if (!message["id"].is_number_integer()) {
        LogWarn("rpc", endpoint_ + ": response with unexpected id " +
                           message["id"].dump());
        return;
    }
    auto id = message["id"].get<int64_t>();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end() || it->second.outcome.has_value()) {
        LogDebug("rpc", endpoint_ + ": late or unknown response #" + std::to_string(id));
        return;
    }
    const auto& method = it->second.method;
    if (message.contains("error")) {
        it->second.outcome = Result<nlohmann::json, Error>::Err(
            Error{method, endpoint_, std::nullopt, DescribeRpcError(message["error"]),
                  ErrorCategory::Transport});
    } else if (message.contains("result")) {
        it->second.outcome = Result<nlohmann::json, Error>::Ok(message["result"]);
    } else {
        it->second.outcome = Result<nlohmann::json, Error>::Err(
            Error{method, endpoint_, std::nullopt,
                  "response carries neither result nor error", ErrorCategory::Decode});
    }
    LogDebug("rpc", endpoint_ + " <- " + method + " #" + std::to_string(id));
    cv_.notify_all();
}

void RpcChannel::HandleServerRequest(const nlohmann::json& message) {
    auto method = message["method"].get<std::string>();
    auto reply = Envelope();
    reply["id"] = message["id"];
    if (method == "ping") {
        reply["result"] = nlohmann::json::object();
    } else {
        LogDebug("rpc", endpoint_ + ": rejecting server request " + method);
        reply["error"] = nlohmann::json{
            {"code", kMethodNotFound},
            {"message", "Method not found: " + method},
        };
    }
    auto sent = sender_(reply.dump(), Deadline::After(kReplyBudget));
    if (sent.IsErr()) {
        LogWarn("rpc", endpoint_ + ": failed to answer " + method + ": " +
                           sent.Error().message);
    }
}

void RpcChannel::HandleNotification(const nlohmann::json& message) {
    Notification notification;
    notification.method = message["method"].get<std::string>();
    if (message.contains("params")) {
        notification.params = message["params"];
    }

    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(notification);
    } else {
        LogDebug("rpc", endpoint_ + ": unhandled notification " + notification.method);
    }
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------
void RpcChannel::FailPending(const Error& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_.has_value()) {
        failure_ = error;
    }
    for (auto& [id, pending] : pending_) {
        if (!pending.outcome.has_value()) {
            auto failed = error;
            failed.operation = pending.method;
            pending.outcome = Result<nlohmann::json, Error>::Err(std::move(failed));
        }
    }
    cv_.notify_all();
}

void RpcChannel::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

size_t RpcChannel::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace toolmux
