#include <toolmux/mcp/channel_session.hpp>

#include <toolmux/core/log.hpp>

namespace toolmux {

ChannelSession::ChannelSession(std::string name)
    : name_(std::move(name)),
      channel_(name_, [this](const std::string& message, const Deadline& deadline) {
          return SendMessage(message, deadline);
      }) {}

Error ChannelSession::LifecycleError(const std::string& operation,
                                     const std::string& required) const {
    auto state = state_.load();
    std::string message = state == State::Closed
        ? "session is closed"
        : "session must be " + required + " first";
    return Error{operation, name_, std::nullopt, message, ErrorCategory::Internal};
}

// ---------------------------------------------------------------------------
// Initialize
// ---------------------------------------------------------------------------
Result<InitializeResult, Error> ChannelSession::Initialize(const ClientIdentity& client,
                                                          const Deadline& deadline) {
    if (state_.load() != State::Started) {
        return Result<InitializeResult, Error>::Err(LifecycleError("Initialize", "started"));
    }

    nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", client.name}, {"version", client.version}}},
    };
    auto response = channel_.Request("initialize", std::move(params), deadline);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        if (error.category != ErrorCategory::Timeout) {
            error.category = ErrorCategory::Handshake;
        }
        return Result<InitializeResult, Error>::Err(std::move(error));
    }

    auto init = ParseInitializeResult(response.Value(), name_);
    if (init.IsErr()) {
        auto error = std::move(init).Error();
        error.category = ErrorCategory::Handshake;
        return Result<InitializeResult, Error>::Err(std::move(error));
    }

    auto notified = channel_.Notify("notifications/initialized", nlohmann::json::object(),
                                    deadline);
    if (notified.IsErr()) {
        auto error = std::move(notified).Error();
        if (error.category != ErrorCategory::Timeout) {
            error.category = ErrorCategory::Handshake;
        }
        return Result<InitializeResult, Error>::Err(std::move(error));
    }

    if (init.Value().protocol_version != kProtocolVersion) {
        LogInfo("rpc", name_ + " negotiated protocol " + init.Value().protocol_version);
    }
    SetState(State::Initialized);
    return init;
}

// ---------------------------------------------------------------------------
// ListTools
// ---------------------------------------------------------------------------
Result<std::vector<ToolDescriptor>, Error> ChannelSession::ListTools(
    const Deadline& deadline) {
    if (state_.load() != State::Initialized) {
        return Result<std::vector<ToolDescriptor>, Error>::Err(
            LifecycleError("ListTools", "initialized"));
    }

    std::vector<ToolDescriptor> tools;
    std::optional<std::string> cursor;
    for (int page_no = 0; page_no < kMaxToolPages; ++page_no) {
        auto params = nlohmann::json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }
        auto response = channel_.Request("tools/list", std::move(params), deadline);
        if (response.IsErr()) {
            return Result<std::vector<ToolDescriptor>, Error>::Err(
                std::move(response).Error());
        }
        auto page = ParseToolPage(response.Value(), name_);
        if (page.IsErr()) {
            return Result<std::vector<ToolDescriptor>, Error>::Err(std::move(page).Error());
        }
        auto parsed = std::move(page).Value();
        for (auto& tool : parsed.tools) {
            tools.push_back(std::move(tool));
        }
        if (!parsed.next_cursor.has_value()) {
            return Result<std::vector<ToolDescriptor>, Error>::Ok(std::move(tools));
        }
        cursor = std::move(parsed.next_cursor);
    }

    return Result<std::vector<ToolDescriptor>, Error>::Err(
        Error{"ListTools", name_, std::nullopt,
              "tools/list did not finish within " + std::to_string(kMaxToolPages) +
                  " pages",
              ErrorCategory::Decode});
}

// ---------------------------------------------------------------------------
// CallTool
// ---------------------------------------------------------------------------
Result<CallResult, Error> ChannelSession::CallTool(const std::string& tool_name,
                                                   const nlohmann::json& arguments,
                                                   const Deadline& deadline) {
    if (state_.load() != State::Initialized) {
        return Result<CallResult, Error>::Err(LifecycleError("CallTool", "initialized"));
    }

    nlohmann::json params = {
        {"name", tool_name},
        {"arguments", arguments},
    };
    auto response = channel_.Request("tools/call", std::move(params), deadline);
    if (response.IsErr()) {
        return Result<CallResult, Error>::Err(std::move(response).Error());
    }
    return ParseCallResult(response.Value(), name_);
}

void ChannelSession::SetNotificationHandler(NotificationHandler handler) {
    channel_.SetNotificationHandler(std::move(handler));
}

} // namespace toolmux
