#pragma once

#include <toolmux/mcp/i_mcp_session.hpp>
#include <toolmux/mcp/rpc_channel.hpp>

#include <atomic>
#include <string>

namespace toolmux {

// ---------------------------------------------------------------------------
// ChannelSession — IMcpSession protocol logic shared by every transport.
//
// Subclasses own the transport: they implement Start/Close, deliver incoming
// messages through channel().Dispatch(), and send outgoing ones in
// SendMessage(). This class runs the handshake, tool listing and tool calls
// and enforces the lifecycle order.
// ---------------------------------------------------------------------------
class ChannelSession : public IMcpSession {
public:
    enum class State {
        Created,
        Started,
        Initialized,
        Closed,
    };

    explicit ChannelSession(std::string name);
    ~ChannelSession() override = default;

    [[nodiscard]] const std::string& Name() const override { return name_; }

    [[nodiscard]] Result<InitializeResult, Error> Initialize(
        const ClientIdentity& client,
        const Deadline& deadline) override;

    [[nodiscard]] Result<std::vector<ToolDescriptor>, Error> ListTools(
        const Deadline& deadline) override;

    [[nodiscard]] Result<CallResult, Error> CallTool(
        const std::string& tool_name,
        const nlohmann::json& arguments,
        const Deadline& deadline) override;

    void SetNotificationHandler(NotificationHandler handler) override;

    [[nodiscard]] State CurrentState() const { return state_.load(); }

    // Upper bound on tools/list pages followed for one catalog.
    static constexpr int kMaxToolPages = 64;

protected:
    /// Deliver one serialized JSON-RPC message to the endpoint. Gives up
    /// with a Timeout error once `deadline` expires or is cancelled.
    [[nodiscard]] virtual Result<void, Error> SendMessage(const std::string& message,
                                                          const Deadline& deadline) = 0;

    RpcChannel& channel() { return channel_; }
    void SetState(State state) { state_.store(state); }

    /// Error for an operation attempted in the wrong lifecycle state.
    [[nodiscard]] Error LifecycleError(const std::string& operation,
                                       const std::string& required) const;

private:
    std::string name_;
    RpcChannel channel_;
    std::atomic<State> state_{State::Created};
};

} // namespace toolmux
