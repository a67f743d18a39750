#pragma once

#include <toolmux/config/app_config.hpp>
#include <toolmux/core/deadline.hpp>
#include <toolmux/core/result.hpp>
#include <toolmux/mcp/mcp_types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace toolmux {

using NotificationHandler = std::function<void(const Notification&)>;

// ---------------------------------------------------------------------------
// IMcpSession — one live connection to one tool-serving endpoint.
//
// The orchestrator depends on this interface rather than a concrete
// transport. This enables offline testing via MockMcpSession.
//
// Lifecycle: Start -> Initialize -> ListTools / CallTool* -> Close.
// Calling an operation out of order fails without touching the transport.
// Every blocking operation is bounded by the caller's Deadline.
//
// Methods return Result<T, Error> — never throw on expected failures.
// ---------------------------------------------------------------------------
class IMcpSession {
public:
    virtual ~IMcpSession() = default;

    // Non-copyable, non-movable (polymorphic base).
    IMcpSession(const IMcpSession&) = delete;
    IMcpSession& operator=(const IMcpSession&) = delete;
    IMcpSession(IMcpSession&&) = delete;
    IMcpSession& operator=(IMcpSession&&) = delete;

    /// Endpoint alias this session was created for.
    [[nodiscard]] virtual const std::string& Name() const = 0;

    // -- Lifecycle -----------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> Start(const Deadline& deadline) = 0;

    [[nodiscard]] virtual Result<InitializeResult, Error> Initialize(
        const ClientIdentity& client,
        const Deadline& deadline) = 0;

    /// Idempotent. Reports the first failure seen while shutting down.
    [[nodiscard]] virtual Result<void, Error> Close() = 0;

    // -- Tools ---------------------------------------------------------------

    /// Full catalog, following pagination cursors.
    [[nodiscard]] virtual Result<std::vector<ToolDescriptor>, Error> ListTools(
        const Deadline& deadline) = 0;

    [[nodiscard]] virtual Result<CallResult, Error> CallTool(
        const std::string& tool_name,
        const nlohmann::json& arguments,
        const Deadline& deadline) = 0;

    // -- Notifications -------------------------------------------------------

    /// Replaces the handler. It runs on a transport-owned thread.
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

protected:
    IMcpSession() = default;
};

} // namespace toolmux
