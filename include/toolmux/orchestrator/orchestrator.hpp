#pragma once

#include <toolmux/config/app_config.hpp>
#include <toolmux/core/deadline.hpp>
#include <toolmux/core/result.hpp>
#include <toolmux/mcp/mcp_types.hpp>
#include <toolmux/mcp/session_factory.hpp>
#include <toolmux/orchestrator/endpoint_registry.hpp>
#include <toolmux/orchestrator/notification_queue.hpp>
#include <toolmux/orchestrator/routing_table.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// CloseReport — outcome of closing every endpoint. Close never fails as a
// whole; per-endpoint errors are collected here.
// ---------------------------------------------------------------------------
struct CloseReport {
    std::vector<std::string> closed;
    std::vector<Error> failures;

    [[nodiscard]] bool Ok() const noexcept { return failures.empty(); }
};

// Tool progress/output notification pushed by an endpoint.
struct NotificationPayload {
    std::string name;
    nlohmann::json output = nlohmann::json::object();
};

// Decode `{name, output}` from a notification's params. Unknown fields are
// ignored; a missing name or a non-object output is a Decode error.
Result<NotificationPayload, Error> DecodeNotificationPayload(
    const std::string& endpoint,
    const Notification& notification);

// Tool name part of "<alias>.<tool>": the second dot-separated segment
// ("a.b.c" yields "b"). Fails with a Routing error when there is no dot.
Result<std::string, Error> ToolNameFromIdentifier(const std::string& identifier);

using NotificationSink =
    std::function<void(const std::string& endpoint, const Notification& notification)>;

// ---------------------------------------------------------------------------
// Orchestrator — owns every endpoint session and routes tool calls.
//
// Lifecycle stages run in order, each on the caller's thread:
//   ConnectAll    build one session per endpoint (construction errors fatal)
//   StartAll      start sessions concurrently; failures drop the endpoint
//   InitializeAll handshake concurrently; failures drop the endpoint
//   DiscoverAll   list tools and rebuild the routing table (failures fatal)
//   CallTool      dispatch "<alias>.<tool>" through the routing table
//   Close         close every session, collecting errors
//
// After DiscoverAll the registry and routing table are only read, so
// CallTool may be used from several threads at once. Push notifications
// arrive on transport threads and are queued; DrainNotifications handles
// them on the calling thread.
// ---------------------------------------------------------------------------
class Orchestrator {
public:
    enum class Stage {
        Empty,
        Connected,
        Started,
        Initialized,
        Discovered,
        Closed,
    };

    explicit Orchestrator(ClientIdentity client,
                          SessionFactory factory = MakeSession,
                          size_t notification_capacity = 256);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // -- Lifecycle -----------------------------------------------------------

    [[nodiscard]] Result<void, Error> ConnectAll(const std::vector<EndpointConfig>& configs);
    [[nodiscard]] Result<void, Error> StartAll(const Deadline& deadline);
    [[nodiscard]] Result<void, Error> InitializeAll(const Deadline& deadline);
    [[nodiscard]] Result<void, Error> DiscoverAll(const Deadline& deadline);

    /// ConnectAll, StartAll, InitializeAll and DiscoverAll in sequence.
    [[nodiscard]] Result<void, Error> Open(const std::vector<EndpointConfig>& configs,
                                           const Deadline& deadline);

    /// Idempotent. Closes sessions concurrently; never short-circuits.
    CloseReport Close();

    // -- Dispatch ------------------------------------------------------------

    /// `identifier` is "<alias>.<tool>". Only the second dot-separated
    /// segment selects the endpoint; the alias is not checked against it.
    [[nodiscard]] Result<CallResult, Error> CallTool(const std::string& identifier,
                                                     const nlohmann::json& arguments,
                                                     const Deadline& deadline) const;

    // -- Introspection -------------------------------------------------------

    /// {"alias": [{name, description, inputSchema}, ...], ...}
    [[nodiscard]] nlohmann::json ToolsAsJson() const;

    [[nodiscard]] std::optional<std::string> ResolveEndpoint(const std::string& tool_name) const;
    [[nodiscard]] std::vector<std::string> EndpointNames() const;
    [[nodiscard]] const EndpointRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const RoutingTable& Routing() const noexcept { return routing_; }
    [[nodiscard]] Stage CurrentStage() const noexcept { return stage_; }

    // -- Notifications -------------------------------------------------------

    /// Replaces the default handler (decode and log).
    void SetNotificationSink(NotificationSink sink);

    /// Runs the handler for every queued notification; returns the count.
    size_t DrainNotifications();

    [[nodiscard]] size_t DroppedNotifications() const { return queue_.Dropped(); }

private:
    [[nodiscard]] Result<void, Error> RequireStage(const std::string& operation,
                                                   std::initializer_list<Stage> allowed) const;
    void DropEndpoint(const std::string& name, const Error& reason);
    void HandleNotification(const std::string& endpoint, const Notification& notification);

    ClientIdentity client_;
    SessionFactory factory_;
    // Declared before registry_: sessions push into it until they close.
    NotificationQueue queue_;
    NotificationSink sink_;
    EndpointRegistry registry_;
    RoutingTable routing_;
    Stage stage_ = Stage::Empty;
};

} // namespace toolmux
