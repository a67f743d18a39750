#include <toolmux/orchestrator/orchestrator.hpp>

#include <toolmux/core/log.hpp>

#include <algorithm>
#include <thread>

namespace toolmux {

namespace {

const char* StageName(Orchestrator::Stage stage) {
    switch (stage) {
        case Orchestrator::Stage::Empty:       return "empty";
        case Orchestrator::Stage::Connected:   return "connected";
        case Orchestrator::Stage::Started:     return "started";
        case Orchestrator::Stage::Initialized: return "initialized";
        case Orchestrator::Stage::Discovered:  return "discovered";
        case Orchestrator::Stage::Closed:      return "closed";
    }
    return "unknown";
}

Error MakeRoutingError(const std::string& message, const std::string& endpoint = "") {
    return Error{"CallTool", endpoint, std::nullopt, message, ErrorCategory::Routing};
}

// Run fn(record) for every record on its own thread and join. Each worker
// touches only its own record; the registry itself is not mutated here.
template <typename Fn>
std::vector<std::optional<Error>> FanOut(EndpointRegistry& registry, Fn fn) {
    std::vector<EndpointRecord*> records;
    for (auto& record : registry) {
        records.push_back(&record);
    }

    std::vector<std::optional<Error>> failures(records.size());
    std::vector<std::thread> workers;
    workers.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        workers.emplace_back([&, i] { failures[i] = fn(*records[i]); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return failures;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DecodeNotificationPayload
// ---------------------------------------------------------------------------
Result<NotificationPayload, Error> DecodeNotificationPayload(
    const std::string& endpoint,
    const Notification& notification) {
    auto fail = [&](const std::string& message) {
        return Result<NotificationPayload, Error>::Err(
            Error{"Notification", endpoint, std::nullopt,
                  notification.method + ": " + message, ErrorCategory::Decode});
    };

    const auto& params = notification.params;
    if (!params.is_object()) {
        return fail("payload is not an object");
    }
    if (!params.contains("name") || !params["name"].is_string()) {
        return fail("payload has no string 'name'");
    }
    NotificationPayload payload;
    payload.name = params["name"].get<std::string>();
    if (params.contains("output")) {
        if (!params["output"].is_object()) {
            return fail("payload 'output' is not an object");
        }
        payload.output = params["output"];
    }
    return Result<NotificationPayload, Error>::Ok(std::move(payload));
}

// ---------------------------------------------------------------------------
// ToolNameFromIdentifier
// ---------------------------------------------------------------------------
Result<std::string, Error> ToolNameFromIdentifier(const std::string& identifier) {
    auto first_dot = identifier.find('.');
    if (first_dot == std::string::npos) {
        return Result<std::string, Error>::Err(MakeRoutingError(
            "Tool identifier '" + identifier + "' must have the form <alias>.<tool>"));
    }
    auto second_dot = identifier.find('.', first_dot + 1);
    auto length = second_dot == std::string::npos ? std::string::npos
                                                  : second_dot - first_dot - 1;
    return Result<std::string, Error>::Ok(identifier.substr(first_dot + 1, length));
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Orchestrator::Orchestrator(ClientIdentity client,
                           SessionFactory factory,
                           size_t notification_capacity)
    : client_(std::move(client)),
      factory_(std::move(factory)),
      queue_(notification_capacity) {}

Orchestrator::~Orchestrator() {
    Close();
}

Result<void, Error> Orchestrator::RequireStage(const std::string& operation,
                                               std::initializer_list<Stage> allowed) const {
    if (std::find(allowed.begin(), allowed.end(), stage_) != allowed.end()) {
        return Result<void, Error>::Ok();
    }
    return Result<void, Error>::Err(
        Error{operation, "", std::nullopt,
              std::string("not allowed while orchestrator is ") + StageName(stage_),
              ErrorCategory::Internal});
}

void Orchestrator::DropEndpoint(const std::string& name, const Error& reason) {
    LogWarn("orchestrator", "Dropping endpoint '" + name + "': " + reason.ToString());
    auto removed = registry_.Remove(name);
    routing_.RemoveEndpoint(name);
    if (removed.has_value() && removed->session) {
        auto closed = removed->session->Close();
        if (closed.IsErr()) {
            LogDebug("orchestrator", "Close after drop failed: " + closed.Error().ToString());
        }
    }
}

// ---------------------------------------------------------------------------
// ConnectAll
// ---------------------------------------------------------------------------
Result<void, Error> Orchestrator::ConnectAll(const std::vector<EndpointConfig>& configs) {
    auto allowed = RequireStage("ConnectAll", {Stage::Empty});
    if (allowed.IsErr()) return allowed;

    for (const auto& config : configs) {
        auto created = factory_(config);
        if (created.IsErr()) {
            auto error = std::move(created).Error();
            LogError("orchestrator", "Cannot create session for '" + config.name +
                                         "': " + error.ToString());
            return Result<void, Error>::Err(std::move(error));
        }

        auto session = std::move(created).Value();
        const auto name = config.name;
        session->SetNotificationHandler([this, name](const Notification& notification) {
            if (!queue_.TryPush(QueuedNotification{name, notification})) {
                LogWarn("notify", "Queue full, dropping " + notification.method +
                                      " from '" + name + "'");
            }
        });

        if (!registry_.Add(EndpointRecord{name, std::move(session), {}, std::nullopt})) {
            return Result<void, Error>::Err(
                Error{"ConnectAll", name, std::nullopt, "Duplicate endpoint alias",
                      ErrorCategory::Config});
        }
        LogDebug("orchestrator", "Created session for '" + name + "'");
    }

    stage_ = Stage::Connected;
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// StartAll
// ---------------------------------------------------------------------------
Result<void, Error> Orchestrator::StartAll(const Deadline& deadline) {
    auto allowed = RequireStage("StartAll", {Stage::Connected});
    if (allowed.IsErr()) return allowed;

    auto names = registry_.Names();
    auto failures = FanOut(registry_, [&](EndpointRecord& record) -> std::optional<Error> {
        auto started = record.session->Start(deadline);
        if (started.IsErr()) return std::move(started).Error();
        return std::nullopt;
    });

    for (size_t i = 0; i < names.size(); ++i) {
        if (failures[i].has_value()) {
            DropEndpoint(names[i], *failures[i]);
        }
    }

    if (registry_.Empty()) {
        return Result<void, Error>::Err(
            Error{"StartAll", "", std::nullopt, "no servers running", ErrorCategory::Start});
    }
    LogInfo("orchestrator", std::to_string(registry_.Size()) + " of " +
                                std::to_string(names.size()) + " endpoint(s) started");
    stage_ = Stage::Started;
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// InitializeAll
// ---------------------------------------------------------------------------
Result<void, Error> Orchestrator::InitializeAll(const Deadline& deadline) {
    auto allowed = RequireStage("InitializeAll", {Stage::Started});
    if (allowed.IsErr()) return allowed;

    auto names = registry_.Names();
    auto failures = FanOut(registry_, [&](EndpointRecord& record) -> std::optional<Error> {
        auto init = record.session->Initialize(client_, deadline);
        if (init.IsErr()) return std::move(init).Error();
        record.init_result = std::move(init).Value();
        return std::nullopt;
    });

    for (size_t i = 0; i < names.size(); ++i) {
        if (failures[i].has_value()) {
            DropEndpoint(names[i], *failures[i]);
        }
    }

    if (registry_.Empty()) {
        return Result<void, Error>::Err(Error{
            "InitializeAll", "", std::nullopt, "no servers running after handshake",
            ErrorCategory::Handshake});
    }
    for (const auto& record : registry_) {
        const auto& init = *record.init_result;
        LogInfo("orchestrator", "Initialized '" + record.name + "' (" +
                                    (init.server_name.empty() ? "unnamed server"
                                                              : init.server_name) +
                                    (init.server_version.empty() ? "" : " " + init.server_version) +
                                    ", protocol " + init.protocol_version + ")");
    }
    stage_ = Stage::Initialized;
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// DiscoverAll
// ---------------------------------------------------------------------------
Result<void, Error> Orchestrator::DiscoverAll(const Deadline& deadline) {
    auto allowed = RequireStage("DiscoverAll", {Stage::Initialized, Stage::Discovered});
    if (allowed.IsErr()) return allowed;

    // Build into locals and commit only when every endpoint answered, so a
    // failed refresh leaves the previous catalog and routing intact.
    std::vector<std::vector<ToolDescriptor>> catalogs;
    RoutingTable fresh;
    for (auto& record : registry_) {
        auto listed = record.session->ListTools(deadline);
        if (listed.IsErr()) {
            auto error = std::move(listed).Error();
            if (error.category != ErrorCategory::Timeout) {
                error.category = ErrorCategory::Discovery;
            }
            LogError("orchestrator", "Discovery failed: " + error.ToString());
            return Result<void, Error>::Err(std::move(error));
        }
        auto tools = std::move(listed).Value();
        for (const auto& tool : tools) {
            auto previous = fresh.Assign(tool.name, record.name);
            if (previous.has_value()) {
                LogWarn("orchestrator", "Tool '" + tool.name + "' of endpoint '" +
                                            *previous + "' is shadowed by endpoint '" +
                                            record.name + "'");
            }
        }
        LogDebug("orchestrator", "'" + record.name + "' exposes " +
                                     std::to_string(tools.size()) + " tool(s)");
        catalogs.push_back(std::move(tools));
    }

    size_t i = 0;
    for (auto& record : registry_) {
        record.tools = std::move(catalogs[i++]);
    }
    routing_ = std::move(fresh);
    stage_ = Stage::Discovered;
    LogInfo("orchestrator", std::to_string(routing_.Size()) + " tool(s) routable");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------
Result<void, Error> Orchestrator::Open(const std::vector<EndpointConfig>& configs,
                                       const Deadline& deadline) {
    auto connected = ConnectAll(configs);
    if (connected.IsErr()) return connected;
    auto started = StartAll(deadline);
    if (started.IsErr()) return started;
    auto initialized = InitializeAll(deadline);
    if (initialized.IsErr()) return initialized;
    return DiscoverAll(deadline);
}

// ---------------------------------------------------------------------------
// CallTool
// ---------------------------------------------------------------------------
Result<CallResult, Error> Orchestrator::CallTool(const std::string& identifier,
                                                 const nlohmann::json& arguments,
                                                 const Deadline& deadline) const {
    auto allowed = RequireStage("CallTool", {Stage::Discovered});
    if (allowed.IsErr()) {
        return Result<CallResult, Error>::Err(std::move(allowed).Error());
    }

    auto parsed = ToolNameFromIdentifier(identifier);
    if (parsed.IsErr()) {
        return Result<CallResult, Error>::Err(std::move(parsed).Error());
    }
    const auto tool_name = std::move(parsed).Value();

    auto owner = routing_.Resolve(tool_name);
    if (!owner.has_value()) {
        return Result<CallResult, Error>::Err(
            MakeRoutingError("No endpoint serves tool '" + tool_name + "'"));
    }
    const auto* record = registry_.Find(*owner);
    if (record == nullptr) {
        return Result<CallResult, Error>::Err(Error{
            "CallTool", *owner, std::nullopt,
            "Routing entry for '" + tool_name + "' points at a removed endpoint",
            ErrorCategory::Internal});
    }

    LogInfo("orchestrator", "Calling '" + tool_name + "' on endpoint '" + *owner + "'");
    auto result = record->session->CallTool(tool_name, arguments, deadline);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.endpoint = *owner;
        error.message = "tool '" + tool_name + "': " + error.message;
        return Result<CallResult, Error>::Err(std::move(error));
    }
    return result;
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------
nlohmann::json Orchestrator::ToolsAsJson() const {
    auto out = nlohmann::json::object();
    for (const auto& record : registry_) {
        auto tools = nlohmann::json::array();
        for (const auto& tool : record.tools) {
            tools.push_back(ToJson(tool));
        }
        out[record.name] = std::move(tools);
    }
    return out;
}

std::optional<std::string> Orchestrator::ResolveEndpoint(const std::string& tool_name) const {
    return routing_.Resolve(tool_name);
}

std::vector<std::string> Orchestrator::EndpointNames() const {
    return registry_.Names();
}

// ---------------------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------------------
void Orchestrator::SetNotificationSink(NotificationSink sink) {
    sink_ = std::move(sink);
}

size_t Orchestrator::DrainNotifications() {
    auto items = queue_.Drain();
    for (const auto& item : items) {
        HandleNotification(item.endpoint, item.notification);
    }
    return items.size();
}

void Orchestrator::HandleNotification(const std::string& endpoint,
                                      const Notification& notification) {
    if (sink_) {
        sink_(endpoint, notification);
        return;
    }
    auto decoded = DecodeNotificationPayload(endpoint, notification);
    if (decoded.IsErr()) {
        LogWarn("notify", "Dropping notification: " + decoded.Error().ToString());
        return;
    }
    const auto& payload = decoded.Value();
    LogInfo("notify", endpoint + ": " + payload.name + " " + payload.output.dump());
}

// ---------------------------------------------------------------------------
// Close
// ---------------------------------------------------------------------------
CloseReport Orchestrator::Close() {
    CloseReport report;
    if (stage_ == Stage::Closed) {
        return report;
    }

    auto names = registry_.Names();
    auto failures = FanOut(registry_, [](EndpointRecord& record) -> std::optional<Error> {
        auto closed = record.session->Close();
        if (closed.IsErr()) return std::move(closed).Error();
        return std::nullopt;
    });

    for (size_t i = 0; i < names.size(); ++i) {
        if (failures[i].has_value()) {
            LogWarn("orchestrator", "Close failed for '" + names[i] + "': " +
                                        failures[i]->ToString());
            report.failures.push_back(std::move(*failures[i]));
        } else {
            report.closed.push_back(names[i]);
        }
    }

    queue_.Close();
    DrainNotifications();
    stage_ = Stage::Closed;
    return report;
}

} // namespace toolmux
