#pragma once

#include <toolmux/config/app_config.hpp>
#include <toolmux/core/result.hpp>
#include <toolmux/mcp/i_mcp_session.hpp>

#include <functional>
#include <memory>

namespace toolmux {

// Builds the session for one endpoint. The orchestrator takes this as a
// parameter; tests substitute a factory returning mock sessions.
using SessionFactory =
    std::function<Result<std::unique_ptr<IMcpSession>, Error>(const EndpointConfig&)>;

// Default factory: SseSession for `url` endpoints, StdioSession for
// `command` endpoints. Fails with a Construction error when the transport
// cannot be built locally.
Result<std::unique_ptr<IMcpSession>, Error> MakeSession(const EndpointConfig& config);

} // namespace toolmux
