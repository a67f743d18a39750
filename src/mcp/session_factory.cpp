#include <toolmux/mcp/session_factory.hpp>

#include <toolmux/mcp/sse_session.hpp>
#include <toolmux/mcp/stdio_session.hpp>

namespace toolmux {

namespace {

template <typename Session>
Result<std::unique_ptr<IMcpSession>, Error> Upcast(
    Result<std::unique_ptr<Session>, Error> created) {
    if (created.IsErr()) {
        return Result<std::unique_ptr<IMcpSession>, Error>::Err(std::move(created).Error());
    }
    return Result<std::unique_ptr<IMcpSession>, Error>::Ok(std::move(created).Value());
}

} // anonymous namespace

Result<std::unique_ptr<IMcpSession>, Error> MakeSession(const EndpointConfig& config) {
    if (const auto* sse = std::get_if<SseTransport>(&config.transport)) {
        return Upcast(SseSession::Create(config.name, sse->url));
    }
    return Upcast(StdioSession::Create(config.name, std::get<StdioTransport>(config.transport)));
}

} // namespace toolmux
