#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolmux {

// Event-streaming endpoint reached at an absolute http(s) URL.
struct SseTransport {
    std::string url;
};

// Endpoint spawned locally and spoken to over stdin/stdout.
struct StdioTransport {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // overlaid on the inherited env
};

struct EndpointConfig {
    std::string name;
    std::variant<SseTransport, StdioTransport> transport;
};

// Identity sent in the handshake's clientInfo.
struct ClientIdentity {
    std::string name;
    std::string version;
};

constexpr int kDefaultTimeoutSeconds = 90;
constexpr const char* kDefaultArgsJson = "{}";

// Optional fields stay unset unless the source named them, so a merge can
// tell an explicit default from an absent flag.
struct AppConfig {
    std::vector<EndpointConfig> endpoints; // processing order
    ClientIdentity client;
    std::optional<int> timeout_seconds; // unset: kDefaultTimeoutSeconds
    int notification_queue_capacity = 256;
    std::string report_indent = "    ";
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;

    // Invocation
    std::optional<std::string> tool;
    std::optional<std::string> args_json; // unset: kDefaultArgsJson
};

} // namespace toolmux
