#pragma once

#include <toolmux/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolmux {

// Protocol revision sent in the initialize handshake.
constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// InitializeResult — what an endpoint reported during the handshake.
// ---------------------------------------------------------------------------
struct InitializeResult {
    std::string protocol_version;
    std::string server_name;
    std::string server_version;
    nlohmann::json capabilities = nlohmann::json::object();
    std::string instructions;
};

// ---------------------------------------------------------------------------
// ToolDescriptor — one entry of an endpoint's tool catalog.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

struct ToolPage {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> next_cursor;
};

// ---------------------------------------------------------------------------
// Content blocks of a tool call result. A closed set: code that switches on
// ContentBlock must handle every alternative.
// ---------------------------------------------------------------------------
struct TextContent {
    std::string text;
};

// The base64 payload is never decoded; only its length is kept.
struct ImageContent {
    std::string mime_type;
    size_t data_length = 0;
    nlohmann::json raw; // block as received, "data" replaced by a length marker
};

// Any block whose type is not text or image, kept verbatim.
struct UnknownContent {
    std::string type;
    nlohmann::json raw;
};

using ContentBlock = std::variant<TextContent, ImageContent, UnknownContent>;

struct CallResult {
    bool is_error = false;
    std::vector<ContentBlock> content;
};

// Server push message that is not a response to any request.
struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// Decoding from JSON-RPC result objects. `endpoint` only labels errors.
// ---------------------------------------------------------------------------
Result<InitializeResult, Error> ParseInitializeResult(const nlohmann::json& result,
                                                     const std::string& endpoint);

Result<ToolPage, Error> ParseToolPage(const nlohmann::json& result,
                                      const std::string& endpoint);

// Never fails: anything unrecognized becomes UnknownContent.
ContentBlock ParseContentBlock(const nlohmann::json& block);

Result<CallResult, Error> ParseCallResult(const nlohmann::json& result,
                                          const std::string& endpoint);

// ---------------------------------------------------------------------------
// Encoding for structured CLI output.
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const ToolDescriptor& tool);
nlohmann::json ToJson(const ContentBlock& block);

// The block as the endpoint sent it, for diagnostics. Image payloads are
// replaced by "<N bytes elided>".
nlohmann::json DebugJson(const ContentBlock& block);
nlohmann::json ToJson(const CallResult& result);

} // namespace toolmux
