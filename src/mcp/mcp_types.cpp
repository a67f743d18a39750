#include <toolmux/mcp/mcp_types.hpp>

namespace toolmux {

namespace {

Error MakeDecodeError(const std::string& operation, const std::string& endpoint,
                      const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, ErrorCategory::Decode};
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

std::string ElidedPayload(size_t length) {
    return "<" + std::to_string(length) + " bytes elided>";
}

struct ToJsonVisitor {
    nlohmann::json operator()(const TextContent& text) const {
        return nlohmann::json{{"type", "text"}, {"text", text.text}};
    }
    nlohmann::json operator()(const ImageContent& image) const {
        return nlohmann::json{{"type", "image"},
                              {"mimeType", image.mime_type},
                              {"encodedBytes", image.data_length}};
    }
    nlohmann::json operator()(const UnknownContent& unknown) const {
        return unknown.raw;
    }
};

struct DebugJsonVisitor {
    nlohmann::json operator()(const TextContent& text) const {
        return nlohmann::json{{"type", "text"}, {"text", text.text}};
    }
    nlohmann::json operator()(const ImageContent& image) const {
        if (!image.raw.is_null()) {
            return image.raw;
        }
        return nlohmann::json{{"type", "image"},
                              {"mimeType", image.mime_type},
                              {"data", ElidedPayload(image.data_length)}};
    }
    nlohmann::json operator()(const UnknownContent& unknown) const {
        return unknown.raw;
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseInitializeResult
// ---------------------------------------------------------------------------
Result<InitializeResult, Error> ParseInitializeResult(const nlohmann::json& result,
                                                     const std::string& endpoint) {
    if (!result.is_object()) {
        return Result<InitializeResult, Error>::Err(MakeDecodeError(
            "Initialize", endpoint, "initialize result is not an object"));
    }
    if (!result.contains("protocolVersion") || !result["protocolVersion"].is_string()) {
        return Result<InitializeResult, Error>::Err(MakeDecodeError(
            "Initialize", endpoint, "initialize result lacks protocolVersion"));
    }

    InitializeResult init;
    init.protocol_version = result["protocolVersion"].get<std::string>();
    if (result.contains("serverInfo")) {
        init.server_name = StringField(result["serverInfo"], "name");
        init.server_version = StringField(result["serverInfo"], "version");
    }
    if (result.contains("capabilities") && result["capabilities"].is_object()) {
        init.capabilities = result["capabilities"];
    }
    init.instructions = StringField(result, "instructions");
    return Result<InitializeResult, Error>::Ok(std::move(init));
}

// ---------------------------------------------------------------------------
// ParseToolPage
// ---------------------------------------------------------------------------
Result<ToolPage, Error> ParseToolPage(const nlohmann::json& result,
                                      const std::string& endpoint) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return Result<ToolPage, Error>::Err(MakeDecodeError(
            "ListTools", endpoint, "tools/list result lacks a 'tools' array"));
    }

    ToolPage page;
    for (const auto& item : result["tools"]) {
        auto name = StringField(item, "name");
        if (name.empty()) {
            return Result<ToolPage, Error>::Err(MakeDecodeError(
                "ListTools", endpoint, "tool entry without a name: " + item.dump()));
        }
        ToolDescriptor tool;
        tool.name = std::move(name);
        tool.description = StringField(item, "description");
        if (item.contains("inputSchema")) {
            tool.input_schema = item["inputSchema"];
        }
        page.tools.push_back(std::move(tool));
    }
    auto cursor = StringField(result, "nextCursor");
    if (!cursor.empty()) {
        page.next_cursor = std::move(cursor);
    }
    return Result<ToolPage, Error>::Ok(std::move(page));
}

// ---------------------------------------------------------------------------
// ParseContentBlock
// ---------------------------------------------------------------------------
ContentBlock ParseContentBlock(const nlohmann::json& block) {
    auto type = StringField(block, "type");
    if (type == "text" && block.contains("text") && block["text"].is_string()) {
        return TextContent{block["text"].get<std::string>()};
    }
    if (type == "image" && block.contains("data") && block["data"].is_string()) {
        ImageContent image;
        image.mime_type = StringField(block, "mimeType");
        image.data_length = block["data"].get_ref<const std::string&>().size();
        image.raw = block;
        image.raw["data"] = ElidedPayload(image.data_length);
        return image;
    }
    return UnknownContent{type, block};
}

// ---------------------------------------------------------------------------
// ParseCallResult
// ---------------------------------------------------------------------------
Result<CallResult, Error> ParseCallResult(const nlohmann::json& result,
                                          const std::string& endpoint) {
    if (!result.is_object()) {
        return Result<CallResult, Error>::Err(MakeDecodeError(
            "CallTool", endpoint, "tools/call result is not an object"));
    }

    CallResult call;
    if (result.contains("isError") && result["isError"].is_boolean()) {
        call.is_error = result["isError"].get<bool>();
    }
    if (result.contains("content")) {
        if (!result["content"].is_array()) {
            return Result<CallResult, Error>::Err(MakeDecodeError(
                "CallTool", endpoint, "tools/call 'content' is not an array"));
        }
        for (const auto& block : result["content"]) {
            call.content.push_back(ParseContentBlock(block));
        }
    }
    return Result<CallResult, Error>::Ok(std::move(call));
}

// ---------------------------------------------------------------------------
// ToJson
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const ToolDescriptor& tool) {
    return nlohmann::json{
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema},
    };
}

nlohmann::json ToJson(const ContentBlock& block) {
    return std::visit(ToJsonVisitor{}, block);
}

nlohmann::json DebugJson(const ContentBlock& block) {
    return std::visit(DebugJsonVisitor{}, block);
}

nlohmann::json ToJson(const CallResult& result) {
    auto content = nlohmann::json::array();
    for (const auto& block : result.content) {
        content.push_back(ToJson(block));
    }
    return nlohmann::json{{"isError", result.is_error}, {"content", content}};
}

} // namespace toolmux
