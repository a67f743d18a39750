#include <toolmux/core/result.hpp>

#include <nlohmann/json.hpp>

namespace toolmux {

namespace {

constexpr size_t kMaxBodyExcerpt = 200;

// Pull a human-readable message out of a response body. MCP servers reply
// with either a JSON-RPC error object, a JSON {"error": "..."} object, or
// plain text (e.g. http.Error in Go servers).
std::string ExtractBodyMessage(const std::string& body) {
    if (body.empty()) return {};

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_string()) {
            return err.get<std::string>();
        }
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
    }

    auto text = body;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (text.size() > kMaxBodyExcerpt) {
        text = text.substr(0, kMaxBodyExcerpt) + "...";
    }
    return text;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto detail = ExtractBodyMessage(response_body);

    ErrorCategory category = ErrorCategory::Transport;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
        case 403:
            message = "Endpoint rejected the request (HTTP " +
                      std::to_string(status_code) + ")";
            break;
        case 404:
            message = "Endpoint path not found";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 500:
            message = "Endpoint internal error";
            break;
        case 502:
        case 503:
            message = "Endpoint unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (!detail.empty()) {
        message += ": " + detail;
    }

    return Error{operation, endpoint, status_code, message, category};
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    body["message"] = message;
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace toolmux
