#include <toolmux/mcp/sse_parser.hpp>

#include <cctype>

namespace toolmux {

SseParser::SseParser(EventCallback on_event) : on_event_(std::move(on_event)) {}

void SseParser::Feed(std::string_view chunk) {
    for (char c : chunk) {
        if (skip_leading_lf_) {
            skip_leading_lf_ = false;
            if (c == '\n') continue;
        }
        if (c == '\r') {
            ProcessLine(buffer_);
            buffer_.clear();
            skip_leading_lf_ = true;
        } else if (c == '\n') {
            ProcessLine(buffer_);
            buffer_.clear();
        } else {
            buffer_.push_back(c);
        }
    }
}

void SseParser::ProcessLine(std::string_view line) {
    if (line.empty()) {
        DispatchEvent();
        return;
    }
    if (line[0] == ':') {
        return; // comment / keep-alive
    }

    std::string_view field = line;
    std::string_view value;
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "event") {
        event_ = std::string(value);
    } else if (field == "data") {
        if (has_data_) data_.push_back('\n');
        data_.append(value);
        has_data_ = true;
    } else if (field == "id") {
        if (value.find('\0') == std::string_view::npos) {
            last_id_ = std::string(value);
        }
    } else if (field == "retry") {
        bool digits = !value.empty();
        for (char c : value) {
            if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
        }
        if (digits && value.size() < 10) {
            retry_ms_ = std::stoi(std::string(value));
        }
    }
}

void SseParser::DispatchEvent() {
    if (!has_data_) {
        event_.clear();
        return;
    }
    SseEvent ev;
    if (!event_.empty()) {
        ev.event = std::move(event_);
    }
    ev.data = std::move(data_);
    ev.id = last_id_;

    event_.clear();
    data_.clear();
    has_data_ = false;

    if (on_event_) {
        on_event_(ev);
    }
}

} // namespace toolmux
