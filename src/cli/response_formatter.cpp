#include <toolmux/cli/response_formatter.hpp>

#include <sstream>
#include <vector>

namespace toolmux {

namespace {

// Split on '\n'; a single trailing newline does not produce an empty line.
std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    for (;;) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

void WriteIndented(std::ostream& out, const std::string& indent, const std::string& text) {
    for (const auto& line : SplitLines(text)) {
        out << indent << line << '\n';
    }
}

std::string Plural(size_t n, const char* word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

// One overload per ContentBlock alternative: adding a block kind without
// teaching the formatter about it does not compile.
struct DescribeVisitor {
    std::string operator()(const TextContent& text) const {
        return "text (" + Plural(text.text.size(), "byte") + ", " +
               Plural(SplitLines(text.text).size(), "line") + ")";
    }
    std::string operator()(const ImageContent& image) const {
        return "image (" + (image.mime_type.empty() ? std::string("unknown type")
                                                    : image.mime_type) +
               ", " + Plural(image.data_length, "encoded byte") + ")";
    }
    std::string operator()(const UnknownContent& unknown) const {
        return "unrecognized content type \"" + unknown.type + "\"";
    }
};

struct BodyVisitor {
    std::ostream& out;
    const std::string& indent;

    void operator()(const TextContent& text) const {
        WriteIndented(out, indent, text.text);
    }
    void operator()(const ImageContent& image) const {
        out << indent << "mimeType: " << image.mime_type << '\n';
        out << indent << "encodedBytes: " << image.data_length << '\n';
    }
    void operator()(const UnknownContent& unknown) const {
        WriteIndented(out, indent, unknown.raw.dump(2));
    }
};

} // anonymous namespace

std::string DescribeContentBlock(const ContentBlock& block) {
    return std::visit(DescribeVisitor{}, block);
}

std::string FormatCallReport(const std::string& tool_name,
                             const CallResult& result,
                             const std::string& indent) {
    std::ostringstream out;
    out << "Tool: " << tool_name << " (IsError: "
        << (result.is_error ? "true" : "false") << ")\n";

    if (result.content.empty()) {
        out << "(no content returned)\n";
        return out.str();
    }

    const auto total = result.content.size();
    for (size_t i = 0; i < total; ++i) {
        const auto& block = result.content[i];
        out << "Content block " << (i + 1) << "/" << total << ": "
            << DescribeContentBlock(block) << '\n';
        out << indent << "raw: " << DebugJson(block).dump() << '\n';
        std::visit(BodyVisitor{out, indent}, block);
    }
    return out.str();
}

} // namespace toolmux
