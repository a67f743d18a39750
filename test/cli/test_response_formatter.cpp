#include <catch2/catch_test_macros.hpp>

#include <toolmux/cli/response_formatter.hpp>

#include <string>

using namespace toolmux;

// ===========================================================================
// DescribeContentBlock
// ===========================================================================

TEST_CASE("DescribeContentBlock: text counts bytes and lines", "[cli][report]") {
    CHECK(DescribeContentBlock(TextContent{"hello"}) == "text (5 bytes, 1 line)");
    CHECK(DescribeContentBlock(TextContent{"a\nb\nc"}) == "text (5 bytes, 3 lines)");
    CHECK(DescribeContentBlock(TextContent{"x"}) == "text (1 byte, 1 line)");
}

TEST_CASE("DescribeContentBlock: image reports type and size", "[cli][report]") {
    CHECK(DescribeContentBlock(ImageContent{"image/png", 1024}) ==
          "image (image/png, 1024 encoded bytes)");
    CHECK(DescribeContentBlock(ImageContent{"", 1}) ==
          "image (unknown type, 1 encoded byte)");
}

TEST_CASE("DescribeContentBlock: unknown block names its type", "[cli][report]") {
    UnknownContent block{"resource", nlohmann::json{{"type", "resource"}}};
    CHECK(DescribeContentBlock(block) == "unrecognized content type \"resource\"");
}

// ===========================================================================
// FormatCallReport
// ===========================================================================

TEST_CASE("FormatCallReport: empty result", "[cli][report]") {
    CallResult result;
    CHECK(FormatCallReport("get_pods", result) ==
          "Tool: get_pods (IsError: false)\n(no content returned)\n");
}

TEST_CASE("FormatCallReport: error flag is shown", "[cli][report]") {
    CallResult result;
    result.is_error = true;
    result.content.push_back(TextContent{"image not found"});

    auto report = FormatCallReport("pull_image", result);
    CHECK(report ==
          "Tool: pull_image (IsError: true)\n"
          "Content block 1/1: text (15 bytes, 1 line)\n"
          R"(    raw: {"text":"image not found","type":"text"})" "\n"
          "    image not found\n");
}

TEST_CASE("FormatCallReport: multi-line text is re-indented in order", "[cli][report]") {
    CallResult result;
    result.content.push_back(TextContent{"first\nsecond\nthird\n"});

    auto report = FormatCallReport("echo", result);
    CHECK(report ==
          "Tool: echo (IsError: false)\n"
          "Content block 1/1: text (19 bytes, 3 lines)\n"
          R"(    raw: {"text":"first\nsecond\nthird\n","type":"text"})" "\n"
          "    first\n"
          "    second\n"
          "    third\n");
}

TEST_CASE("FormatCallReport: custom indent", "[cli][report]") {
    CallResult result;
    result.content.push_back(TextContent{"a\nb"});

    auto report = FormatCallReport("echo", result, "  ");
    CHECK(report.find("\n  a\n  b\n") != std::string::npos);
}

TEST_CASE("FormatCallReport: image body shows metadata only", "[cli][report]") {
    CallResult result;
    result.content.push_back(ImageContent{"image/jpeg", 4096});

    auto report = FormatCallReport("screenshot", result);
    CHECK(report ==
          "Tool: screenshot (IsError: false)\n"
          "Content block 1/1: image (image/jpeg, 4096 encoded bytes)\n"
          R"(    raw: {"data":"<4096 bytes elided>","mimeType":"image/jpeg","type":"image"})" "\n"
          "    mimeType: image/jpeg\n"
          "    encodedBytes: 4096\n");
}

TEST_CASE("FormatCallReport: mixed blocks are numbered", "[cli][report]") {
    CallResult result;
    result.content.push_back(TextContent{"ok"});
    result.content.push_back(ImageContent{"image/png", 8});
    result.content.push_back(
        UnknownContent{"audio", nlohmann::json{{"type", "audio"}, {"data", "AAAA"}}});

    auto report = FormatCallReport("mixed", result);
    CHECK(report.find("Content block 1/3: text (2 bytes, 1 line)\n") != std::string::npos);
    CHECK(report.find("Content block 2/3: image (image/png, 8 encoded bytes)\n") !=
          std::string::npos);
    CHECK(report.find("Content block 3/3: unrecognized content type \"audio\"\n") !=
          std::string::npos);
    CHECK(report.find(R"(    raw: {"data":"AAAA","type":"audio"})" "\n") != std::string::npos);
    CHECK(report.find("    \"type\": \"audio\"") != std::string::npos);
}

TEST_CASE("FormatCallReport: raw line of a parsed image hides the payload", "[cli][report]") {
    CallResult result;
    result.content.push_back(ParseContentBlock(nlohmann::json{
        {"type", "image"}, {"mimeType", "image/png"}, {"data", "iVBORw0KGgo="},
        {"annotations", {{"priority", 1}}}}));

    auto report = FormatCallReport("screenshot", result);
    const std::string raw_line =
        R"(    raw: {"annotations":{"priority":1},"data":"<12 bytes elided>",)"
        R"("mimeType":"image/png","type":"image"})"
        "\n";
    CHECK(report.find(raw_line) != std::string::npos);
    CHECK(report.find("iVBORw0KGgo=") == std::string::npos);
}
