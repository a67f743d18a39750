#pragma once

#include <toolmux/mcp/mcp_types.hpp>

#include <string>

namespace toolmux {

// ---------------------------------------------------------------------------
// Tool call report — deterministic multi-line text for one CallResult:
//
//   Tool: <name> (IsError: <true|false>)
//   Content block 1/N: <description>
//   <indent>raw: <block JSON, image data elided>
//   <indent>...block body...
//
// An empty result prints "(no content returned)" after the header. Text is
// re-indented line by line; images show their media type and encoded size
// only; unknown blocks are dumped as indented JSON. Never fails.
// ---------------------------------------------------------------------------
std::string FormatCallReport(const std::string& tool_name,
                             const CallResult& result,
                             const std::string& indent = "    ");

// One-line summary used as the block heading, e.g. `text (12 bytes, 1 line)`.
std::string DescribeContentBlock(const ContentBlock& block);

} // namespace toolmux
