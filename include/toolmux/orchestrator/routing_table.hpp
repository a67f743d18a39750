#pragma once

#include <map>
#include <optional>
#include <string>

namespace toolmux {

// ---------------------------------------------------------------------------
// RoutingTable — tool name -> owning endpoint alias.
//
// Assign overwrites: when two endpoints expose the same tool name the last
// one assigned owns it.
// ---------------------------------------------------------------------------
class RoutingTable {
public:
    /// Returns the previous owner when the entry was overwritten by a
    /// different endpoint.
    std::optional<std::string> Assign(const std::string& tool_name,
                                      const std::string& endpoint);

    [[nodiscard]] std::optional<std::string> Resolve(const std::string& tool_name) const;

    /// Drops every entry owned by `endpoint`; returns how many were dropped.
    size_t RemoveEndpoint(const std::string& endpoint);

    void Clear() { entries_.clear(); }

    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const std::map<std::string, std::string>& Entries() const noexcept {
        return entries_;
    }

private:
    std::map<std::string, std::string> entries_;
};

} // namespace toolmux
