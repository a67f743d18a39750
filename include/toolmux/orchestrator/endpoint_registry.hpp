#pragma once

#include <toolmux/mcp/i_mcp_session.hpp>
#include <toolmux/mcp/mcp_types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// EndpointRecord — one configured endpoint and what is known about it.
// ---------------------------------------------------------------------------
struct EndpointRecord {
    std::string name;
    std::unique_ptr<IMcpSession> session;
    std::vector<ToolDescriptor> tools;
    std::optional<InitializeResult> init_result;
};

// ---------------------------------------------------------------------------
// EndpointRegistry — endpoint records in configuration order.
//
// Entries are added at connect time and only ever removed afterwards (hard
// removal: a removed endpoint is invisible to every later stage). Not
// synchronized; the orchestrator mutates it from the caller thread only.
// ---------------------------------------------------------------------------
class EndpointRegistry {
public:
    EndpointRegistry() = default;

    EndpointRegistry(const EndpointRegistry&) = delete;
    EndpointRegistry& operator=(const EndpointRegistry&) = delete;

    /// Returns false (and keeps the existing entry) when the name is taken.
    bool Add(EndpointRecord record);

    /// Removes and returns the record, or nullopt if absent.
    std::optional<EndpointRecord> Remove(const std::string& name);

    [[nodiscard]] EndpointRecord* Find(const std::string& name);
    [[nodiscard]] const EndpointRecord* Find(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> Names() const;
    [[nodiscard]] size_t Size() const noexcept { return records_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return records_.empty(); }

    std::vector<EndpointRecord>::iterator begin() { return records_.begin(); }
    std::vector<EndpointRecord>::iterator end() { return records_.end(); }
    std::vector<EndpointRecord>::const_iterator begin() const { return records_.begin(); }
    std::vector<EndpointRecord>::const_iterator end() const { return records_.end(); }

private:
    std::vector<EndpointRecord> records_;
};

} // namespace toolmux
