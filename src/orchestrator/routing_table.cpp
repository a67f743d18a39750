#include <toolmux/orchestrator/routing_table.hpp>

namespace toolmux {

std::optional<std::string> RoutingTable::Assign(const std::string& tool_name,
                                                const std::string& endpoint) {
    auto [it, inserted] = entries_.emplace(tool_name, endpoint);
    if (inserted) {
        return std::nullopt;
    }
    std::optional<std::string> previous;
    if (it->second != endpoint) {
        previous = it->second;
    }
    it->second = endpoint;
    return previous;
}

std::optional<std::string> RoutingTable::Resolve(const std::string& tool_name) const {
    auto it = entries_.find(tool_name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t RoutingTable::RemoveEndpoint(const std::string& endpoint) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second == endpoint) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace toolmux
