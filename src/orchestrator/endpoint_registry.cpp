#include <toolmux/orchestrator/endpoint_registry.hpp>

#include <algorithm>

namespace toolmux {

bool EndpointRegistry::Add(EndpointRecord record) {
    if (Find(record.name) != nullptr) {
        return false;
    }
    records_.push_back(std::move(record));
    return true;
}

std::optional<EndpointRecord> EndpointRegistry::Remove(const std::string& name) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const EndpointRecord& r) { return r.name == name; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    EndpointRecord removed = std::move(*it);
    records_.erase(it);
    return removed;
}

EndpointRecord* EndpointRegistry::Find(const std::string& name) {
    for (auto& record : records_) {
        if (record.name == name) return &record;
    }
    return nullptr;
}

const EndpointRecord* EndpointRegistry::Find(const std::string& name) const {
    for (const auto& record : records_) {
        if (record.name == name) return &record;
    }
    return nullptr;
}

std::vector<std::string> EndpointRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(records_.size());
    for (const auto& record : records_) {
        names.push_back(record.name);
    }
    return names;
}

} // namespace toolmux
