#include "storage.hpp"

namespace multiswap {

std::optional<Balance> MemoryBalanceStore::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryBalanceStore::set(const std::string& key, const Balance& value) {
    values_[key] = value;
}

bool MemoryBalanceStore::erase(const std::string& key) {
    return values_.erase(key) > 0;
}

std::vector<std::pair<std::string, Balance>>
MemoryBalanceStore::entries(const std::string& prefix) const {
    std::vector<std::pair<std::string, Balance>> out;
    for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.emplace_back(it->first, it->second);
    }
    return out;
}

} // namespace multiswap
