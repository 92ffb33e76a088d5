#ifndef MULTISWAP_STORAGE_HPP
#define MULTISWAP_STORAGE_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace multiswap {

// Durable key -> balance map owned by the host. The pool keeps its share
// ledger here; several pools may share one store under distinct prefixes.
class BalanceStore {
public:
    virtual ~BalanceStore() = default;
    virtual std::optional<Balance> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const Balance& value) = 0;
    // Returns false when the key was absent.
    virtual bool erase(const std::string& key) = 0;
};

class MemoryBalanceStore : public BalanceStore {
public:
    std::optional<Balance> get(const std::string& key) const override;
    void set(const std::string& key, const Balance& value) override;
    bool erase(const std::string& key) override;

    // Entries whose key starts with prefix, ordered by key.
    std::vector<std::pair<std::string, Balance>> entries(const std::string& prefix = "") const;

    size_t size() const { return values_.size(); }

private:
    std::map<std::string, Balance> values_;
};

} // namespace multiswap

#endif // MULTISWAP_STORAGE_HPP
