#ifndef MULTISWAP_POOL_JSON_HPP
#define MULTISWAP_POOL_JSON_HPP

#include <boost/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "pool.hpp"
#include "storage.hpp"
#include "transfer.hpp"

namespace multiswap {

namespace json = boost::json;

// Balances travel as decimal strings; JSON numbers cannot hold 128 bits.
json::value balance_to_json(const Balance& value);
// Accepts a decimal string or a non-negative JSON integer.
Balance balance_from_json(const json::value& value);

// Non-negative integer that fits in 32 bits (pool id, fee).
uint32_t uint32_from_json(const json::value& value, const char* what);

json::array balances_to_json(const std::vector<Balance>& values);
std::vector<Balance> balances_from_json(const json::value& value);

json::object state_to_json(const PoolState& state);
PoolState state_from_json(const json::value& value);

// Share ledger entries of one pool, keyed by account.
json::object shares_to_json(const MemoryBalanceStore& store, const std::string& prefix);

json::object transfer_to_json(const TransferRequest& req);

std::string json_string(const json::value& value);

} // namespace multiswap

#endif // MULTISWAP_POOL_JSON_HPP
