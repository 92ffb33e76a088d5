#include "pool_json.hpp"
#include "errors.hpp"
#include "wide_math.hpp"

#include <boost/json/src.hpp>
#include <limits>

namespace multiswap {

uint32_t uint32_from_json(const json::value& value, const char* what) {
    int64_t v = 0;
    if (value.is_int64()) {
        v = value.as_int64();
    } else if (value.is_uint64() && value.as_uint64() <= std::numeric_limits<uint32_t>::max()) {
        v = static_cast<int64_t>(value.as_uint64());
    } else {
        throw InputError(ErrorCode::InvalidNumber, std::string(what) + " must be an integer");
    }
    if (v < 0 || v > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw InputError(ErrorCode::InvalidNumber, std::string(what) + " out of range");
    }
    return static_cast<uint32_t>(v);
}

json::value balance_to_json(const Balance& value) {
    return json::value(value.str());
}

Balance balance_from_json(const json::value& value) {
    if (value.is_string()) {
        return WideMath::parse_balance(value.as_string().c_str());
    }
    if (value.is_uint64()) {
        return Balance(value.as_uint64());
    }
    if (value.is_int64() && value.as_int64() >= 0) {
        return Balance(static_cast<uint64_t>(value.as_int64()));
    }
    throw InputError(ErrorCode::InvalidNumber, "balance must be a decimal string or non-negative integer");
}

json::array balances_to_json(const std::vector<Balance>& values) {
    json::array arr;
    arr.reserve(values.size());
    for (const auto& v : values) arr.push_back(balance_to_json(v));
    return arr;
}

std::vector<Balance> balances_from_json(const json::value& value) {
    if (!value.is_array()) {
        throw InputError(ErrorCode::InvalidNumber, "expected an array of balances");
    }
    std::vector<Balance> out;
    out.reserve(value.as_array().size());
    for (const auto& v : value.as_array()) out.push_back(balance_from_json(v));
    return out;
}

json::object state_to_json(const PoolState& state) {
    json::array tokens;
    for (const auto& t : state.tokens) tokens.push_back(json::value(t));

    json::object obj;
    obj["id"] = state.id;
    obj["tokens"] = tokens;
    obj["reserves"] = balances_to_json(state.reserves);
    obj["fee"] = state.fee;
    obj["total_shares"] = balance_to_json(state.total_shares);
    return obj;
}

PoolState state_from_json(const json::value& value) {
    if (!value.is_object()) {
        throw StateError(ErrorCode::CorruptState, "pool state must be an object");
    }
    const auto& obj = value.as_object();

    PoolState state;
    state.id = uint32_from_json(obj.at("id"), "id");
    state.fee = uint32_from_json(obj.at("fee"), "fee");

    const auto& tokens = obj.at("tokens");
    if (!tokens.is_array()) {
        throw StateError(ErrorCode::CorruptState, "tokens must be an array");
    }
    for (const auto& t : tokens.as_array()) {
        if (!t.is_string()) {
            throw StateError(ErrorCode::CorruptState, "token id must be a string");
        }
        state.tokens.emplace_back(t.as_string().c_str());
    }

    state.reserves = balances_from_json(obj.at("reserves"));
    state.total_shares = balance_from_json(obj.at("total_shares"));
    return state;
}

json::object shares_to_json(const MemoryBalanceStore& store, const std::string& prefix) {
    json::object obj;
    for (const auto& [key, value] : store.entries(prefix)) {
        obj[key.substr(prefix.size())] = balance_to_json(value);
    }
    return obj;
}

json::object transfer_to_json(const TransferRequest& req) {
    json::object obj;
    obj["recipient"] = req.recipient;
    obj["token"] = req.token;
    obj["amount"] = balance_to_json(req.amount);
    obj["gas"] = req.gas;
    obj["attached_deposit"] = balance_to_json(req.attached_deposit);
    return obj;
}

std::string json_string(const json::value& value) {
    if (!value.is_string()) {
        throw InputError(ErrorCode::InvalidNumber, "expected a string, got " + json::serialize(value));
    }
    return value.as_string().c_str();
}

} // namespace multiswap
