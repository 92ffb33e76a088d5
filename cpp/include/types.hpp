#ifndef MULTISWAP_TYPES_HPP
#define MULTISWAP_TYPES_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace multiswap {

// Native balance width. Everything stored or returned is a Balance.
using Balance = boost::multiprecision::uint128_t;
// Intermediate width for cross-multiplication of two balances.
using Wide = boost::multiprecision::uint256_t;

using TokenId = std::string;
using AccountId = std::string;

constexpr uint32_t FEE_DENOMINATOR = 1000;
constexpr size_t MAX_TOKENS = 10;
constexpr size_t MIN_TOKENS = 2;

// Shares minted by the first deposit into an empty pool.
inline const Balance& INIT_SHARES_SUPPLY() {
    static const Balance v("1000000000000000000000");
    return v;
}

} // namespace multiswap

#endif // MULTISWAP_TYPES_HPP
