// Constant-product pool over N tokens with a proportional share ledger.
//
// Every operation validates and computes first, then commits; a call that
// throws leaves reserves, shares and total_shares as they were.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"
#include "storage.hpp"
#include "transfer.hpp"
#include "types.hpp"
#include "wide_math.hpp"

namespace multiswap {

// Snapshot handed to the host for persistence. Shares are not part of it:
// they already live in the host's BalanceStore.
struct PoolState {
    uint32_t id{0};
    std::vector<TokenId> tokens;
    std::vector<Balance> reserves;
    uint32_t fee{0};
    Balance total_shares{0};
};

class Pool {
public:
    Pool(uint32_t id,
         std::vector<TokenId> tokens,
         uint32_t fee,
         BalanceStore& store,
         TokenTransfer& transfer);

    // Rebuild a pool from a snapshot; store must hold its share ledger.
    static Pool restore(const PoolState& state, BalanceStore& store, TokenTransfer& transfer);

    // ------------------------ Views ------------------------
    uint32_t id() const { return id_; }
    const std::vector<TokenId>& tokens() const { return tokens_; }
    const std::vector<Balance>& reserves() const { return reserves_; }
    uint32_t fee() const { return fee_; }
    const Balance& total_shares() const { return total_shares_; }
    const std::string& share_prefix() const { return share_prefix_; }

    Balance shares_of(const AccountId& account) const;
    PoolState state() const;
    size_t token_index(const TokenId& token) const;

    // ------------------------ API ------------------------

    // add_liquidity: first deposit sets the opening price and mints
    // INIT_SHARES_SUPPLY; later deposits mint by the least generous token
    // ratio and pull only what that share count is backed by.
    Balance add_liquidity(const AccountId& provider, const std::vector<Balance>& amounts);

    // remove_liquidity: burn shares for a proportional slice of every reserve
    std::vector<Balance> remove_liquidity(const AccountId& provider,
                                          const Balance& shares,
                                          const std::vector<Balance>& min_amounts);

    // quote: output of a swap at current reserves, fee taken on input
    Balance quote(const TokenId& token_in, const Balance& amount_in, const TokenId& token_out) const;
    Balance quote_by_index(size_t token_in, const Balance& amount_in, size_t token_out) const;

    // swap: amount_in is assumed already received from sender
    Balance swap(const AccountId& sender,
                 const TokenId& token_in,
                 const Balance& amount_in,
                 const TokenId& token_out,
                 const Balance& min_amount_out);

private:
    std::string share_key(const AccountId& account) const;

    uint32_t id_;
    std::vector<TokenId> tokens_;
    std::vector<Balance> reserves_;
    uint32_t fee_;
    Balance total_shares_{0};
    std::string share_prefix_;

    BalanceStore* store_;
    TokenTransfer* transfer_;
};

} // namespace multiswap
