#include "pool.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace multiswap {

namespace {

bool trace_enabled() {
    static const bool trace = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");
    return trace;
}

std::string join(const std::vector<Balance>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += values[i].str();
    }
    return out + "]";
}

} // namespace

Pool::Pool(uint32_t id,
           std::vector<TokenId> tokens,
           uint32_t fee,
           BalanceStore& store,
           TokenTransfer& transfer)
    : id_(id),
      tokens_(std::move(tokens)),
      fee_(fee),
      share_prefix_("s" + std::to_string(id) + ":"),
      store_(&store),
      transfer_(&transfer) {
    if (fee_ >= FEE_DENOMINATOR) {
        throw ConfigurationError(ErrorCode::FeeTooLarge, "fee too large");
    }
    if (tokens_.size() >= MAX_TOKENS) {
        throw ConfigurationError(ErrorCode::TooManyTokens, "too many tokens");
    }
    if (tokens_.size() < MIN_TOKENS) {
        throw ConfigurationError(ErrorCode::TooFewTokens, "need at least two tokens");
    }
    for (size_t i = 0; i < tokens_.size(); ++i) {
        for (size_t j = i + 1; j < tokens_.size(); ++j) {
            if (tokens_[i] == tokens_[j]) {
                throw InputError(ErrorCode::DuplicateToken, "duplicate token " + tokens_[i]);
            }
        }
    }
    reserves_.assign(tokens_.size(), Balance(0));
}

Pool Pool::restore(const PoolState& state, BalanceStore& store, TokenTransfer& transfer) {
    Pool pool(state.id, state.tokens, state.fee, store, transfer);

    if (state.reserves.size() != pool.tokens_.size()) {
        throw InputError(ErrorCode::TokenCountMismatch, "reserve count does not match token count");
    }
    const bool any_zero = std::any_of(state.reserves.begin(), state.reserves.end(),
                                      [](const Balance& r) { return r == 0; });
    const bool all_zero = std::all_of(state.reserves.begin(), state.reserves.end(),
                                      [](const Balance& r) { return r == 0; });
    if (state.total_shares == 0 ? !all_zero : any_zero) {
        throw StateError(ErrorCode::CorruptState, "reserves inconsistent with total shares");
    }

    pool.reserves_ = state.reserves;
    pool.total_shares_ = state.total_shares;
    return pool;
}

std::string Pool::share_key(const AccountId& account) const {
    return share_prefix_ + account;
}

Balance Pool::shares_of(const AccountId& account) const {
    auto held = store_->get(share_key(account));
    return held ? *held : Balance(0);
}

PoolState Pool::state() const {
    PoolState s;
    s.id = id_;
    s.tokens = tokens_;
    s.reserves = reserves_;
    s.fee = fee_;
    s.total_shares = total_shares_;
    return s;
}

size_t Pool::token_index(const TokenId& token) const {
    auto it = std::find(tokens_.begin(), tokens_.end(), token);
    if (it == tokens_.end()) {
        throw InputError(ErrorCode::UnknownToken, "token not in pool: " + token);
    }
    return static_cast<size_t>(it - tokens_.begin());
}

// ---------------------------- add_liquidity ----------------------------------

Balance Pool::add_liquidity(const AccountId& provider, const std::vector<Balance>& amounts) {
    if (amounts.size() != tokens_.size()) {
        throw InputError(ErrorCode::TokenCountMismatch, "wrong token count");
    }
    // Applies to the first deposit too: an empty pool is not bootstrapped
    // with a zero reserve, which would leave shares backed by nothing.
    for (const auto& amount : amounts) {
        if (amount == 0) {
            throw InputError(ErrorCode::ZeroAmount, "amount zero");
        }
    }

    std::vector<Balance> new_reserves(reserves_.size());
    Balance minted = 0;

    if (total_shares_ > 0) {
        const Wide supply(total_shares_);

        // Limiting reagent: the least generous token decides the mint.
        Wide fair_supply = WideMath::mul_div(Wide(amounts[0]), supply, Wide(reserves_[0]));
        for (size_t i = 1; i < tokens_.size(); ++i) {
            Wide candidate = WideMath::mul_div(Wide(amounts[i]), supply, Wide(reserves_[i]));
            if (candidate < fair_supply) fair_supply = candidate;
        }
        if (fair_supply == 0) {
            throw InputError(ErrorCode::ZeroAmount, "deposit too small to mint shares");
        }
        minted = WideMath::to_balance(fair_supply);

        for (size_t i = 0; i < tokens_.size(); ++i) {
            Balance pulled = WideMath::to_balance(
                WideMath::mul_div(Wide(reserves_[i]), fair_supply, supply)
            );
            if (pulled == 0) {
                throw InputError(ErrorCode::ZeroAmount,
                                 "deposit too small to back shares in " + tokens_[i]);
            }
            new_reserves[i] = WideMath::checked_add(reserves_[i], pulled);
        }
    } else {
        // Empty pool: the provider's ratio becomes the opening price. Amounts
        // are taken as given, all nonzero per the check above.
        new_reserves = amounts;
        minted = INIT_SHARES_SUPPLY();
    }

    const Balance new_total = WideMath::checked_add(total_shares_, minted);
    const Balance new_held = WideMath::checked_add(shares_of(provider), minted);

    // Commit
    reserves_ = std::move(new_reserves);
    total_shares_ = new_total;
    store_->set(share_key(provider), new_held);

    if (trace_enabled()) {
        std::cout << "TRACE add_liquidity pool=" << id_
                  << " provider=" << provider
                  << " minted=" << minted.str()
                  << " reserves=" << join(reserves_)
                  << " total_shares=" << total_shares_.str()
                  << "\n";
    }
    return minted;
}

// --------------------------- remove_liquidity --------------------------------

std::vector<Balance> Pool::remove_liquidity(const AccountId& provider,
                                            const Balance& shares,
                                            const std::vector<Balance>& min_amounts) {
    const std::string key = share_key(provider);
    auto held = store_->get(key);
    if (!held) {
        throw StateError(ErrorCode::NoShares, "no shares");
    }
    if (*held < shares) {
        throw StateError(ErrorCode::InsufficientShares, "not enough shares");
    }
    if (min_amounts.size() != tokens_.size()) {
        throw InputError(ErrorCode::TokenCountMismatch, "wrong token count");
    }

    std::vector<Balance> withdrawn(tokens_.size());
    for (size_t i = 0; i < tokens_.size(); ++i) {
        withdrawn[i] = WideMath::to_balance(
            WideMath::mul_div(Wide(reserves_[i]), Wide(shares), Wide(total_shares_))
        );
        if (withdrawn[i] < min_amounts[i]) {
            throw EconomicGuaranteeError(
                ErrorCode::MinAmountNotMet,
                "withdrawal of " + tokens_[i] + " below minimum"
            );
        }
    }

    std::vector<Balance> new_reserves(reserves_.size());
    for (size_t i = 0; i < tokens_.size(); ++i) {
        new_reserves[i] = WideMath::checked_sub(reserves_[i], withdrawn[i]);
    }
    const Balance new_total = WideMath::checked_sub(total_shares_, shares);
    const Balance remaining = *held - shares;

    // Commit
    reserves_ = std::move(new_reserves);
    total_shares_ = new_total;
    if (remaining == 0) {
        store_->erase(key);
    } else {
        store_->set(key, remaining);
    }

    if (trace_enabled()) {
        std::cout << "TRACE remove_liquidity pool=" << id_
                  << " provider=" << provider
                  << " burned=" << shares.str()
                  << " withdrawn=" << join(withdrawn)
                  << " total_shares=" << total_shares_.str()
                  << "\n";
    }
    return withdrawn;
}

// ------------------------------- quote ---------------------------------------

Balance Pool::quote(const TokenId& token_in, const Balance& amount_in, const TokenId& token_out) const {
    return quote_by_index(token_index(token_in), amount_in, token_index(token_out));
}

Balance Pool::quote_by_index(size_t token_in, const Balance& amount_in, size_t token_out) const {
    if (token_in >= tokens_.size() || token_out >= tokens_.size()) {
        throw InputError(ErrorCode::UnknownToken, "token index out of range");
    }
    if (token_in == token_out) {
        throw InputError(ErrorCode::InvalidPair, "same token on both sides");
    }
    if (amount_in == 0) {
        throw InputError(ErrorCode::ZeroAmount, "amount zero");
    }
    if (reserves_[token_in] == 0 || reserves_[token_out] == 0) {
        throw StateError(ErrorCode::EmptyReserve, "empty reserve");
    }

    const Wide in_balance(reserves_[token_in]);
    const Wide out_balance(reserves_[token_out]);
    const Wide amount_with_fee = Wide(amount_in) * (FEE_DENOMINATOR - fee_);

    return WideMath::to_balance(WideMath::mul_div(
        amount_with_fee,
        out_balance,
        Wide(FEE_DENOMINATOR) * in_balance + amount_with_fee
    ));
}

// ------------------------------- swap ----------------------------------------

Balance Pool::swap(const AccountId& sender,
                   const TokenId& token_in,
                   const Balance& amount_in,
                   const TokenId& token_out,
                   const Balance& min_amount_out) {
    const size_t in_idx = token_index(token_in);
    const size_t out_idx = token_index(token_out);

    const Balance amount_out = quote_by_index(in_idx, amount_in, out_idx);
    if (amount_out < min_amount_out) {
        throw EconomicGuaranteeError(ErrorCode::MinAmountNotMet, "slippage");
    }

    const Balance new_in = WideMath::checked_add(reserves_[in_idx], amount_in);
    const Balance new_out = WideMath::checked_sub(reserves_[out_idx], amount_out);

    // Commit. The transfer outcome is not observed; reserves stay committed.
    reserves_[in_idx] = new_in;
    reserves_[out_idx] = new_out;
    transfer_->request_transfer(sender, tokens_[out_idx], amount_out);

    if (trace_enabled()) {
        std::cout << "TRACE swap pool=" << id_
                  << " sender=" << sender
                  << " in=" << token_in << ":" << amount_in.str()
                  << " out=" << token_out << ":" << amount_out.str()
                  << " reserves=" << join(reserves_)
                  << "\n";
    }
    return amount_out;
}

} // namespace multiswap
