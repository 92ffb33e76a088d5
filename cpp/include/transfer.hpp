#pragma once

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace multiswap {

// Gas attached to every outbound fungible-token transfer.
constexpr uint64_t GAS_FOR_FT_TRANSFER = 10000000000000ULL;

struct TransferRequest {
    AccountId recipient;
    TokenId token;
    Balance amount{0};
    uint64_t gas{GAS_FOR_FT_TRANSFER};
    Balance attached_deposit{0};
};

// One-way outbound transfer. The pool never observes the outcome.
class TokenTransfer {
public:
    virtual ~TokenTransfer() = default;
    virtual void request_transfer(const AccountId& recipient,
                                  const TokenId& token,
                                  const Balance& amount) = 0;
};

// Queues requests for the host to deliver after the call returns.
class RecordingTransfer : public TokenTransfer {
public:
    void request_transfer(const AccountId& recipient,
                          const TokenId& token,
                          const Balance& amount) override;

    const std::vector<TransferRequest>& requests() const { return requests_; }

    // Hands the queued requests to the caller and clears the queue.
    std::vector<TransferRequest> drain();

private:
    std::vector<TransferRequest> requests_;
};

} // namespace multiswap
