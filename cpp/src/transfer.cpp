#include "transfer.hpp"

#include <utility>

namespace multiswap {

void RecordingTransfer::request_transfer(const AccountId& recipient,
                                         const TokenId& token,
                                         const Balance& amount) {
    TransferRequest req;
    req.recipient = recipient;
    req.token = token;
    req.amount = amount;
    requests_.push_back(std::move(req));
}

std::vector<TransferRequest> RecordingTransfer::drain() {
    std::vector<TransferRequest> out;
    out.swap(requests_);
    return out;
}

} // namespace multiswap
