#ifndef MULTISWAP_ERRORS_HPP
#define MULTISWAP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace multiswap {

enum class ErrorCode {
    // construction
    FeeTooLarge,
    TooManyTokens,
    TooFewTokens,
    // caller input
    TokenCountMismatch,
    ZeroAmount,
    UnknownToken,
    DuplicateToken,
    InvalidPair,
    InvalidNumber,
    // slippage
    MinAmountNotMet,
    // pool / ledger state
    NoShares,
    InsufficientShares,
    EmptyReserve,
    CorruptState,
    // wide arithmetic
    Overflow,
    Underflow,
    DivisionByZero
};

const char* error_code_name(ErrorCode code);

// Every failure raised by the pool. All of them are raised before the
// pool state is touched.
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ConfigurationError : public PoolError {
public:
    using PoolError::PoolError;
};

class InputError : public PoolError {
public:
    using PoolError::PoolError;
};

class EconomicGuaranteeError : public PoolError {
public:
    using PoolError::PoolError;
};

class StateError : public PoolError {
public:
    using PoolError::PoolError;
};

class ArithmeticError : public PoolError {
public:
    using PoolError::PoolError;
};

} // namespace multiswap

#endif // MULTISWAP_ERRORS_HPP
