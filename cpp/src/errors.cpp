#include "errors.hpp"

namespace multiswap {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::FeeTooLarge:        return "FeeTooLarge";
        case ErrorCode::TooManyTokens:      return "TooManyTokens";
        case ErrorCode::TooFewTokens:       return "TooFewTokens";
        case ErrorCode::TokenCountMismatch: return "TokenCountMismatch";
        case ErrorCode::ZeroAmount:         return "ZeroAmount";
        case ErrorCode::UnknownToken:       return "UnknownToken";
        case ErrorCode::DuplicateToken:     return "DuplicateToken";
        case ErrorCode::InvalidPair:        return "InvalidPair";
        case ErrorCode::InvalidNumber:      return "InvalidNumber";
        case ErrorCode::MinAmountNotMet:    return "MinAmountNotMet";
        case ErrorCode::NoShares:           return "NoShares";
        case ErrorCode::InsufficientShares: return "InsufficientShares";
        case ErrorCode::EmptyReserve:       return "EmptyReserve";
        case ErrorCode::CorruptState:       return "CorruptState";
        case ErrorCode::Overflow:           return "Overflow";
        case ErrorCode::Underflow:          return "Underflow";
        case ErrorCode::DivisionByZero:     return "DivisionByZero";
    }
    return "Unknown";
}

} // namespace multiswap
