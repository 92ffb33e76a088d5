#include "wide_math.hpp"
#include "errors.hpp"

#include <cctype>

namespace multiswap {

namespace {

const Wide2& max_wide() {
    static const Wide2 v = (Wide2(1) << 256) - 1;
    return v;
}

// 2^128 - 1 has 39 decimal digits; anything longer is out of range
// whatever its value.
constexpr size_t MAX_BALANCE_DIGITS = 39;

} // namespace

const Wide& WideMath::max_balance() {
    static const Wide v = (Wide(1) << 128) - 1;
    return v;
}

Wide WideMath::mul_div(const Wide& a, const Wide& b, const Wide& c) {
    if (c == 0) {
        throw ArithmeticError(ErrorCode::DivisionByZero, "division by zero");
    }
    Wide2 q = Wide2(a) * Wide2(b) / Wide2(c);
    if (q > max_wide()) {
        throw ArithmeticError(ErrorCode::Overflow, "mul_div result above 256 bits");
    }
    return static_cast<Wide>(q);
}

Balance WideMath::to_balance(const Wide& value) {
    if (value > max_balance()) {
        throw ArithmeticError(
            ErrorCode::Overflow,
            "value " + value.str() + " does not fit in 128 bits"
        );
    }
    return static_cast<Balance>(value);
}

Balance WideMath::checked_add(const Balance& a, const Balance& b) {
    return to_balance(Wide(a) + Wide(b));
}

Balance WideMath::checked_sub(const Balance& a, const Balance& b) {
    if (b > a) {
        throw ArithmeticError(
            ErrorCode::Underflow,
            "cannot subtract " + b.str() + " from " + a.str()
        );
    }
    return a - b;
}

Balance WideMath::parse_balance(const std::string& text) {
    if (text.empty()) {
        throw InputError(ErrorCode::InvalidNumber, "empty number");
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw InputError(ErrorCode::InvalidNumber, "not a decimal number: " + text);
        }
    }
    // Boost reads a leading 0 as an octal prefix; keep the digits decimal.
    const size_t first = text.find_first_not_of('0');
    const std::string digits = first == std::string::npos ? "0" : text.substr(first);
    if (digits.size() > MAX_BALANCE_DIGITS) {
        throw InputError(ErrorCode::InvalidNumber, "number out of range: " + text);
    }
    Wide v(digits);
    if (v > max_balance()) {
        throw InputError(ErrorCode::InvalidNumber, "number out of range: " + text);
    }
    return static_cast<Balance>(v);
}

} // namespace multiswap
