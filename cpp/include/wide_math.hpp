#ifndef MULTISWAP_WIDE_MATH_HPP
#define MULTISWAP_WIDE_MATH_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <string>

#include "types.hpp"

namespace multiswap {

// Product of two Wide operands before the division in mul_div.
using Wide2 = boost::multiprecision::uint512_t;

class WideMath {
public:
    // floor(a * b / c). The product never wraps; a quotient that does not
    // fit in 256 bits raises ArithmeticError, as does c == 0.
    static Wide mul_div(const Wide& a, const Wide& b, const Wide& c);

    // Narrow back to the balance width, raising Overflow instead of wrapping.
    static Balance to_balance(const Wide& value);

    static Balance checked_add(const Balance& a, const Balance& b);
    static Balance checked_sub(const Balance& a, const Balance& b);

    // Decimal text -> Balance (configuration and JSON input).
    static Balance parse_balance(const std::string& text);

    static const Wide& max_balance();
};

inline std::string to_string(const Balance& value) {
    return value.str();
}

} // namespace multiswap

#endif // MULTISWAP_WIDE_MATH_HPP
