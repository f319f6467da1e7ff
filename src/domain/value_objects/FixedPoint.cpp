#include "domain/value_objects/FixedPoint.hpp"

#include <limits>
#include <stdexcept>

namespace pda::domain::fixed_point {

namespace {

using uint512 = boost::multiprecision::uint512_t;

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

Error invalid_number(std::string_view text, const std::string& reason) {
    return make_error(ErrorKind::InvalidRecord,
                      "Invalid decimal value '" + std::string(text) + "': " + reason);
}

Result<uint256> narrow(const uint512& wide) {
    if (wide > uint512(std::numeric_limits<uint256>::max())) {
        return make_error(ErrorKind::InvalidRecord, "Fixed-point result exceeds 256 bits");
    }
    return static_cast<uint256>(wide);
}

} // anonymous namespace

uint256 pow10(int exponent) {
    if (exponent < 0) {
        throw std::out_of_range("Negative power of ten: " + std::to_string(exponent));
    }
    uint256 result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

const uint256& one() {
    static const uint256 value = pow10(kPrecision);
    return value;
}

Result<uint256> parse_fixed(std::string_view text, int decimals) {
    if (decimals < 0) {
        return invalid_number(text, "negative decimals");
    }
    if (text.empty()) {
        return invalid_number(text, "empty string");
    }

    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view fraction = dot == std::string_view::npos
        ? std::string_view{}
        : text.substr(dot + 1);

    if (whole.empty() && fraction.empty()) {
        return invalid_number(text, "no digits");
    }
    for (char c : whole) {
        if (!is_digit(c)) return invalid_number(text, "unexpected character");
    }
    for (char c : fraction) {
        if (!is_digit(c)) return invalid_number(text, "unexpected character");
    }

    while (!fraction.empty() && fraction.back() == '0') {
        fraction.remove_suffix(1);
    }
    if (static_cast<int>(fraction.size()) > decimals) {
        return invalid_number(text, "fractional component exceeds decimals");
    }

    const uint256 max = std::numeric_limits<uint256>::max();
    uint256 value = 0;
    auto push_digit = [&](unsigned digit) -> bool {
        if (value > (max - digit) / 10) return false;
        value = value * 10 + digit;
        return true;
    };

    for (char c : whole) {
        if (!push_digit(static_cast<unsigned>(c - '0'))) {
            return invalid_number(text, "value exceeds 256 bits");
        }
    }
    for (char c : fraction) {
        if (!push_digit(static_cast<unsigned>(c - '0'))) {
            return invalid_number(text, "value exceeds 256 bits");
        }
    }
    for (int i = static_cast<int>(fraction.size()); i < decimals; ++i) {
        if (!push_digit(0)) {
            return invalid_number(text, "value exceeds 256 bits");
        }
    }
    return value;
}

std::string format_fixed(const uint256& value, int decimals) {
    std::string digits = value.str();
    if (decimals <= 0) return digits;

    auto width = static_cast<std::size_t>(decimals);
    if (digits.size() <= width) {
        digits.insert(0, width + 1 - digits.size(), '0');
    }
    std::string whole = digits.substr(0, digits.size() - width);
    std::string fraction = digits.substr(digits.size() - width);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return fraction.empty() ? whole + ".0" : whole + "." + fraction;
}

Result<uint256> mul_down_fixed(const uint256& a, const uint256& b) {
    uint512 product = uint512(a) * uint512(b);
    return narrow(product / uint512(one()));
}

Result<uint256> mul_div_down(const uint256& a, const uint256& b, const uint256& divisor) {
    if (divisor == 0) {
        return make_error(ErrorKind::DivisionByZero, "Division by zero");
    }
    uint512 product = uint512(a) * uint512(b);
    return narrow(product / uint512(divisor));
}

uint256 scaling_factor(int decimals) {
    if (decimals < 0 || decimals > kMaxTokenDecimals) {
        throw std::out_of_range(
            "Token decimals must be between 0 and 18, got: " + std::to_string(decimals));
    }
    return pow10(kExtendedPrecision - decimals);
}

} // namespace pda::domain::fixed_point
