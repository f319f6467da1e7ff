#pragma once

#include "domain/Result.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <string>
#include <string_view>

namespace pda::domain {

using uint256 = boost::multiprecision::uint256_t;

namespace fixed_point {

constexpr int kPrecision = 18;        // fees, weights, rates, targets
constexpr int kAmpPrecision = 3;
constexpr int kMaxTokenDecimals = 18;
constexpr int kExtendedPrecision = 36;

uint256 pow10(int exponent);

// 10^18
const uint256& one();

// Decimal string -> integer scaled by 10^decimals. Trailing fractional
// zeros are ignored; any other fraction digit beyond `decimals` fails.
Result<uint256> parse_fixed(std::string_view text, int decimals);

std::string format_fixed(const uint256& value, int decimals);

// a * b / 10^18, rounded down. InvalidRecord when the result does not
// fit in 256 bits.
Result<uint256> mul_down_fixed(const uint256& a, const uint256& b);

// a * b / divisor, rounded down. DivisionByZero when divisor is zero,
// InvalidRecord on overflow.
Result<uint256> mul_div_down(const uint256& a, const uint256& b, const uint256& divisor);

// Multiplier taking a balance held at `decimals` precision to the
// 36-decimal precision used by the swap formulas: 10^(36 - decimals).
// Throws std::out_of_range for decimals outside [0, 18].
uint256 scaling_factor(int decimals);

} // namespace fixed_point

} // namespace pda::domain
