#pragma once

#include "domain/value_objects/FixedPoint.hpp"

namespace pda::domain {

// Weighted-pool pricing only looks at the two traded tokens.
struct WeightedPairData {
    uint256 balance_in;
    uint256 balance_out;
    uint256 weight_in;
    uint256 weight_out;
    uint256 fee;
    uint256 scaling_factor_in;
    uint256 scaling_factor_out;
};

} // namespace pda::domain
