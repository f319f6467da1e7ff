#pragma once

#include "domain/value_objects/FixedPoint.hpp"

#include <vector>

namespace pda::domain {

// The stable invariant runs over every balance in the pool, so the whole
// vector travels with the pair indices.
struct StablePairData {
    uint256 amp;
    std::vector<uint256> balances;
    int token_index_in = 0;
    int token_index_out = 0;
    uint256 fee;
    std::vector<uint256> scaling_factors;
};

// Same shape; scaling factors include each token's price rate.
struct MetaStablePairData : StablePairData {};

} // namespace pda::domain
