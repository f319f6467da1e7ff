#pragma once

#include "domain/pair_data/PhantomStablePairData.hpp"

namespace pda::domain {

struct LinearPairData : PhantomStablePairData {
    int main_index = 0;
    int wrapped_index = 0;
    uint256 lower_target;
    uint256 upper_target;
};

} // namespace pda::domain
