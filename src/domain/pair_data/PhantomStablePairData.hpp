#pragma once

#include "domain/pair_data/StablePairData.hpp"
#include "domain/value_objects/Address.hpp"

#include <vector>

namespace pda::domain {

constexpr int kIndexNotFound = -1;

struct PhantomStablePairData : StablePairData {
    std::vector<Address> tokens;       // pool tokensList, pool share token included
    int bpt_index = kIndexNotFound;    // position of the pool's own share token
};

} // namespace pda::domain
