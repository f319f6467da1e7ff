#pragma once

#include "domain/pair_data/LinearPairData.hpp"
#include "domain/pair_data/PhantomStablePairData.hpp"
#include "domain/pair_data/StablePairData.hpp"
#include "domain/pair_data/WeightedPairData.hpp"

#include <variant>

namespace pda::domain {

using PairData = std::variant<WeightedPairData, StablePairData, MetaStablePairData,
                              PhantomStablePairData, LinearPairData>;

} // namespace pda::domain
