#pragma once

#include "domain/aggregates/Pool.hpp"
#include "domain/pair_data/PairData.hpp"

#include <nlohmann/json.hpp>

namespace pda::infrastructure {

// Scaled integers are written as decimal integer strings; indices as numbers.
nlohmann::json pool_to_json(const domain::Pool& pool);
nlohmann::json pair_data_to_json(const domain::PairData& data);

} // namespace pda::infrastructure
