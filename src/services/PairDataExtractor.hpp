#pragma once

#include "domain/Result.hpp"
#include "domain/aggregates/Pool.hpp"
#include "domain/pair_data/PairData.hpp"

#include <string_view>

namespace pda::services {

// Pulls from a canonical pool the fields a swap formula needs for one
// token pair. Token positions always refer to pool.tokens() order.
//
// Every method fails with InvalidAddress for a malformed token identifier
// and TokenNotFound when either token is not in the pool. A pair with
// token_in == token_out is passed through.
class PairDataExtractor {
public:
    // Fails with WrongPoolType when the pool carries no total weight.
    domain::Result<domain::WeightedPairData> weighted(
        const domain::Pool& pool, std::string_view token_in, std::string_view token_out) const;

    domain::Result<domain::StablePairData> stable(
        const domain::Pool& pool, std::string_view token_in, std::string_view token_out) const;

    domain::Result<domain::MetaStablePairData> meta_stable(
        const domain::Pool& pool, std::string_view token_in, std::string_view token_out) const;

    domain::Result<domain::PhantomStablePairData> phantom_stable(
        const domain::Pool& pool, std::string_view token_in, std::string_view token_out) const;

    domain::Result<domain::LinearPairData> linear(
        const domain::Pool& pool, std::string_view token_in, std::string_view token_out) const;

    // Picks the extractor from pool.kind(). Unknown kinds fail with WrongPoolType.
    domain::Result<domain::PairData> extract(
        const domain::Pool& pool, std::string_view token_in, std::string_view token_out) const;
};

} // namespace pda::services
