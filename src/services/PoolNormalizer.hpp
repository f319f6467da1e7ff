#pragma once

#include "domain/Result.hpp"
#include "domain/aggregates/Pool.hpp"
#include "domain/records/RawPool.hpp"

namespace pda::services {

class PoolNormalizer {
public:
    // Raw indexer record -> canonical pool with every number as a scaled
    // integer. All or nothing: any failing field fails the whole pool.
    domain::Result<domain::Pool> normalize(const domain::RawPool& raw) const;
};

} // namespace pda::services
