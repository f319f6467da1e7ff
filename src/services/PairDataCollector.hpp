#pragma once

#include "domain/Result.hpp"
#include "domain/pair_data/PairData.hpp"
#include "services/IPoolSource.hpp"
#include "services/PairDataExtractor.hpp"
#include "services/PoolNormalizer.hpp"

#include <string>
#include <vector>

namespace pda::services {

struct PoolPairData {
    std::string pool_id;
    std::string pool_type;
    domain::PairData data;
};

struct SkippedPool {
    std::string pool_id;
    domain::Error error;
};

struct CollectionReport {
    std::vector<PoolPairData> pairs;
    std::vector<SkippedPool> skipped;
    size_t unmatched = 0;   // pools not holding both tokens
};

// Runs normalization and extraction over every pool a source returns.
// A pool that cannot serve the pair is skipped; the batch carries on.
class PairDataCollector {
public:
    explicit PairDataCollector(IPoolSource& source, bool include_disabled = false);

    // Fails only when token_in or token_out is not a valid address.
    domain::Result<CollectionReport> collect(const std::string& token_in,
                                             const std::string& token_out) const;

private:
    IPoolSource& source_;
    bool include_disabled_;
    PoolNormalizer normalizer_;
    PairDataExtractor extractor_;
};

} // namespace pda::services
