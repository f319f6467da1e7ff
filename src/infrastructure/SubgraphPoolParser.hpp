#pragma once

#include "domain/records/RawPool.hpp"

#include <string>
#include <vector>

namespace pda::infrastructure {

class SubgraphPoolParser {
public:
    // Parse indexer JSON into raw pool records. Accepts a bare array of
    // pools, {"pools": [...]}, or a GraphQL reply {"data": {"pools": [...]}}.
    // Throws std::invalid_argument for an unrecognized layout or a pool
    // missing a required field; nlohmann::json errors propagate for
    // malformed JSON.
    std::vector<domain::RawPool> parse(const std::string& json_str) const;
};

} // namespace pda::infrastructure
