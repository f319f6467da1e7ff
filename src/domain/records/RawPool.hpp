#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pda::domain {

// Pool record as delivered by the indexer: numbers are decimal strings,
// variant-specific fields may be missing.

struct RawToken {
    std::string address;
    std::string balance;
    int decimals = 18;
    std::optional<std::string> price_rate;
    std::optional<std::string> weight;
};

struct RawPool {
    std::string id;
    std::string address;
    std::string pool_type;
    std::string swap_fee;
    bool swap_enabled = true;
    std::vector<RawToken> tokens;
    std::vector<std::string> tokens_list;

    // Weighted
    std::optional<std::string> total_weight;
    // Stable family
    std::optional<std::string> amp;
    // Linear
    std::optional<int> main_index;
    std::optional<int> wrapped_index;
    std::optional<std::string> lower_target;
    std::optional<std::string> upper_target;
};

} // namespace pda::domain
