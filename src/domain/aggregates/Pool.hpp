#pragma once

#include "domain/value_objects/Address.hpp"
#include "domain/value_objects/FixedPoint.hpp"
#include "domain/value_objects/PoolKind.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pda::domain {

struct Token {
    Address address;
    uint256 balance;            // at the token's own decimals
    int decimals;
    uint256 price_rate;         // 18 decimals
    std::optional<uint256> weight;  // 18 decimals, fraction of total weight

    uint256 weight_or_zero() const { return weight.value_or(uint256(0)); }
};

// Fields only some pool kinds carry. Absent stays absent here; the Pool
// accessors read absent as zero.
struct VariantFields {
    std::optional<uint256> total_weight;   // 18 decimals
    std::optional<uint256> amp;            // 3 decimals
    std::optional<int> main_index;
    std::optional<int> wrapped_index;
    std::optional<uint256> lower_target;   // 18 decimals
    std::optional<uint256> upper_target;   // 18 decimals
};

class Pool {
public:
    Pool(std::string id, Address address, std::string pool_type,
         uint256 swap_fee, bool swap_enabled,
         std::vector<Token> tokens, std::vector<Address> tokens_list,
         VariantFields fields);

    const std::string& id() const noexcept { return id_; }
    const Address& address() const noexcept { return address_; }
    const std::string& pool_type() const noexcept { return pool_type_; }
    PoolKind kind() const noexcept { return kind_; }
    const uint256& swap_fee() const noexcept { return swap_fee_; }
    bool swap_enabled() const noexcept { return swap_enabled_; }
    const std::vector<Token>& tokens() const noexcept { return tokens_; }
    const std::vector<Address>& tokens_list() const noexcept { return tokens_list_; }
    const VariantFields& variant_fields() const noexcept { return fields_; }

    uint256 total_weight() const;
    uint256 amp() const;
    int main_index() const;
    int wrapped_index() const;
    uint256 lower_target() const;
    uint256 upper_target() const;

    // Position in tokens(), if present.
    std::optional<int> find_token(const Address& token) const;
    // Position in tokens_list(), if present.
    std::optional<int> find_in_tokens_list(const Address& token) const;

private:
    std::string id_;
    Address address_;
    std::string pool_type_;
    PoolKind kind_;
    uint256 swap_fee_;
    bool swap_enabled_;
    std::vector<Token> tokens_;
    std::vector<Address> tokens_list_;
    VariantFields fields_;
};

} // namespace pda::domain
