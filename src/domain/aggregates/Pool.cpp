#include "domain/aggregates/Pool.hpp"

#include <algorithm>

namespace pda::domain {

Pool::Pool(std::string id, Address address, std::string pool_type,
           uint256 swap_fee, bool swap_enabled,
           std::vector<Token> tokens, std::vector<Address> tokens_list,
           VariantFields fields)
    : id_(std::move(id))
    , address_(std::move(address))
    , pool_type_(std::move(pool_type))
    , kind_(pool_kind_from_string(pool_type_))
    , swap_fee_(std::move(swap_fee))
    , swap_enabled_(swap_enabled)
    , tokens_(std::move(tokens))
    , tokens_list_(std::move(tokens_list))
    , fields_(std::move(fields)) {}

uint256 Pool::total_weight() const {
    return fields_.total_weight.value_or(uint256(0));
}

uint256 Pool::amp() const {
    return fields_.amp.value_or(uint256(0));
}

int Pool::main_index() const {
    return fields_.main_index.value_or(0);
}

int Pool::wrapped_index() const {
    return fields_.wrapped_index.value_or(0);
}

uint256 Pool::lower_target() const {
    return fields_.lower_target.value_or(uint256(0));
}

uint256 Pool::upper_target() const {
    return fields_.upper_target.value_or(uint256(0));
}

std::optional<int> Pool::find_token(const Address& token) const {
    auto it = std::find_if(tokens_.begin(), tokens_.end(),
                           [&](const Token& t) { return t.address == token; });
    if (it == tokens_.end()) return std::nullopt;
    return static_cast<int>(std::distance(tokens_.begin(), it));
}

std::optional<int> Pool::find_in_tokens_list(const Address& token) const {
    auto it = std::find(tokens_list_.begin(), tokens_list_.end(), token);
    if (it == tokens_list_.end()) return std::nullopt;
    return static_cast<int>(std::distance(tokens_list_.begin(), it));
}

} // namespace pda::domain
