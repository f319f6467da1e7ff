#include "services/PoolNormalizer.hpp"

using namespace pda::domain;

namespace pda::services {

namespace {

namespace fp = fixed_point;

Error in_field(const Error& error, const std::string& field) {
    return make_error(error.kind, field + ": " + error.message);
}

Result<std::optional<uint256>> parse_optional(const std::optional<std::string>& text,
                                              int decimals, const std::string& field) {
    if (!text) return std::optional<uint256>{};
    auto parsed = fp::parse_fixed(*text, decimals);
    if (!parsed) return in_field(parsed.error(), field);
    return std::optional<uint256>{parsed.value()};
}

Result<std::optional<int>> check_index(const std::optional<int>& index, const std::string& field) {
    if (index && *index < 0) {
        return make_error(ErrorKind::InvalidRecord,
                          field + ": index must be non-negative, got " + std::to_string(*index));
    }
    return index;
}

Result<Token> normalize_token(const RawToken& raw, const std::optional<uint256>& total_weight,
                              std::size_t position) {
    std::string field = "tokens[" + std::to_string(position) + "]";

    auto address = Address::parse(raw.address);
    if (!address) return in_field(address.error(), field + ".address");

    if (raw.decimals < 0 || raw.decimals > fp::kMaxTokenDecimals) {
        return make_error(ErrorKind::InvalidRecord,
                          field + ".decimals: must be between 0 and 18, got " +
                          std::to_string(raw.decimals));
    }

    auto balance = fp::parse_fixed(raw.balance, raw.decimals);
    if (!balance) return in_field(balance.error(), field + ".balance");

    uint256 price_rate = fp::one();
    if (raw.price_rate) {
        auto rate = fp::parse_fixed(*raw.price_rate, fp::kPrecision);
        if (!rate) return in_field(rate.error(), field + ".priceRate");
        price_rate = rate.value();
    }
    // The rate-adjusted scaling factor must stay within 256 bits.
    auto adjusted = fp::mul_down_fixed(fp::scaling_factor(raw.decimals), price_rate);
    if (!adjusted) return in_field(adjusted.error(), field + ".priceRate");

    std::optional<uint256> weight;
    if (raw.weight) {
        auto raw_weight = fp::parse_fixed(*raw.weight, fp::kPrecision);
        if (!raw_weight) return in_field(raw_weight.error(), field + ".weight");

        auto normalized = fp::mul_div_down(raw_weight.value(), fp::one(),
                                           total_weight.value_or(uint256(0)));
        if (!normalized) {
            if (normalized.error().kind == ErrorKind::DivisionByZero) {
                return make_error(ErrorKind::DivisionByZero,
                                  field + ".weight: pool totalWeight is zero");
            }
            return in_field(normalized.error(), field + ".weight");
        }
        weight = normalized.value();
    }

    return Token{address.value(), balance.value(), raw.decimals, price_rate, weight};
}

} // anonymous namespace

Result<Pool> PoolNormalizer::normalize(const RawPool& raw) const {
    auto address = Address::parse(raw.address);
    if (!address) return in_field(address.error(), "address");

    auto swap_fee = fp::parse_fixed(raw.swap_fee, fp::kPrecision);
    if (!swap_fee) return in_field(swap_fee.error(), "swapFee");

    VariantFields fields;

    auto total_weight = parse_optional(raw.total_weight, fp::kPrecision, "totalWeight");
    if (!total_weight) return total_weight.error();
    fields.total_weight = total_weight.value();

    auto amp = parse_optional(raw.amp, fp::kAmpPrecision, "amp");
    if (!amp) return amp.error();
    fields.amp = amp.value();

    auto main_index = check_index(raw.main_index, "mainIndex");
    if (!main_index) return main_index.error();
    fields.main_index = main_index.value();

    auto wrapped_index = check_index(raw.wrapped_index, "wrappedIndex");
    if (!wrapped_index) return wrapped_index.error();
    fields.wrapped_index = wrapped_index.value();

    auto lower_target = parse_optional(raw.lower_target, fp::kPrecision, "lowerTarget");
    if (!lower_target) return lower_target.error();
    fields.lower_target = lower_target.value();

    auto upper_target = parse_optional(raw.upper_target, fp::kPrecision, "upperTarget");
    if (!upper_target) return upper_target.error();
    fields.upper_target = upper_target.value();

    std::vector<Token> tokens;
    tokens.reserve(raw.tokens.size());
    for (std::size_t i = 0; i < raw.tokens.size(); ++i) {
        auto token = normalize_token(raw.tokens[i], fields.total_weight, i);
        if (!token) return token.error();
        tokens.push_back(std::move(token).value());
    }

    std::vector<Address> tokens_list;
    tokens_list.reserve(raw.tokens_list.size());
    for (std::size_t i = 0; i < raw.tokens_list.size(); ++i) {
        auto entry = Address::parse(raw.tokens_list[i]);
        if (!entry) return in_field(entry.error(), "tokensList[" + std::to_string(i) + "]");
        tokens_list.push_back(entry.value());
    }

    return Pool(raw.id, address.value(), raw.pool_type, swap_fee.value(), raw.swap_enabled,
                std::move(tokens), std::move(tokens_list), std::move(fields));
}

} // namespace pda::services
