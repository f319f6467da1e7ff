#include "services/PairDataExtractor.hpp"

using namespace pda::domain;

namespace pda::services {

namespace {

namespace fp = fixed_point;

struct PairIndices {
    int in;
    int out;
};

Result<int> locate(const Pool& pool, std::string_view token, const char* side) {
    auto address = Address::parse(token);
    if (!address) return address.error();

    auto index = pool.find_token(address.value());
    if (!index) {
        return make_error(ErrorKind::TokenNotFound,
                          std::string("Token ") + side + " " + std::string(token) +
                          " not found in pool " + pool.id());
    }
    return *index;
}

Result<PairIndices> locate_pair(const Pool& pool, std::string_view token_in,
                                std::string_view token_out) {
    auto in = locate(pool, token_in, "in");
    if (!in) return in.error();
    auto out = locate(pool, token_out, "out");
    if (!out) return out.error();
    return PairIndices{in.value(), out.value()};
}

std::vector<uint256> balances_of(const Pool& pool) {
    std::vector<uint256> balances;
    balances.reserve(pool.tokens().size());
    for (const auto& token : pool.tokens()) {
        balances.push_back(token.balance);
    }
    return balances;
}

std::vector<uint256> decimal_scaling_factors(const Pool& pool) {
    std::vector<uint256> factors;
    factors.reserve(pool.tokens().size());
    for (const auto& token : pool.tokens()) {
        factors.push_back(fp::scaling_factor(token.decimals));
    }
    return factors;
}

// Decimal factor adjusted by the token's exchange rate, rounded down.
Result<std::vector<uint256>> rate_scaling_factors(const Pool& pool) {
    std::vector<uint256> factors;
    factors.reserve(pool.tokens().size());
    for (const auto& token : pool.tokens()) {
        auto factor = fp::mul_down_fixed(fp::scaling_factor(token.decimals), token.price_rate);
        if (!factor) {
            return make_error(factor.error().kind,
                              "priceRate of " + token.address.str() + " in pool " + pool.id() +
                              ": " + factor.error().message);
        }
        factors.push_back(factor.value());
    }
    return factors;
}

void fill_stable_fields(StablePairData& data, const Pool& pool, const PairIndices& indices,
                        std::vector<uint256> scaling_factors) {
    data.amp = pool.amp();
    data.balances = balances_of(pool);
    data.token_index_in = indices.in;
    data.token_index_out = indices.out;
    data.fee = pool.swap_fee();
    data.scaling_factors = std::move(scaling_factors);
}

void fill_phantom_fields(PhantomStablePairData& data, const Pool& pool) {
    data.tokens = pool.tokens_list();
    data.bpt_index = pool.find_in_tokens_list(pool.address()).value_or(kIndexNotFound);
}

} // anonymous namespace

Result<WeightedPairData> PairDataExtractor::weighted(
    const Pool& pool, std::string_view token_in, std::string_view token_out) const {
    if (pool.total_weight() == 0) {
        return make_error(ErrorKind::WrongPoolType,
                          "Pool " + pool.id() + " does not contain totalWeight");
    }

    auto indices = locate_pair(pool, token_in, token_out);
    if (!indices) return indices.error();

    const Token& in = pool.tokens()[indices.value().in];
    const Token& out = pool.tokens()[indices.value().out];

    WeightedPairData data;
    data.balance_in = in.balance;
    data.balance_out = out.balance;
    data.weight_in = in.weight_or_zero();
    data.weight_out = out.weight_or_zero();
    data.fee = pool.swap_fee();
    data.scaling_factor_in = fp::scaling_factor(in.decimals);
    data.scaling_factor_out = fp::scaling_factor(out.decimals);
    return data;
}

Result<StablePairData> PairDataExtractor::stable(
    const Pool& pool, std::string_view token_in, std::string_view token_out) const {
    auto indices = locate_pair(pool, token_in, token_out);
    if (!indices) return indices.error();

    StablePairData data;
    fill_stable_fields(data, pool, indices.value(), decimal_scaling_factors(pool));
    return data;
}

Result<MetaStablePairData> PairDataExtractor::meta_stable(
    const Pool& pool, std::string_view token_in, std::string_view token_out) const {
    auto indices = locate_pair(pool, token_in, token_out);
    if (!indices) return indices.error();

    auto factors = rate_scaling_factors(pool);
    if (!factors) return factors.error();

    MetaStablePairData data;
    fill_stable_fields(data, pool, indices.value(), std::move(factors).value());
    return data;
}

Result<PhantomStablePairData> PairDataExtractor::phantom_stable(
    const Pool& pool, std::string_view token_in, std::string_view token_out) const {
    auto indices = locate_pair(pool, token_in, token_out);
    if (!indices) return indices.error();

    auto factors = rate_scaling_factors(pool);
    if (!factors) return factors.error();

    PhantomStablePairData data;
    fill_stable_fields(data, pool, indices.value(), std::move(factors).value());
    fill_phantom_fields(data, pool);
    return data;
}

Result<LinearPairData> PairDataExtractor::linear(
    const Pool& pool, std::string_view token_in, std::string_view token_out) const {
    auto indices = locate_pair(pool, token_in, token_out);
    if (!indices) return indices.error();

    auto factors = rate_scaling_factors(pool);
    if (!factors) return factors.error();

    LinearPairData data;
    fill_stable_fields(data, pool, indices.value(), std::move(factors).value());
    fill_phantom_fields(data, pool);
    data.main_index = pool.main_index();
    data.wrapped_index = pool.wrapped_index();
    data.lower_target = pool.lower_target();
    data.upper_target = pool.upper_target();
    return data;
}

namespace {

template <typename T>
Result<PairData> widen(Result<T> result) {
    if (!result) return result.error();
    return PairData{std::move(result).value()};
}

} // anonymous namespace

Result<PairData> PairDataExtractor::extract(
    const Pool& pool, std::string_view token_in, std::string_view token_out) const {
    switch (pool.kind()) {
        case PoolKind::Weighted:      return widen(weighted(pool, token_in, token_out));
        case PoolKind::Stable:        return widen(stable(pool, token_in, token_out));
        case PoolKind::MetaStable:    return widen(meta_stable(pool, token_in, token_out));
        case PoolKind::PhantomStable: return widen(phantom_stable(pool, token_in, token_out));
        case PoolKind::Linear:        return widen(linear(pool, token_in, token_out));
        case PoolKind::Unknown:       break;
    }
    return make_error(ErrorKind::WrongPoolType,
                      "Pool " + pool.id() + " has unsupported poolType '" + pool.pool_type() + "'");
}

} // namespace pda::services
