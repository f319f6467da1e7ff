#include "infrastructure/PairDataJson.hpp"

#include <type_traits>

using json = nlohmann::json;
using namespace pda::domain;

namespace pda::infrastructure {

namespace {

json amounts(const std::vector<uint256>& values) {
    json out = json::array();
    for (const auto& v : values) {
        out.push_back(v.str());
    }
    return out;
}

json addresses(const std::vector<Address>& values) {
    json out = json::array();
    for (const auto& a : values) {
        out.push_back(a.str());
    }
    return out;
}

template <typename Optional>
json optional_amount(const Optional& value) {
    return value ? json(value->str()) : json(nullptr);
}

void write_stable(json& out, const StablePairData& data) {
    out["amp"] = data.amp.str();
    out["balances"] = amounts(data.balances);
    out["tokenIndexIn"] = data.token_index_in;
    out["tokenIndexOut"] = data.token_index_out;
    out["fee"] = data.fee.str();
    out["scalingFactors"] = amounts(data.scaling_factors);
}

void write_phantom(json& out, const PhantomStablePairData& data) {
    write_stable(out, data);
    out["tokens"] = addresses(data.tokens);
    out["bptIndex"] = data.bpt_index;
}

} // anonymous namespace

json pool_to_json(const Pool& pool) {
    json tokens = json::array();
    for (const auto& token : pool.tokens()) {
        tokens.push_back({
            {"address", token.address.str()},
            {"balance", token.balance.str()},
            {"decimals", token.decimals},
            {"priceRate", token.price_rate.str()},
            {"weight", optional_amount(token.weight)},
        });
    }

    const auto& fields = pool.variant_fields();
    return {
        {"id", pool.id()},
        {"address", pool.address().str()},
        {"poolType", pool.pool_type()},
        {"kind", to_string(pool.kind())},
        {"swapFee", pool.swap_fee().str()},
        {"swapEnabled", pool.swap_enabled()},
        {"tokens", tokens},
        {"tokensList", addresses(pool.tokens_list())},
        {"totalWeight", optional_amount(fields.total_weight)},
        {"amp", optional_amount(fields.amp)},
        {"mainIndex", fields.main_index ? json(*fields.main_index) : json(nullptr)},
        {"wrappedIndex", fields.wrapped_index ? json(*fields.wrapped_index) : json(nullptr)},
        {"lowerTarget", optional_amount(fields.lower_target)},
        {"upperTarget", optional_amount(fields.upper_target)},
    };
}

json pair_data_to_json(const PairData& data) {
    return std::visit([](const auto& d) -> json {
        using T = std::decay_t<decltype(d)>;
        json out;
        if constexpr (std::is_same_v<T, WeightedPairData>) {
            out["kind"] = "Weighted";
            out["balanceIn"] = d.balance_in.str();
            out["balanceOut"] = d.balance_out.str();
            out["weightIn"] = d.weight_in.str();
            out["weightOut"] = d.weight_out.str();
            out["fee"] = d.fee.str();
            out["scalingFactorTokenIn"] = d.scaling_factor_in.str();
            out["scalingFactorTokenOut"] = d.scaling_factor_out.str();
        } else if constexpr (std::is_same_v<T, StablePairData>) {
            out["kind"] = "Stable";
            write_stable(out, d);
        } else if constexpr (std::is_same_v<T, MetaStablePairData>) {
            out["kind"] = "MetaStable";
            write_stable(out, d);
        } else if constexpr (std::is_same_v<T, PhantomStablePairData>) {
            out["kind"] = "PhantomStable";
            write_phantom(out, d);
        } else {
            out["kind"] = "Linear";
            write_phantom(out, d);
            out["mainIndex"] = d.main_index;
            out["wrappedIndex"] = d.wrapped_index;
            out["lowerTarget"] = d.lower_target.str();
            out["upperTarget"] = d.upper_target.str();
        }
        return out;
    }, data);
}

} // namespace pda::infrastructure
