#include "domain/value_objects/PoolKind.hpp"

#include <unordered_map>

namespace pda::domain {

PoolKind pool_kind_from_string(const std::string& pool_type) {
    static const std::unordered_map<std::string, PoolKind> kinds = {
        {"Weighted", PoolKind::Weighted},
        {"Investment", PoolKind::Weighted},
        {"LiquidityBootstrapping", PoolKind::Weighted},
        {"Managed", PoolKind::Weighted},
        {"Stable", PoolKind::Stable},
        {"MetaStable", PoolKind::MetaStable},
        {"StablePhantom", PoolKind::PhantomStable},
        {"ComposableStable", PoolKind::PhantomStable},
        {"Linear", PoolKind::Linear},
        {"AaveLinear", PoolKind::Linear},
        {"ERC4626Linear", PoolKind::Linear},
        {"EulerLinear", PoolKind::Linear},
        {"GearboxLinear", PoolKind::Linear},
        {"ReaperLinear", PoolKind::Linear},
        {"BeefyLinear", PoolKind::Linear},
        {"YearnLinear", PoolKind::Linear},
        {"MidasLinear", PoolKind::Linear},
        {"SiloLinear", PoolKind::Linear},
    };

    auto it = kinds.find(pool_type);
    return it == kinds.end() ? PoolKind::Unknown : it->second;
}

const char* to_string(PoolKind kind) noexcept {
    switch (kind) {
        case PoolKind::Weighted:      return "Weighted";
        case PoolKind::Stable:        return "Stable";
        case PoolKind::MetaStable:    return "MetaStable";
        case PoolKind::PhantomStable: return "PhantomStable";
        case PoolKind::Linear:        return "Linear";
        case PoolKind::Unknown:       return "Unknown";
    }
    return "Unknown";
}

} // namespace pda::domain
