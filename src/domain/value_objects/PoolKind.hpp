#pragma once

#include <string>

namespace pda::domain {

// Which pair-data shape a pool produces.
enum class PoolKind { Weighted, Stable, MetaStable, PhantomStable, Linear, Unknown };

// Unrecognized tags map to Unknown rather than failing.
PoolKind pool_kind_from_string(const std::string& pool_type);

const char* to_string(PoolKind kind) noexcept;

} // namespace pda::domain
