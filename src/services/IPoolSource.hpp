#pragma once

#include "domain/records/RawPool.hpp"

#include <vector>

namespace pda::services {

class IPoolSource {
public:
    virtual std::vector<domain::RawPool> fetch_pools() = 0;
    virtual ~IPoolSource() = default;
};

} // namespace pda::services
