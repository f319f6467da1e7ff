#pragma once

#include "infrastructure/SubgraphPoolParser.hpp"
#include "services/IPoolSource.hpp"

#include <string>

namespace pda::infrastructure {

// Pools from a JSON dump on disk, in any layout SubgraphPoolParser accepts.
class FilePoolSource : public services::IPoolSource {
public:
    explicit FilePoolSource(std::string path);

    // Throws std::runtime_error when the file cannot be read.
    std::vector<domain::RawPool> fetch_pools() override;

private:
    std::string path_;
    SubgraphPoolParser parser_;
};

} // namespace pda::infrastructure
