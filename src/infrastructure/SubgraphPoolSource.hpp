#pragma once

#include "config/Settings.hpp"
#include "infrastructure/SubgraphPoolParser.hpp"
#include "services/IPoolSource.hpp"

#include <string>

namespace pda::infrastructure {

// Pools from the indexer's GraphQL endpoint. One blocking POST per fetch.
class SubgraphPoolSource : public services::IPoolSource {
public:
    explicit SubgraphPoolSource(const config::SubgraphSettings& settings);
    virtual ~SubgraphPoolSource() = default;

    // Throws std::runtime_error when the request fails.
    std::vector<domain::RawPool> fetch_pools() override;

    std::string build_query() const;

protected:
    // POSTs the body and returns the response body.
    virtual std::string post(const std::string& body) const;

private:
    config::SubgraphSettings settings_;
    SubgraphPoolParser parser_;
};

} // namespace pda::infrastructure
