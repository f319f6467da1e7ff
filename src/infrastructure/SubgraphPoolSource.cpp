#include "infrastructure/SubgraphPoolSource.hpp"

#include <ixwebsocket/IXHttpClient.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

namespace pda::infrastructure {

namespace {

constexpr const char* kPoolFields = R"(
    id
    address
    poolType
    swapFee
    swapEnabled
    totalWeight
    amp
    mainIndex
    wrappedIndex
    lowerTarget
    upperTarget
    tokensList
    tokens { address balance decimals priceRate weight }
)";

} // anonymous namespace

SubgraphPoolSource::SubgraphPoolSource(const config::SubgraphSettings& settings)
    : settings_(settings) {}

std::string SubgraphPoolSource::build_query() const {
    std::string query =
        "{ pools(first: " + std::to_string(settings_.pool_page_size) +
        ", where: { totalShares_gt: \"0.000000000001\" }, "
        "orderBy: totalLiquidity, orderDirection: desc) {" +
        std::string(kPoolFields) + "} }";

    nlohmann::json body;
    body["query"] = query;
    return body.dump();
}

std::vector<domain::RawPool> SubgraphPoolSource::fetch_pools() {
    return parser_.parse(post(build_query()));
}

std::string SubgraphPoolSource::post(const std::string& body) const {
    ix::HttpClient client;
    auto args = client.createRequest();
    args->connectTimeout = settings_.connect_timeout_seconds;
    args->transferTimeout = settings_.transfer_timeout_seconds;
    args->extraHeaders["Content-Type"] = "application/json";

    auto response = client.post(settings_.url, body, args);
    if (response->statusCode != 200) {
        throw std::runtime_error("Subgraph request to " + settings_.url + " failed: status=" +
                                 std::to_string(response->statusCode) + " " +
                                 response->errorMsg);
    }
    return response->body;
}

} // namespace pda::infrastructure
