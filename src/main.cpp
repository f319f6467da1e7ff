#include "config/Settings.hpp"
#include "domain/Result.hpp"
#include "domain/value_objects/FixedPoint.hpp"
#include "infrastructure/FilePoolSource.hpp"
#include "infrastructure/PairDataJson.hpp"
#include "infrastructure/SubgraphPoolSource.hpp"
#include "services/PairDataCollector.hpp"
#include "services/PoolNormalizer.hpp"

#include <ixwebsocket/IXNetSystem.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace fp = pda::domain::fixed_point;

void print_usage() {
    std::cerr << "Usage: pool_data_adapter <token_in> <token_out> [pools.json]" << std::endl;
    std::cerr << "       pool_data_adapter --pools [pools.json]" << std::endl;
    std::cerr << "       Without a file, pools are fetched from PDA_SUBGRAPH_URL." << std::endl;
}

std::unique_ptr<pda::services::IPoolSource> make_source(const pda::config::Settings& settings,
                                                        const char* path) {
    if (path) {
        std::cerr << "[source] Reading pools from " << path << std::endl;
        return std::make_unique<pda::infrastructure::FilePoolSource>(path);
    }
    ix::initNetSystem();
    std::cerr << "[source] Fetching up to " << settings.subgraph.pool_page_size
              << " pools from " << settings.subgraph.url << std::endl;
    return std::make_unique<pda::infrastructure::SubgraphPoolSource>(settings.subgraph);
}

// Prints every pool in canonical form, one JSON object per line.
int dump_pools(pda::services::IPoolSource& source) {
    std::vector<pda::domain::RawPool> raw_pools;
    try {
        raw_pools = source.fetch_pools();
    } catch (const std::exception& e) {
        std::cerr << "[source] Failed to load pools: " << e.what() << std::endl;
        return 1;
    }

    pda::services::PoolNormalizer normalizer;
    std::size_t skipped = 0;
    for (const auto& raw : raw_pools) {
        auto pool = normalizer.normalize(raw);
        if (!pool) {
            ++skipped;
            std::cerr << "[skip] pool=" << raw.id
                      << " reason=" << pda::domain::to_string(pool.error().kind)
                      << " " << pool.error().message << std::endl;
            continue;
        }
        const auto& p = pool.value();
        std::cerr << "[pool] id=" << p.id()
                  << " kind=" << pda::domain::to_string(p.kind())
                  << " fee=" << fp::format_fixed(p.swap_fee(), fp::kPrecision)
                  << " tokens=" << p.tokens().size() << std::endl;
        std::cout << pda::infrastructure::pool_to_json(p).dump() << std::endl;
    }

    std::cerr << "[adapter] Done. pools=" << raw_pools.size() - skipped
              << " skipped=" << skipped << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto settings = pda::config::Settings::from_environment();

    if (argc >= 2 && std::strcmp(argv[1], "--pools") == 0) {
        auto source = make_source(settings, argc >= 3 ? argv[2] : nullptr);
        return dump_pools(*source);
    }

    if (argc < 3) {
        print_usage();
        return 1;
    }

    std::string token_in = argv[1];
    std::string token_out = argv[2];
    auto source = make_source(settings, argc >= 4 ? argv[3] : nullptr);

    pda::services::PairDataCollector collector(*source, settings.collector.include_disabled);

    std::optional<pda::domain::Result<pda::services::CollectionReport>> result;
    try {
        result.emplace(collector.collect(token_in, token_out));
    } catch (const std::exception& e) {
        std::cerr << "[source] Failed to load pools: " << e.what() << std::endl;
        return 1;
    }

    if (!*result) {
        std::cerr << "[adapter] " << pda::domain::to_string(result->error().kind) << ": "
                  << result->error().message << std::endl;
        return 1;
    }

    const auto& report = result->value();
    for (const auto& skipped : report.skipped) {
        std::cerr << "[skip] pool=" << skipped.pool_id
                  << " reason=" << pda::domain::to_string(skipped.error.kind)
                  << " " << skipped.error.message << std::endl;
    }

    for (const auto& entry : report.pairs) {
        nlohmann::json line = {
            {"poolId", entry.pool_id},
            {"poolType", entry.pool_type},
            {"pairData", pda::infrastructure::pair_data_to_json(entry.data)},
        };
        std::cout << line.dump() << std::endl;
    }

    std::cerr << "[adapter] Done. pairs=" << report.pairs.size()
              << " skipped=" << report.skipped.size()
              << " unmatched=" << report.unmatched << std::endl;
    return 0;
}
