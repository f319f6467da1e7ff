#include "services/PairDataCollector.hpp"

using namespace pda::domain;

namespace pda::services {

PairDataCollector::PairDataCollector(IPoolSource& source, bool include_disabled)
    : source_(source), include_disabled_(include_disabled) {}

Result<CollectionReport> PairDataCollector::collect(const std::string& token_in,
                                                    const std::string& token_out) const {
    auto in = Address::parse(token_in);
    if (!in) return in.error();
    auto out = Address::parse(token_out);
    if (!out) return out.error();

    CollectionReport report;
    for (const auto& raw : source_.fetch_pools()) {
        if (!raw.swap_enabled && !include_disabled_) continue;

        auto pool = normalizer_.normalize(raw);
        if (!pool) {
            report.skipped.push_back({raw.id, pool.error()});
            continue;
        }

        auto data = extractor_.extract(pool.value(), token_in, token_out);
        if (!data) {
            if (data.error().kind == ErrorKind::TokenNotFound) {
                ++report.unmatched;
            } else {
                report.skipped.push_back({raw.id, data.error()});
            }
            continue;
        }

        report.pairs.push_back({raw.id, raw.pool_type, std::move(data).value()});
    }
    return report;
}

} // namespace pda::services
