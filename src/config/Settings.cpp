#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace pda::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("PDA_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.subgraph.url = env_or("PDA_SUBGRAPH_URL", s.subgraph.url);
    s.subgraph.connect_timeout_seconds = env_int_or("PDA_CONNECT_TIMEOUT", s.subgraph.connect_timeout_seconds);
    s.subgraph.transfer_timeout_seconds = env_int_or("PDA_TRANSFER_TIMEOUT", s.subgraph.transfer_timeout_seconds);
    s.subgraph.pool_page_size = env_int_or("PDA_POOL_PAGE_SIZE", s.subgraph.pool_page_size);
    s.collector.include_disabled = env_bool_or("PDA_INCLUDE_DISABLED", s.collector.include_disabled);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.subgraph.url = "https://api.thegraph.com/subgraphs/name/balancer-labs/balancer-goerli-v2";
    s.subgraph.pool_page_size = 100;
    s.collector.include_disabled = true;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.subgraph.connect_timeout_seconds = 5;
    s.subgraph.transfer_timeout_seconds = 20;
    s.subgraph.pool_page_size = 1000;
    return s;
}

} // namespace pda::config
