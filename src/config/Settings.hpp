#pragma once

#include <string>

namespace pda::config {

struct SubgraphSettings {
    std::string url = "https://api.thegraph.com/subgraphs/name/balancer-labs/balancer-v2";
    int connect_timeout_seconds = 10;
    int transfer_timeout_seconds = 30;
    int pool_page_size = 1000;
};

struct CollectorSettings {
    bool include_disabled = false;   // also price pools with swaps paused
};

struct Settings {
    SubgraphSettings subgraph;
    CollectorSettings collector;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace pda::config
