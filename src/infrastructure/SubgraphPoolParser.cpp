#include "infrastructure/SubgraphPoolParser.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;
using namespace pda::domain;

namespace pda::infrastructure {

namespace {

const json& require(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) {
        throw std::invalid_argument(std::string("Pool record is missing '") + key + "'");
    }
    return obj[key];
}

// The indexer sends numbers as strings but older dumps use plain numbers.
std::string as_decimal_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_unsigned()) return std::to_string(value.get<uint64_t>());
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    throw std::invalid_argument("Expected decimal string, got: " + value.dump());
}

int as_int(const json& value) {
    int64_t parsed = 0;
    if (value.is_number_unsigned()) {
        auto unsigned_value = value.get<uint64_t>();
        if (unsigned_value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument("Integer out of range: " + value.dump());
        }
        return static_cast<int>(unsigned_value);
    } else if (value.is_number_integer()) {
        parsed = value.get<int64_t>();
    } else if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        std::size_t consumed = 0;
        try {
            parsed = std::stoll(text, &consumed);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Expected integer, got: " + value.dump());
        }
        if (consumed != text.size()) {
            throw std::invalid_argument("Expected integer, got: " + value.dump());
        }
    } else {
        throw std::invalid_argument("Expected integer, got: " + value.dump());
    }

    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Integer out of range: " + value.dump());
    }
    return static_cast<int>(parsed);
}

std::optional<std::string> optional_decimal(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return as_decimal_string(obj[key]);
}

std::optional<int> optional_int(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    return as_int(obj[key]);
}

RawToken parse_token(const json& obj) {
    RawToken token;
    token.address = require(obj, "address").get<std::string>();
    token.balance = as_decimal_string(require(obj, "balance"));
    token.decimals = as_int(require(obj, "decimals"));
    token.price_rate = optional_decimal(obj, "priceRate");
    token.weight = optional_decimal(obj, "weight");
    return token;
}

RawPool parse_pool(const json& obj) {
    RawPool pool;
    pool.id = require(obj, "id").get<std::string>();
    pool.address = require(obj, "address").get<std::string>();
    pool.pool_type = require(obj, "poolType").get<std::string>();
    pool.swap_fee = as_decimal_string(require(obj, "swapFee"));
    if (obj.contains("swapEnabled") && !obj["swapEnabled"].is_null()) {
        pool.swap_enabled = obj["swapEnabled"].get<bool>();
    }

    for (const auto& token : require(obj, "tokens")) {
        pool.tokens.push_back(parse_token(token));
    }

    if (obj.contains("tokensList") && obj["tokensList"].is_array()) {
        for (const auto& address : obj["tokensList"]) {
            pool.tokens_list.push_back(address.get<std::string>());
        }
    } else {
        for (const auto& token : pool.tokens) {
            pool.tokens_list.push_back(token.address);
        }
    }

    pool.total_weight = optional_decimal(obj, "totalWeight");
    pool.amp = optional_decimal(obj, "amp");
    pool.main_index = optional_int(obj, "mainIndex");
    pool.wrapped_index = optional_int(obj, "wrappedIndex");
    pool.lower_target = optional_decimal(obj, "lowerTarget");
    pool.upper_target = optional_decimal(obj, "upperTarget");
    return pool;
}

const json& pool_array(const json& doc) {
    if (doc.is_array()) return doc;
    if (doc.is_object()) {
        if (doc.contains("pools") && doc["pools"].is_array()) return doc["pools"];
        if (doc.contains("data") && doc["data"].is_object()) {
            const auto& data = doc["data"];
            if (data.contains("pools") && data["pools"].is_array()) return data["pools"];
        }
        if (doc.contains("errors")) {
            throw std::invalid_argument("Indexer returned errors: " + doc["errors"].dump());
        }
    }
    throw std::invalid_argument("Unrecognized pool document layout");
}

} // anonymous namespace

std::vector<RawPool> SubgraphPoolParser::parse(const std::string& json_str) const {
    auto doc = json::parse(json_str);

    std::vector<RawPool> pools;
    for (const auto& obj : pool_array(doc)) {
        pools.push_back(parse_pool(obj));
    }
    return pools;
}

} // namespace pda::infrastructure
