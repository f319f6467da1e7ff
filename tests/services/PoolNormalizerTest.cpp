#include "services/PoolNormalizer.hpp"

#include <gtest/gtest.h>

using namespace pda::domain;
using pda::services::PoolNormalizer;
namespace fp = pda::domain::fixed_point;

namespace {

const char* kPool = "0x5c6ee304399dbdb9c8ef030ab642b10820db8f56";
const char* kBal = "0xba100000625a3754423978a60c9317c58a424e3d";
const char* kUsdc = "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48";
const char* kWeth = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";

} // namespace

class PoolNormalizerTest : public ::testing::Test {
protected:
    PoolNormalizer normalizer;

    RawPool weighted_pool() {
        RawPool raw;
        raw.id = "0x5c6ee304399dbdb9c8ef030ab642b10820db8f56000200000000000000000014";
        raw.address = kPool;
        raw.pool_type = "Weighted";
        raw.swap_fee = "0.003";
        raw.swap_enabled = true;
        raw.tokens = {
            RawToken{kBal, "100", 18, std::nullopt, std::string("0.5")},
            RawToken{kUsdc, "200", 6, std::nullopt, std::string("0.5")},
        };
        raw.tokens_list = {kBal, kUsdc};
        raw.total_weight = "1";
        return raw;
    }
};

TEST_F(PoolNormalizerTest, NormalizesTwoTokenWeightedPool) {
    auto result = normalizer.normalize(weighted_pool());
    ASSERT_TRUE(result.ok()) << result.error().message;
    const Pool& pool = result.value();

    EXPECT_EQ(pool.kind(), PoolKind::Weighted);
    EXPECT_EQ(pool.swap_fee(), uint256(3) * fp::pow10(15));
    EXPECT_EQ(pool.total_weight(), fp::one());

    ASSERT_EQ(pool.tokens().size(), 2);
    EXPECT_EQ(pool.tokens()[0].weight, uint256(5) * fp::pow10(17));
    EXPECT_EQ(pool.tokens()[1].weight, uint256(5) * fp::pow10(17));
    EXPECT_EQ(pool.tokens()[0].balance, uint256(100) * fp::pow10(18));
    EXPECT_EQ(pool.tokens()[1].balance, uint256(200) * fp::pow10(6));
}

TEST_F(PoolNormalizerTest, KeepsTokenOrderAndPassThroughFields) {
    auto result = normalizer.normalize(weighted_pool());
    ASSERT_TRUE(result.ok());
    const Pool& pool = result.value();

    EXPECT_EQ(pool.id(), "0x5c6ee304399dbdb9c8ef030ab642b10820db8f56000200000000000000000014");
    EXPECT_EQ(pool.address().str(), kPool);
    EXPECT_EQ(pool.pool_type(), "Weighted");
    EXPECT_TRUE(pool.swap_enabled());
    EXPECT_EQ(pool.tokens()[0].address.str(), kBal);
    EXPECT_EQ(pool.tokens()[1].address.str(), kUsdc);
    ASSERT_EQ(pool.tokens_list().size(), 2);
    EXPECT_EQ(pool.tokens_list()[1].str(), kUsdc);
}

TEST_F(PoolNormalizerTest, NormalizesWeightsAgainstTotalWeight) {
    // Raw weights 1, 1, 1 over total 3 -> each floor(10^18 / 3)
    auto raw = weighted_pool();
    raw.tokens = {
        RawToken{kBal, "1", 18, std::nullopt, std::string("1")},
        RawToken{kUsdc, "1", 6, std::nullopt, std::string("1")},
        RawToken{kWeth, "1", 18, std::nullopt, std::string("1")},
    };
    raw.total_weight = "3";

    auto result = normalizer.normalize(raw);
    ASSERT_TRUE(result.ok());

    uint256 sum = 0;
    for (const auto& token : result.value().tokens()) {
        EXPECT_EQ(token.weight, uint256("333333333333333333"));
        sum += token.weight_or_zero();
    }
    EXPECT_LE(sum, fp::one());
    EXPECT_GE(sum + 3, fp::one());
}

TEST_F(PoolNormalizerTest, WeightsSumToOneWithinRounding) {
    auto raw = weighted_pool();
    raw.tokens = {
        RawToken{kBal, "1", 18, std::nullopt, std::string("40")},
        RawToken{kUsdc, "1", 6, std::nullopt, std::string("35")},
        RawToken{kWeth, "1", 18, std::nullopt, std::string("25")},
    };
    raw.total_weight = "100";

    auto result = normalizer.normalize(raw);
    ASSERT_TRUE(result.ok());

    uint256 sum = 0;
    for (const auto& token : result.value().tokens()) {
        sum += token.weight_or_zero();
    }
    EXPECT_LE(sum, fp::one());
    EXPECT_GE(sum + result.value().tokens().size(), fp::one());
}

TEST_F(PoolNormalizerTest, FailsWithDivisionByZeroWhenTotalWeightMissing) {
    auto raw = weighted_pool();
    raw.total_weight.reset();

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::DivisionByZero);
}

TEST_F(PoolNormalizerTest, FailsWithDivisionByZeroWhenTotalWeightIsZero) {
    auto raw = weighted_pool();
    raw.total_weight = "0";

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::DivisionByZero);
}

TEST_F(PoolNormalizerTest, AbsentOptionalFieldsStayAbsent) {
    RawPool raw;
    raw.id = "stable";
    raw.address = kPool;
    raw.pool_type = "Stable";
    raw.swap_fee = "0.0004";
    raw.tokens = {RawToken{kUsdc, "10.5", 6, std::nullopt, std::nullopt}};
    raw.tokens_list = {kUsdc};

    auto result = normalizer.normalize(raw);
    ASSERT_TRUE(result.ok());
    const Pool& pool = result.value();

    EXPECT_FALSE(pool.variant_fields().total_weight.has_value());
    EXPECT_FALSE(pool.variant_fields().amp.has_value());
    EXPECT_FALSE(pool.variant_fields().main_index.has_value());
    EXPECT_EQ(pool.total_weight(), 0);
    EXPECT_EQ(pool.amp(), 0);
    EXPECT_EQ(pool.main_index(), 0);
    EXPECT_EQ(pool.lower_target(), 0);
    EXPECT_FALSE(pool.tokens()[0].weight.has_value());
    EXPECT_EQ(pool.tokens()[0].balance, uint256(10500000));
}

TEST_F(PoolNormalizerTest, DefaultsPriceRateToOne) {
    auto result = normalizer.normalize(weighted_pool());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().tokens()[0].price_rate, fp::one());
}

TEST_F(PoolNormalizerTest, ParsesStableAndLinearFields) {
    RawPool raw;
    raw.id = "linear";
    raw.address = kPool;
    raw.pool_type = "AaveLinear";
    raw.swap_fee = "0.0002";
    raw.tokens = {
        RawToken{kUsdc, "1000", 6, std::string("1"), std::nullopt},
        RawToken{kWeth, "500", 18, std::string("1.08"), std::nullopt},
    };
    raw.tokens_list = {kUsdc, kWeth, kPool};
    raw.amp = "200";
    raw.main_index = 0;
    raw.wrapped_index = 1;
    raw.lower_target = "2900000";
    raw.upper_target = "7100000";

    auto result = normalizer.normalize(raw);
    ASSERT_TRUE(result.ok());
    const Pool& pool = result.value();

    EXPECT_EQ(pool.kind(), PoolKind::Linear);
    EXPECT_EQ(pool.amp(), uint256(200000));
    EXPECT_EQ(pool.main_index(), 0);
    EXPECT_EQ(pool.wrapped_index(), 1);
    EXPECT_EQ(pool.lower_target(), uint256(2900000) * fp::one());
    EXPECT_EQ(pool.upper_target(), uint256(7100000) * fp::one());
    EXPECT_EQ(pool.tokens()[1].price_rate, uint256(108) * fp::pow10(16));
}

TEST_F(PoolNormalizerTest, RejectsInvalidTokenAddress) {
    auto raw = weighted_pool();
    raw.tokens[1].address = "0xnothex";

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidAddress);
}

TEST_F(PoolNormalizerTest, RejectsDecimalsAboveEighteen) {
    auto raw = weighted_pool();
    raw.tokens[0].decimals = 19;

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRecord);
}

TEST_F(PoolNormalizerTest, RejectsBalanceWithTooManyFractionDigits) {
    auto raw = weighted_pool();
    raw.tokens[1].balance = "1.0000001";   // USDC has 6 decimals

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRecord);
    EXPECT_NE(result.error().message.find("tokens[1].balance"), std::string::npos);
}

TEST_F(PoolNormalizerTest, RejectsNegativeIndex) {
    auto raw = weighted_pool();
    raw.main_index = -1;

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRecord);
}

TEST_F(PoolNormalizerTest, KeepsUnknownPoolTypes) {
    auto raw = weighted_pool();
    raw.pool_type = "Element";

    auto result = normalizer.normalize(raw);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().kind(), PoolKind::Unknown);
    EXPECT_EQ(result.value().pool_type(), "Element");
}

TEST_F(PoolNormalizerTest, RejectsPriceRateWhoseScalingFactorOverflows) {
    RawPool raw;
    raw.id = "meta";
    raw.address = kPool;
    raw.pool_type = "MetaStable";
    raw.swap_fee = "0.0004";
    raw.amp = "50";
    raw.tokens = {
        RawToken{kUsdc, "1", 6, std::nullopt, std::nullopt},
        RawToken{kWeth, "1", 0, "1" + std::string(42, '0'), std::nullopt},
    };
    raw.tokens_list = {kUsdc, kWeth};

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRecord);
    EXPECT_NE(result.error().message.find("tokens[1].priceRate"), std::string::npos);
}

TEST_F(PoolNormalizerTest, RejectsWeightThatOverflowsWhenNormalized) {
    auto raw = weighted_pool();
    raw.tokens[0].weight = "1" + std::string(50, '0');
    raw.total_weight = "0.000000000000000001";

    auto result = normalizer.normalize(raw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidRecord);
    EXPECT_NE(result.error().message.find("tokens[0].weight"), std::string::npos);
}
