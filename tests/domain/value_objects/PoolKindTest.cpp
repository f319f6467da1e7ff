#include "domain/value_objects/PoolKind.hpp"

#include <gtest/gtest.h>

using namespace pda::domain;

TEST(PoolKind, ClassifiesWeightedFamily) {
    EXPECT_EQ(pool_kind_from_string("Weighted"), PoolKind::Weighted);
    EXPECT_EQ(pool_kind_from_string("Investment"), PoolKind::Weighted);
    EXPECT_EQ(pool_kind_from_string("LiquidityBootstrapping"), PoolKind::Weighted);
}

TEST(PoolKind, ClassifiesStableFamily) {
    EXPECT_EQ(pool_kind_from_string("Stable"), PoolKind::Stable);
    EXPECT_EQ(pool_kind_from_string("MetaStable"), PoolKind::MetaStable);
    EXPECT_EQ(pool_kind_from_string("StablePhantom"), PoolKind::PhantomStable);
    EXPECT_EQ(pool_kind_from_string("ComposableStable"), PoolKind::PhantomStable);
}

TEST(PoolKind, ClassifiesLinearVariants) {
    EXPECT_EQ(pool_kind_from_string("Linear"), PoolKind::Linear);
    EXPECT_EQ(pool_kind_from_string("AaveLinear"), PoolKind::Linear);
    EXPECT_EQ(pool_kind_from_string("ERC4626Linear"), PoolKind::Linear);
}

TEST(PoolKind, UnknownTagsAreNotErrors) {
    EXPECT_EQ(pool_kind_from_string("Element"), PoolKind::Unknown);
    EXPECT_EQ(pool_kind_from_string(""), PoolKind::Unknown);
    EXPECT_EQ(pool_kind_from_string("weighted"), PoolKind::Unknown);
}

TEST(PoolKind, ToString) {
    EXPECT_STREQ(to_string(PoolKind::PhantomStable), "PhantomStable");
    EXPECT_STREQ(to_string(PoolKind::Unknown), "Unknown");
}
