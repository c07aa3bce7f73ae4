#include <gtest/gtest.h>

#include "application/KeySpace.hpp"

using namespace execdb::application;
using execdb::domain::TraderId;

class KeySpaceTest : public ::testing::Test {
protected:
    TraderId trader{"TESTER", "000"};
    KeySpace keys{trader};
};

// ============================================================================
// ТЕСТЫ: литеральные ключи для TESTER-000
// ============================================================================

TEST_F(KeySpaceTest, RootKeys) {
    EXPECT_EQ(keys.key(KeyKind::TRADER), "Trader-TESTER-000");
    EXPECT_EQ(keys.key(KeyKind::ACCOUNTS), "Trader-TESTER-000:Accounts:");
    EXPECT_EQ(keys.key(KeyKind::ORDERS), "Trader-TESTER-000:Orders:");
    EXPECT_EQ(keys.key(KeyKind::POSITIONS), "Trader-TESTER-000:Positions:");
    EXPECT_EQ(keys.key(KeyKind::STRATEGIES), "Trader-TESTER-000:Strategies:");
}

TEST_F(KeySpaceTest, IndexKeys) {
    EXPECT_EQ(keys.key(KeyKind::INDEX_ORDER_POSITION), "Trader-TESTER-000:Index:OrderPosition");
    EXPECT_EQ(keys.key(KeyKind::INDEX_ORDER_STRATEGY), "Trader-TESTER-000:Index:OrderStrategy");
    EXPECT_EQ(keys.key(KeyKind::INDEX_POSITION_STRATEGY), "Trader-TESTER-000:Index:PositionStrategy");
    EXPECT_EQ(keys.key(KeyKind::INDEX_POSITION_ORDERS), "Trader-TESTER-000:Index:PositionOrders:");
    EXPECT_EQ(keys.key(KeyKind::INDEX_STRATEGY_ORDERS), "Trader-TESTER-000:Index:StrategyOrders:");
    EXPECT_EQ(keys.key(KeyKind::INDEX_STRATEGY_POSITIONS), "Trader-TESTER-000:Index:StrategyPositions:");
    EXPECT_EQ(keys.key(KeyKind::INDEX_ORDERS_WORKING), "Trader-TESTER-000:Index:Orders:Working");
    EXPECT_EQ(keys.key(KeyKind::INDEX_ORDERS_COMPLETED), "Trader-TESTER-000:Index:Orders:Completed");
    EXPECT_EQ(keys.key(KeyKind::INDEX_POSITIONS_OPEN), "Trader-TESTER-000:Index:Positions:Open");
    EXPECT_EQ(keys.key(KeyKind::INDEX_POSITIONS_CLOSED), "Trader-TESTER-000:Index:Positions:Closed");
    EXPECT_EQ(keys.key(KeyKind::INDEX_ORDERS), "Trader-TESTER-000:Index:Orders");
    EXPECT_EQ(keys.key(KeyKind::INDEX_POSITIONS), "Trader-TESTER-000:Index:Positions");
}

TEST_F(KeySpaceTest, EntityKeysTakeIdSuffix) {
    EXPECT_EQ(keys.key(KeyKind::ORDERS, "O-1"), "Trader-TESTER-000:Orders:O-1");
    EXPECT_EQ(keys.key(KeyKind::POSITIONS, "P-1"), "Trader-TESTER-000:Positions:P-1");
    EXPECT_EQ(keys.key(KeyKind::INDEX_POSITION_ORDERS, "P-1"), "Trader-TESTER-000:Index:PositionOrders:P-1");
    EXPECT_EQ(keys.key(KeyKind::INDEX_STRATEGY_ORDERS, "S-1"), "Trader-TESTER-000:Index:StrategyOrders:S-1");
    EXPECT_EQ(keys.key(KeyKind::INDEX_STRATEGY_POSITIONS, "S-1"), "Trader-TESTER-000:Index:StrategyPositions:S-1");
}

TEST_F(KeySpaceTest, IdOnFixedKey_Throws) {
    EXPECT_THROW(keys.key(KeyKind::INDEX_ORDERS_WORKING, "O-1"), std::invalid_argument);
    EXPECT_THROW(keys.key(KeyKind::TRADER, "x"), std::invalid_argument);
}

TEST_F(KeySpaceTest, StaticAndBoundFormsAgree) {
    EXPECT_EQ(KeySpace::key(trader, KeyKind::ORDERS, std::string("O-1")), keys.key(KeyKind::ORDERS, "O-1"));
}

TEST_F(KeySpaceTest, StatusKeys) {
    using execdb::domain::OrderStatusSet;
    using execdb::domain::PositionStatusSet;

    EXPECT_EQ(keys.statusKey(OrderStatusSet::WORKING), "Trader-TESTER-000:Index:Orders:Working");
    EXPECT_EQ(keys.statusKey(OrderStatusSet::COMPLETED), "Trader-TESTER-000:Index:Orders:Completed");
    EXPECT_EQ(keys.statusKey(PositionStatusSet::OPEN), "Trader-TESTER-000:Index:Positions:Open");
    EXPECT_EQ(keys.statusKey(PositionStatusSet::CLOSED), "Trader-TESTER-000:Index:Positions:Closed");
}

TEST_F(KeySpaceTest, NamespacePrefix_ScopesByTrader) {
    EXPECT_EQ(keys.namespacePrefix(), "Trader-TESTER-000:");

    KeySpace other(TraderId("TESTER", "001"));
    EXPECT_EQ(other.key(KeyKind::ORDERS, "O-1"), "Trader-TESTER-001:Orders:O-1");
}
