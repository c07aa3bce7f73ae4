#include <gtest/gtest.h>

#include "application/ExecutionDatabase.hpp"
#include "adapters/secondary/persistence/InMemoryRecordStore.hpp"
#include "adapters/secondary/serialization/JsonCommandSerializer.hpp"
#include "adapters/secondary/serialization/JsonEventSerializer.hpp"
#include "stubs/TestStubs.hpp"

using namespace execdb;
using namespace execdb::domain;
using execdb::application::ExecutionDatabase;
using execdb::application::KeyKind;
using execdb::tests::TestStubs;

// ============================================================================
// Test Fixture
// ============================================================================

class ExecutionDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryRecordStore>();
        database_ = std::make_unique<ExecutionDatabase>(
            store_,
            std::make_shared<adapters::secondary::JsonCommandSerializer>(),
            std::make_shared<adapters::secondary::JsonEventSerializer>(),
            TestStubs::traderId()
        );
    }

    /**
     * @brief Применить событие и сохранить, как делает движок исполнения
     */
    template <typename E>
    void applyAndUpdate(Order& order, const E& event) {
        order.apply(event);
        database_->updateOrder(order);
    }

    Position openPosition(const std::string& positionId, const std::string& clOrdId, OrderSide side = OrderSide::BUY) {
        auto order = TestStubs::marketOrder(clOrdId, side);
        database_->addOrder(order, std::nullopt, strategyId_);
        applyAndUpdate(order, TestStubs::submitted(order));
        applyAndUpdate(order, TestStubs::accepted(order));
        auto fill = TestStubs::filled(order, "1.00000", positionId);
        applyAndUpdate(order, fill);

        Position position(fill);
        database_->addPosition(position, strategyId_);
        return position;
    }

    std::shared_ptr<adapters::secondary::InMemoryRecordStore> store_;
    std::unique_ptr<ExecutionDatabase> database_;
    const std::string strategyId_ = TestStubs::strategy().id();
};

// ============================================================================
// ТЕСТЫ: счета
// ============================================================================

TEST_F(ExecutionDatabaseTest, LoadAccount_AfterAdd_EqualsAccount) {
    Account account(TestStubs::accountState(TestStubs::ACCOUNT_ID, 1000000));

    database_->addAccount(account);

    auto loaded = database_->loadAccount(account.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, account);
}

TEST_F(ExecutionDatabaseTest, UpdateAccount_OverwritesSnapshot) {
    Account account(TestStubs::accountState(TestStubs::ACCOUNT_ID, 1000000));
    database_->addAccount(account);

    account.apply(TestStubs::accountState(TestStubs::ACCOUNT_ID, 999000));
    database_->updateAccount(account);

    auto loaded = database_->loadAccount(account.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, account);
    EXPECT_DOUBLE_EQ(loaded->cashBalance.toDouble(), 999000.0);
    EXPECT_EQ(store_->getAll(database_->keys().key(KeyKind::ACCOUNTS)).size(), 1u);
}

TEST_F(ExecutionDatabaseTest, AddAccount_IsIdempotent) {
    Account account(TestStubs::accountState(TestStubs::ACCOUNT_ID, 1000000));

    database_->addAccount(account);
    database_->addAccount(account);

    EXPECT_EQ(database_->loadAccounts().size(), 1u);
}

// ============================================================================
// ТЕСТЫ: отсутствие не ошибка
// ============================================================================

TEST_F(ExecutionDatabaseTest, LoadUnknown_ReturnsNullopt) {
    EXPECT_FALSE(database_->loadAccount("NOPE").has_value());
    EXPECT_FALSE(database_->loadOrder("NOPE").has_value());
    EXPECT_FALSE(database_->loadPosition("NOPE").has_value());
    EXPECT_FALSE(database_->orderExists("NOPE"));
    EXPECT_FALSE(database_->positionExists("NOPE"));
    EXPECT_FALSE(database_->positionExistsForOrder("NOPE"));
    EXPECT_FALSE(database_->positionIndexedForOrder("NOPE"));
    EXPECT_TRUE(database_->ordersWorking().empty());
    EXPECT_TRUE(database_->strategyIds().empty());
}

// ============================================================================
// ТЕСТЫ: ордера
// ============================================================================

TEST_F(ExecutionDatabaseTest, AddOrder_WritesCommandAndIndices) {
    auto order = TestStubs::marketOrder("O-1");

    database_->addOrder(order, std::string("P-1"), strategyId_);

    const auto& keys = database_->keys();
    EXPECT_EQ(store_->readLog(keys.key(KeyKind::ORDERS, "O-1")).size(), 1u);
    EXPECT_TRUE(database_->orderExists("O-1"));
    EXPECT_EQ(database_->strategyIdForOrder("O-1"), strategyId_);
    EXPECT_EQ(database_->positionIdForOrder("O-1"), "P-1");
    EXPECT_EQ(database_->orderIdsForPosition("P-1"), (std::set<std::string>{"O-1"}));
    EXPECT_TRUE(store_->isMember(keys.key(KeyKind::INDEX_STRATEGY_ORDERS, strategyId_), "O-1"));
    EXPECT_EQ(database_->ordersWorking(), (std::set<std::string>{"O-1"}));
    EXPECT_TRUE(database_->ordersCompleted().empty());
}

TEST_F(ExecutionDatabaseTest, AddOrder_WithoutPosition_LeavesOrderPositionUnindexed) {
    auto order = TestStubs::marketOrder("O-1");

    database_->addOrder(order, std::nullopt, strategyId_);

    EXPECT_FALSE(database_->positionIndexedForOrder("O-1"));
    EXPECT_FALSE(database_->positionIdForOrder("O-1").has_value());
}

TEST_F(ExecutionDatabaseTest, AddOrder_Duplicate_Throws) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::nullopt, strategyId_);

    EXPECT_THROW(database_->addOrder(order, std::nullopt, strategyId_), std::invalid_argument);
    EXPECT_EQ(store_->readLog(database_->keys().key(KeyKind::ORDERS, "O-1")).size(), 1u);
}

TEST_F(ExecutionDatabaseTest, LoadOrder_FreshOrder_EqualsOriginal) {
    auto order = TestStubs::limitOrder("O-1", OrderSide::SELL, 50000, "1.10000");

    database_->addOrder(order, std::nullopt, strategyId_);

    auto loaded = database_->loadOrder("O-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, order);
}

TEST_F(ExecutionDatabaseTest, UpdateOrder_WithoutNewEvents_LeavesLogUnchanged) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::string("P-1"), strategyId_);

    EXPECT_NO_THROW(database_->updateOrder(order));

    EXPECT_EQ(store_->readLog(database_->keys().key(KeyKind::ORDERS, "O-1")).size(), 1u);
    EXPECT_EQ(database_->ordersWorking().count("O-1"), 1u);
    auto loaded = database_->loadOrder("O-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, order);
}

TEST_F(ExecutionDatabaseTest, UpdateOrder_NeverAdded_Throws) {
    auto order = TestStubs::marketOrder("O-1");
    order.apply(TestStubs::submitted(order));

    EXPECT_THROW(database_->updateOrder(order), std::invalid_argument);
    EXPECT_TRUE(store_->readLog(database_->keys().key(KeyKind::ORDERS, "O-1")).empty());
}

TEST_F(ExecutionDatabaseTest, UpdateOrder_RepeatedWithSameEvents_AppendsNothing) {
    auto order = TestStubs::limitOrder("O-1", OrderSide::BUY, 100000, "1.00000");
    database_->addOrder(order, std::nullopt, strategyId_);

    applyAndUpdate(order, TestStubs::submitted(order));
    applyAndUpdate(order, TestStubs::accepted(order));
    applyAndUpdate(order, TestStubs::working(order));
    database_->updateOrder(order);

    EXPECT_EQ(store_->readLog(database_->keys().key(KeyKind::ORDERS, "O-1")).size(), 4u);
    auto loaded = database_->loadOrder("O-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->events.size(), 3u);
    EXPECT_EQ(*loaded, order);
}

TEST_F(ExecutionDatabaseTest, UpdateOrder_AfterSeveralApplies_LogsEveryEvent) {
    auto order = TestStubs::limitOrder("O-1", OrderSide::BUY, 100000, "1.00000");
    database_->addOrder(order, std::nullopt, strategyId_);

    order.apply(TestStubs::submitted(order));
    order.apply(TestStubs::accepted(order));
    order.apply(TestStubs::working(order));
    database_->updateOrder(order);

    EXPECT_EQ(store_->readLog(database_->keys().key(KeyKind::ORDERS, "O-1")).size(), 4u);
    auto loaded = database_->loadOrder("O-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state, OrderState::WORKING);
    EXPECT_EQ(*loaded, order);

    database_->reset();
    EXPECT_EQ(database_->loadOrders().size(), 1u);
}

TEST_F(ExecutionDatabaseTest, UpdateOrder_FillAmongSeveralEvents_IndexesPosition) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::nullopt, strategyId_);

    TestStubs::acceptOrder(order);
    order.apply(TestStubs::filled(order, "1.00000", std::string("P-3")));
    database_->updateOrder(order);

    EXPECT_EQ(database_->positionIdForOrder("O-1"), std::string("P-3"));
    EXPECT_EQ(database_->orderIdsForPosition("P-3"), (std::set<std::string>{"O-1"}));
    EXPECT_EQ(database_->ordersCompleted().count("O-1"), 1u);
}

TEST_F(ExecutionDatabaseTest, UpdateOrder_StaleCopy_Throws) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::nullopt, strategyId_);
    auto stale = order;
    applyAndUpdate(order, TestStubs::submitted(order));
    applyAndUpdate(order, TestStubs::accepted(order));

    stale.apply(TestStubs::submitted(stale));

    EXPECT_THROW(database_->updateOrder(stale), std::invalid_argument);
    EXPECT_EQ(*database_->order("O-1"), order);
}

TEST_F(ExecutionDatabaseTest, ReplayDeterminism_LimitOrderLifecycle) {
    auto order = TestStubs::limitOrder("O-1", OrderSide::BUY, 100000, "0.99990");
    database_->addOrder(order, std::nullopt, strategyId_);

    applyAndUpdate(order, TestStubs::submitted(order));
    applyAndUpdate(order, TestStubs::accepted(order));
    applyAndUpdate(order, TestStubs::working(order));
    applyAndUpdate(order, TestStubs::filled(order, "0.99990", std::string("P-1"), 30000));
    applyAndUpdate(order, TestStubs::filled(order, "0.99985", std::string("P-1")));

    auto loaded = database_->loadOrder("O-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, order);
    EXPECT_EQ(loaded->state, OrderState::FILLED);
    EXPECT_EQ(loaded->events.size(), 5u);
}

TEST_F(ExecutionDatabaseTest, StatusMigration_WorkingToCompleted) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::nullopt, strategyId_);

    applyAndUpdate(order, TestStubs::submitted(order));
    EXPECT_EQ(database_->ordersWorking().count("O-1"), 1u);
    EXPECT_EQ(database_->ordersCompleted().count("O-1"), 0u);

    applyAndUpdate(order, TestStubs::rejected(order));
    EXPECT_EQ(database_->ordersWorking().count("O-1"), 0u);
    EXPECT_EQ(database_->ordersCompleted().count("O-1"), 1u);
}

TEST_F(ExecutionDatabaseTest, FillWithPosition_IndexesOrderToPosition) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::nullopt, strategyId_);
    applyAndUpdate(order, TestStubs::submitted(order));
    applyAndUpdate(order, TestStubs::accepted(order));

    applyAndUpdate(order, TestStubs::filled(order, "1.00000", std::string("P-9")));

    EXPECT_TRUE(database_->positionIndexedForOrder("O-1"));
    // Позиция проиндексирована, но ещё не сохранена
    EXPECT_FALSE(database_->positionExistsForOrder("O-1"));
    EXPECT_EQ(database_->orderIdsForPosition("P-9"), (std::set<std::string>{"O-1"}));
}

// ============================================================================
// ТЕСТЫ: сквозной сценарий
// ============================================================================

TEST_F(ExecutionDatabaseTest, EndToEnd_MarketBuyFilled) {
    auto order = TestStubs::marketOrder("O-19700101-000000-000-001-1", OrderSide::BUY);
    database_->addOrder(order, std::nullopt, strategyId_);

    applyAndUpdate(order, TestStubs::submitted(order));
    applyAndUpdate(order, TestStubs::accepted(order));
    applyAndUpdate(order, TestStubs::filled(order, "1.00001"));

    auto loaded = database_->loadOrder(order.clOrdId);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state, OrderState::FILLED);
    ASSERT_TRUE(loaded->averagePrice.has_value());
    EXPECT_EQ(loaded->averagePrice->toString(), "1.00001");
    EXPECT_EQ(*loaded, order);
    EXPECT_EQ(database_->ordersCompleted().count(order.clOrdId), 1u);
    EXPECT_EQ(database_->ordersWorking().count(order.clOrdId), 0u);
}

// ============================================================================
// ТЕСТЫ: позиции
// ============================================================================

TEST_F(ExecutionDatabaseTest, AddPosition_IndexesAndLoads) {
    auto position = openPosition("P-1", "O-1");

    EXPECT_TRUE(database_->positionExists("P-1"));
    EXPECT_TRUE(database_->positionExistsForOrder("O-1"));
    EXPECT_EQ(database_->strategyIdForPosition("P-1"), strategyId_);
    EXPECT_EQ(database_->positionsOpen(), (std::set<std::string>{"P-1"}));
    EXPECT_TRUE(database_->positionsClosed().empty());

    auto loaded = database_->loadPosition("P-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, position);
}

TEST_F(ExecutionDatabaseTest, AddPosition_WithoutFills_Throws) {
    auto position = openPosition("P-1", "O-1");
    position.events.clear();

    EXPECT_THROW(database_->addPosition(position, strategyId_), std::invalid_argument);
}

TEST_F(ExecutionDatabaseTest, UpdatePosition_ClosingFill_MigratesToClosed) {
    auto position = openPosition("P-1", "O-1");

    auto closing = TestStubs::marketOrder("O-2", OrderSide::SELL);
    database_->addOrder(closing, std::string("P-1"), strategyId_);
    applyAndUpdate(closing, TestStubs::submitted(closing));
    applyAndUpdate(closing, TestStubs::accepted(closing));
    auto fill = TestStubs::filled(closing, "1.00010", std::string("P-1"));
    applyAndUpdate(closing, fill);

    position.apply(fill);
    database_->updatePosition(position);

    EXPECT_EQ(database_->positionsClosed().count("P-1"), 1u);
    EXPECT_EQ(database_->positionsOpen().count("P-1"), 0u);
    EXPECT_EQ(database_->orderIdsForPosition("P-1"), (std::set<std::string>{"O-1", "O-2"}));

    auto loaded = database_->loadPosition("P-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, position);
    EXPECT_TRUE(loaded->isClosed());
}

TEST_F(ExecutionDatabaseTest, UpdatePosition_AfterSeveralFills_LogsEveryFill) {
    auto position = openPosition("P-1", "O-1");

    for (const char* clOrdId : {"O-2", "O-3"}) {
        auto adding = TestStubs::marketOrder(clOrdId, OrderSide::BUY, 50000);
        database_->addOrder(adding, std::string("P-1"), strategyId_);
        TestStubs::acceptOrder(adding);
        auto fill = TestStubs::filled(adding, "1.00020", std::string("P-1"));
        adding.apply(fill);
        database_->updateOrder(adding);
        position.apply(fill);
    }
    database_->updatePosition(position);
    database_->updatePosition(position);

    EXPECT_EQ(store_->readLog(database_->keys().key(KeyKind::POSITIONS, "P-1")).size(), 3u);
    auto loaded = database_->loadPosition("P-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->relativeQuantity, 200000);
    EXPECT_EQ(*loaded, position);
}

// ============================================================================
// ТЕСТЫ: сценарии движка с несколькими событиями между записями
// ============================================================================

TEST_F(ExecutionDatabaseTest, CheckResiduals_AfterBatchedApplies_FindsWorkingOrderAndOpenPosition) {
    auto first = TestStubs::stopOrder("O-1", OrderSide::BUY, 100000, "1.00000");
    database_->addOrder(first, std::string("P-1"), strategyId_);
    TestStubs::acceptOrder(first);
    first.apply(TestStubs::working(first));
    auto fill = TestStubs::filled(first, "1.00001", std::string("P-1"));
    first.apply(fill);
    Position position(fill);
    database_->updateOrder(first);
    database_->addPosition(position, strategyId_);

    auto second = TestStubs::stopOrder("O-2", OrderSide::BUY, 100000, "1.00000");
    database_->addOrder(second, std::string("P-2"), strategyId_);
    TestStubs::acceptOrder(second);
    second.apply(TestStubs::working(second));
    database_->updateOrder(second);

    ports::input::ResidualReport report;
    EXPECT_NO_THROW(report = database_->checkResiduals());

    EXPECT_EQ(report.workingOrders, (std::vector<std::string>{"O-2"}));
    EXPECT_EQ(report.openPositions, (std::vector<std::string>{"P-1"}));
    EXPECT_TRUE(report.brokenReferences.empty());
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(*database_->loadOrder("O-1"), first);
    EXPECT_EQ(*database_->loadOrder("O-2"), second);
    EXPECT_EQ(*database_->loadPosition("P-1"), position);
}

TEST_F(ExecutionDatabaseTest, Reset_AfterRepeatedUpdates_ReloadsSameOrders) {
    auto first = TestStubs::marketOrder("O-1");
    database_->addOrder(first, std::string("P-1"), strategyId_);
    applyAndUpdate(first, TestStubs::submitted(first));
    applyAndUpdate(first, TestStubs::accepted(first));
    auto fill = TestStubs::filled(first, "1.00001", std::string("P-1"));
    applyAndUpdate(first, fill);
    Position position(fill);
    database_->addPosition(position, strategyId_);

    auto second = TestStubs::stopOrder("O-2", OrderSide::BUY, 100000, "1.00000");
    database_->addOrder(second, std::string("P-2"), strategyId_);
    applyAndUpdate(second, TestStubs::submitted(second));
    applyAndUpdate(second, TestStubs::accepted(second));
    applyAndUpdate(second, TestStubs::working(second));
    database_->updateOrder(second);

    database_->reset();

    EXPECT_TRUE(database_->orders().empty());
    EXPECT_TRUE(database_->positions().empty());

    auto orders = database_->loadOrders();
    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders.at("O-1"), first);
    EXPECT_EQ(orders.at("O-2"), second);
    EXPECT_EQ(database_->loadPositions().at("P-1"), position);
}

TEST_F(ExecutionDatabaseTest, LoadPositions_PositionAddedBeforeOrderUpdate) {
    auto order = TestStubs::stopOrder("O-1", OrderSide::BUY, 100000, "1.00000");
    database_->addOrder(order, std::string("P-1"), strategyId_);
    TestStubs::acceptOrder(order);
    order.apply(TestStubs::working(order));
    order.apply(TestStubs::filled(order, "1.00001", std::string("P-1")));

    const auto* fill = dynamic_cast<const OrderFilledEvent*>(order.lastEvent());
    ASSERT_NE(fill, nullptr);
    Position position(*fill);
    database_->addPosition(position, strategyId_);
    database_->reset();

    auto loaded = database_->loadPositions();

    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded.at("P-1"), position);
    ASSERT_TRUE(database_->position("P-1").has_value());
    EXPECT_EQ(*database_->position("P-1"), position);
}

// ============================================================================
// ТЕСТЫ: стратегии и фильтры
// ============================================================================

TEST_F(ExecutionDatabaseTest, StrategyFilter_IntersectsStatusSets) {
    const std::string otherId = TestStubs::otherStrategy().id();

    database_->addOrder(TestStubs::marketOrder("O-1"), std::nullopt, strategyId_);
    database_->addOrder(TestStubs::marketOrder("O-2"), std::nullopt, otherId);

    EXPECT_EQ(database_->ordersWorking(strategyId_), (std::set<std::string>{"O-1"}));
    EXPECT_EQ(database_->ordersWorking(otherId), (std::set<std::string>{"O-2"}));
    EXPECT_EQ(database_->ordersWorking().size(), 2u);
    EXPECT_TRUE(database_->ordersCompleted(strategyId_).empty());
    EXPECT_TRUE(database_->positionsOpen(otherId).empty());
}

TEST_F(ExecutionDatabaseTest, DeleteStrategy_KeepsOrdersAndPositions) {
    auto strategy = TestStubs::strategy();
    database_->updateStrategy(strategy);
    openPosition("P-1", "O-1");
    EXPECT_EQ(database_->strategyIds(), (std::set<std::string>{strategyId_}));

    database_->deleteStrategy(strategy);

    EXPECT_TRUE(database_->strategyIds().empty());
    EXPECT_TRUE(database_->loadOrder("O-1").has_value());
    EXPECT_TRUE(database_->loadPosition("P-1").has_value());
    EXPECT_EQ(database_->ordersCompleted(strategyId_), (std::set<std::string>{"O-1"}));
}

TEST_F(ExecutionDatabaseTest, DeleteStrategy_Unknown_IsNoOp) {
    EXPECT_NO_THROW(database_->deleteStrategy(TestStubs::otherStrategy()));
}

// ============================================================================
// ТЕСТЫ: массовая загрузка и кэш
// ============================================================================

TEST_F(ExecutionDatabaseTest, LoadOrders_PopulatesCache) {
    auto order = TestStubs::marketOrder("O-1");
    database_->addOrder(order, std::nullopt, strategyId_);
    applyAndUpdate(order, TestStubs::submitted(order));
    database_->reset();
    EXPECT_FALSE(database_->order("O-1").has_value());

    auto loaded = database_->loadOrders();

    ASSERT_EQ(loaded.size(), 1u);
    ASSERT_TRUE(database_->order("O-1").has_value());
    EXPECT_EQ(*database_->order("O-1"), order);
    EXPECT_EQ(database_->orderIds(), (std::set<std::string>{"O-1"}));
}

TEST_F(ExecutionDatabaseTest, Reset_ThenLoadOrders_ReturnsSameContent) {
    auto first = TestStubs::marketOrder("O-1");
    auto second = TestStubs::limitOrder("O-2", OrderSide::SELL, 1000, "1.05000");
    database_->addOrder(first, std::nullopt, strategyId_);
    database_->addOrder(second, std::nullopt, strategyId_);
    applyAndUpdate(first, TestStubs::submitted(first));
    applyAndUpdate(first, TestStubs::rejected(first));

    auto before = database_->loadOrders();
    database_->reset();

    EXPECT_TRUE(database_->orders().empty());
    auto after = database_->loadOrders();
    EXPECT_EQ(after, before);
    EXPECT_EQ(database_->orders(), before);
}

TEST_F(ExecutionDatabaseTest, LoadAccountsAndPositions_FillCache) {
    Account account(TestStubs::accountState(TestStubs::ACCOUNT_ID, 1000000));
    database_->addAccount(account);
    openPosition("P-1", "O-1");
    openPosition("P-2", "O-2", OrderSide::SELL);
    database_->reset();

    EXPECT_EQ(database_->loadAccounts().size(), 1u);
    EXPECT_EQ(database_->loadPositions().size(), 2u);
    EXPECT_TRUE(database_->account(TestStubs::ACCOUNT_ID).has_value());
    EXPECT_EQ(database_->positions().size(), 2u);
    EXPECT_EQ(database_->positionIds(), (std::set<std::string>{"P-1", "P-2"}));
}

TEST_F(ExecutionDatabaseTest, Writes_UpdateCache) {
    Account account(TestStubs::accountState(TestStubs::ACCOUNT_ID, 1000000));
    database_->addAccount(account);
    auto position = openPosition("P-1", "O-1");

    EXPECT_EQ(database_->accounts().size(), 1u);
    ASSERT_TRUE(database_->order("O-1").has_value());
    EXPECT_EQ(database_->order("O-1")->state, OrderState::FILLED);
    ASSERT_TRUE(database_->position("P-1").has_value());
    EXPECT_EQ(*database_->position("P-1"), position);
}

// ============================================================================
// ТЕСТЫ: flush
// ============================================================================

TEST_F(ExecutionDatabaseTest, Flush_RemovesEverythingAndIsIdempotent) {
    database_->addAccount(Account(TestStubs::accountState(TestStubs::ACCOUNT_ID, 1000000)));
    database_->updateStrategy(TestStubs::strategy());
    openPosition("P-1", "O-1");

    database_->flush();

    EXPECT_FALSE(database_->loadAccount(TestStubs::ACCOUNT_ID).has_value());
    EXPECT_FALSE(database_->loadOrder("O-1").has_value());
    EXPECT_FALSE(database_->loadPosition("P-1").has_value());
    EXPECT_TRUE(database_->loadOrders().empty());
    EXPECT_TRUE(database_->loadPositions().empty());
    EXPECT_TRUE(database_->loadAccounts().empty());
    EXPECT_TRUE(database_->strategyIds().empty());
    EXPECT_TRUE(database_->ordersCompleted().empty());
    EXPECT_TRUE(store_->keys().empty());

    EXPECT_NO_THROW(database_->flush());
}

TEST_F(ExecutionDatabaseTest, Flush_LeavesOtherTraders) {
    ExecutionDatabase other(
        store_,
        std::make_shared<adapters::secondary::JsonCommandSerializer>(),
        std::make_shared<adapters::secondary::JsonEventSerializer>(),
        TraderId("TESTER", "001"));
    other.addOrder(TestStubs::marketOrder("O-1"), std::nullopt, strategyId_);
    database_->addOrder(TestStubs::marketOrder("O-1"), std::nullopt, strategyId_);

    database_->flush();

    EXPECT_FALSE(database_->orderExists("O-1"));
    EXPECT_TRUE(other.orderExists("O-1"));
}

// ============================================================================
// ТЕСТЫ: checkResiduals
// ============================================================================

TEST_F(ExecutionDatabaseTest, CheckResiduals_Empty_IsClean) {
    auto report = database_->checkResiduals();
    EXPECT_TRUE(report.clean());
}

TEST_F(ExecutionDatabaseTest, CheckResiduals_ReportsWorkingOrdersAndOpenPositions) {
    database_->addOrder(TestStubs::marketOrder("O-9"), std::nullopt, strategyId_);
    openPosition("P-1", "O-1");

    ports::input::ResidualReport report;
    EXPECT_NO_THROW(report = database_->checkResiduals());

    EXPECT_EQ(report.workingOrders, (std::vector<std::string>{"O-9"}));
    EXPECT_EQ(report.openPositions, (std::vector<std::string>{"P-1"}));
    EXPECT_TRUE(report.brokenReferences.empty());
    EXPECT_TRUE(report.errors.empty());
    EXPECT_FALSE(report.clean());
}

TEST_F(ExecutionDatabaseTest, CheckResiduals_DetectsBrokenReferences) {
    const auto& keys = database_->keys();
    store_->execute(ports::output::RecordBatch()
        .setAdd(keys.key(KeyKind::INDEX_ORDERS_WORKING), "O-ghost")
        .setAdd(keys.key(KeyKind::INDEX_POSITIONS_OPEN), "P-ghost"));

    auto report = database_->checkResiduals();

    EXPECT_EQ(report.workingOrders.size(), 1u);
    EXPECT_EQ(report.openPositions.size(), 1u);
    // Не зарегистрирован + нет стратегии, для ордера и для позиции
    EXPECT_EQ(report.brokenReferences.size(), 4u);
}
