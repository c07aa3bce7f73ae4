#include "application/ExecutionDatabase.hpp"
#include "domain/commands/SubmitOrderCommand.hpp"
#include "domain/events/OrderFilledEvent.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace execdb::application {

namespace {

domain::OrderStatusSet statusOf(const domain::Order& order) {
    return order.isCompleted() ? domain::OrderStatusSet::COMPLETED : domain::OrderStatusSet::WORKING;
}

domain::PositionStatusSet statusOf(const domain::Position& position) {
    return position.isOpen() ? domain::PositionStatusSet::OPEN : domain::PositionStatusSet::CLOSED;
}

template <typename V>
std::optional<V> cached(const ThreadSafeMap<std::string, V>& cache, const std::string& id) {
    auto found = cache.find(id);
    if (!found) {
        return std::nullopt;
    }
    return *found;
}

template <typename V>
std::map<std::string, V> snapshot(const ThreadSafeMap<std::string, V>& cache) {
    std::map<std::string, V> result;
    for (const auto& [id, value] : cache.getAll()) {
        result.emplace(id, *value);
    }
    return result;
}

} // namespace

ExecutionDatabase::ExecutionDatabase(
    std::shared_ptr<ports::output::IRecordStore> store,
    std::shared_ptr<ports::output::ICommandSerializer> commandSerializer,
    std::shared_ptr<ports::output::IEventSerializer> eventSerializer,
    const domain::TraderId& traderId
)
    : store_(std::move(store))
    , commandSerializer_(std::move(commandSerializer))
    , eventSerializer_(std::move(eventSerializer))
    , keys_(traderId)
    , accountRepository_(store_, keys_, eventSerializer_)
    , orderRepository_(store_, keys_, Codecs{commandSerializer_, eventSerializer_})
    , positionRepository_(store_, keys_, Codecs{commandSerializer_, eventSerializer_})
{
    std::cout << "[ExecutionDatabase] Created for trader " << traderId.value() << std::endl;
}

// ============================================
// ЗАПИСЬ
// ============================================

void ExecutionDatabase::addAccount(const domain::Account& account) {
    ports::output::RecordBatch batch;
    accountRepository_.upsert(batch, account);
    store_->execute(batch);

    cachedAccounts_.insert(account.id, std::make_shared<domain::Account>(account));
    std::cout << "[ExecutionDatabase] Saved account: " << account.id << std::endl;
}

void ExecutionDatabase::updateAccount(const domain::Account& account) {
    addAccount(account);
}

void ExecutionDatabase::addOrder(
    const domain::Order& order,
    const std::optional<std::string>& positionId,
    const std::string& strategyId)
{
    if (orderRepository_.exists(order.clOrdId)) {
        throw std::invalid_argument("Order already exists: " + order.clOrdId);
    }

    domain::SubmitOrderCommand command;
    command.commandId = order.initId;
    command.timestamp = order.initTimestamp;
    command.traderId = keys_.traderId();
    command.strategyId = strategyId;
    command.positionId = positionId;
    command.clOrdId = order.clOrdId;
    command.symbol = order.symbol;
    command.side = order.side;
    command.orderType = order.type;
    command.quantity = order.quantity;
    command.price = order.price;
    command.initId = order.initId;
    command.initTimestamp = order.initTimestamp;

    ports::output::RecordBatch batch;
    orderRepository_.appendFirst(batch, order.clOrdId, commandSerializer_->serialize(command));
    // События, уже применённые к ордеру, идут следом за записью 0
    for (const auto& event : order.events) {
        orderRepository_.appendNext(batch, order.clOrdId, eventSerializer_->serialize(*event));
    }

    batch.hashSet(keys_.key(KeyKind::INDEX_ORDER_STRATEGY), order.clOrdId, strategyId);
    batch.setAdd(keys_.key(KeyKind::INDEX_STRATEGY_ORDERS, strategyId), order.clOrdId);
    if (positionId) {
        batch.hashSet(keys_.key(KeyKind::INDEX_ORDER_POSITION), order.clOrdId, *positionId);
        batch.setAdd(keys_.key(KeyKind::INDEX_POSITION_ORDERS, *positionId), order.clOrdId);
    }
    migrate(batch, order.clOrdId, statusOf(order));

    store_->execute(batch);

    cachedOrders_.insert(order.clOrdId, std::make_shared<domain::Order>(order));
    std::cout << "[ExecutionDatabase] Added order: " << order.clOrdId
              << " strategy=" << strategyId << std::endl;
}

void ExecutionDatabase::updateOrder(const domain::Order& order) {
    const size_t logged = store_->logLength(orderRepository_.logKey(order.clOrdId));
    if (logged == 0) {
        throw std::invalid_argument("Order was never added: " + order.clOrdId);
    }

    // Запись 0 журнала - команда, далее события ордера по порядку
    const size_t persisted = logged - 1;
    if (persisted > order.events.size()) {
        throw std::invalid_argument(
            "Order " + order.clOrdId + " has " + std::to_string(order.events.size()) +
            " event(s) but its log already holds " + std::to_string(persisted));
    }

    ports::output::RecordBatch batch;
    bool positionIndexed = positionIndexedForOrder(order.clOrdId);
    for (size_t i = persisted; i < order.events.size(); ++i) {
        const auto& event = *order.events[i];
        orderRepository_.appendNext(batch, order.clOrdId, eventSerializer_->serialize(event));

        auto* fill = dynamic_cast<const domain::OrderFilledEvent*>(&event);
        if (fill && fill->positionId && !positionIndexed) {
            batch.hashSet(keys_.key(KeyKind::INDEX_ORDER_POSITION), order.clOrdId, *fill->positionId);
            batch.setAdd(keys_.key(KeyKind::INDEX_POSITION_ORDERS, *fill->positionId), order.clOrdId);
            positionIndexed = true;
        }
    }
    migrate(batch, order.clOrdId, statusOf(order));

    store_->execute(batch);

    cachedOrders_.insert(order.clOrdId, std::make_shared<domain::Order>(order));
    std::cout << "[ExecutionDatabase] Updated order: " << order.clOrdId
              << " (+" << order.events.size() - persisted << " event(s), "
              << toString(order.state) << ")" << std::endl;
}

void ExecutionDatabase::addPosition(const domain::Position& position, const std::string& strategyId) {
    if (position.events.empty()) {
        throw std::invalid_argument("Position has no fills: " + position.id);
    }
    if (positionRepository_.exists(position.id)) {
        throw std::invalid_argument("Position already exists: " + position.id);
    }

    ports::output::RecordBatch batch;
    positionRepository_.appendFirst(batch, position.id, eventSerializer_->serialize(*position.events.front()));
    for (size_t i = 1; i < position.events.size(); ++i) {
        positionRepository_.appendNext(batch, position.id, eventSerializer_->serialize(*position.events[i]));
    }

    batch.hashSet(keys_.key(KeyKind::INDEX_POSITION_STRATEGY), position.id, strategyId);
    batch.setAdd(keys_.key(KeyKind::INDEX_STRATEGY_POSITIONS, strategyId), position.id);
    for (const auto& orderId : position.orderIds) {
        batch.setAdd(keys_.key(KeyKind::INDEX_POSITION_ORDERS, position.id), orderId);
    }
    migrate(batch, position.id, statusOf(position));

    store_->execute(batch);

    cachedPositions_.insert(position.id, std::make_shared<domain::Position>(position));
    std::cout << "[ExecutionDatabase] Added position: " << position.id
              << " strategy=" << strategyId << std::endl;
}

void ExecutionDatabase::updatePosition(const domain::Position& position) {
    const size_t persisted = store_->logLength(positionRepository_.logKey(position.id));
    if (persisted == 0) {
        throw std::invalid_argument("Position was never added: " + position.id);
    }
    if (persisted > position.events.size()) {
        throw std::invalid_argument(
            "Position " + position.id + " has " + std::to_string(position.events.size()) +
            " fill(s) but its log already holds " + std::to_string(persisted));
    }

    ports::output::RecordBatch batch;
    for (size_t i = persisted; i < position.events.size(); ++i) {
        const auto& fill = *position.events[i];
        positionRepository_.appendNext(batch, position.id, eventSerializer_->serialize(fill));
        batch.setAdd(keys_.key(KeyKind::INDEX_POSITION_ORDERS, position.id), fill.clOrdId);
    }
    migrate(batch, position.id, statusOf(position));

    store_->execute(batch);

    cachedPositions_.insert(position.id, std::make_shared<domain::Position>(position));
    std::cout << "[ExecutionDatabase] Updated position: " << position.id
              << " (+" << position.events.size() - persisted << " fill(s), "
              << toString(statusOf(position)) << ")" << std::endl;
}

void ExecutionDatabase::updateStrategy(const domain::Strategy& strategy) {
    ports::output::RecordBatch batch;
    batch.setAdd(keys_.key(KeyKind::STRATEGIES), strategy.id());
    store_->execute(batch);
    std::cout << "[ExecutionDatabase] Registered strategy: " << strategy.id() << std::endl;
}

void ExecutionDatabase::deleteStrategy(const domain::Strategy& strategy) {
    ports::output::RecordBatch batch;
    batch.setRemove(keys_.key(KeyKind::STRATEGIES), strategy.id());
    store_->execute(batch);
    std::cout << "[ExecutionDatabase] Removed strategy: " << strategy.id() << std::endl;
}

// ============================================
// ЧТЕНИЕ
// ============================================

std::optional<domain::Account> ExecutionDatabase::loadAccount(const std::string& accountId) {
    return accountRepository_.load(accountId);
}

std::optional<domain::Order> ExecutionDatabase::loadOrder(const std::string& clOrdId) {
    return orderRepository_.load(clOrdId);
}

std::optional<domain::Position> ExecutionDatabase::loadPosition(const std::string& positionId) {
    return positionRepository_.load(positionId);
}

std::map<std::string, domain::Account> ExecutionDatabase::loadAccounts() {
    auto loaded = accountRepository_.loadAll();
    for (const auto& [id, account] : loaded) {
        cachedAccounts_.insert(id, std::make_shared<domain::Account>(account));
    }
    std::cout << "[ExecutionDatabase] Loaded " << loaded.size() << " account(s)" << std::endl;
    return loaded;
}

std::map<std::string, domain::Order> ExecutionDatabase::loadOrders() {
    auto loaded = orderRepository_.loadAll();
    for (const auto& [id, order] : loaded) {
        cachedOrders_.insert(id, std::make_shared<domain::Order>(order));
    }
    std::cout << "[ExecutionDatabase] Loaded " << loaded.size() << " order(s)" << std::endl;
    return loaded;
}

std::map<std::string, domain::Position> ExecutionDatabase::loadPositions() {
    auto loaded = positionRepository_.loadAll();
    for (const auto& [id, position] : loaded) {
        cachedPositions_.insert(id, std::make_shared<domain::Position>(position));
    }
    std::cout << "[ExecutionDatabase] Loaded " << loaded.size() << " position(s)" << std::endl;
    return loaded;
}

// ============================================
// КЭШ
// ============================================

std::optional<domain::Account> ExecutionDatabase::account(const std::string& accountId) const {
    return cached(cachedAccounts_, accountId);
}

std::optional<domain::Order> ExecutionDatabase::order(const std::string& clOrdId) const {
    return cached(cachedOrders_, clOrdId);
}

std::optional<domain::Position> ExecutionDatabase::position(const std::string& positionId) const {
    return cached(cachedPositions_, positionId);
}

std::map<std::string, domain::Account> ExecutionDatabase::accounts() const {
    return snapshot(cachedAccounts_);
}

std::map<std::string, domain::Order> ExecutionDatabase::orders() const {
    return snapshot(cachedOrders_);
}

std::map<std::string, domain::Position> ExecutionDatabase::positions() const {
    return snapshot(cachedPositions_);
}

// ============================================
// ИНДЕКСЫ И ЗАПРОСЫ
// ============================================

std::set<std::string> ExecutionDatabase::strategyIds() {
    return store_->members(keys_.key(KeyKind::STRATEGIES));
}

std::set<std::string> ExecutionDatabase::orderIds() {
    return orderRepository_.ids();
}

std::set<std::string> ExecutionDatabase::positionIds() {
    return positionRepository_.ids();
}

bool ExecutionDatabase::orderExists(const std::string& clOrdId) {
    return orderRepository_.exists(clOrdId);
}

bool ExecutionDatabase::positionExists(const std::string& positionId) {
    return positionRepository_.exists(positionId);
}

bool ExecutionDatabase::positionExistsForOrder(const std::string& clOrdId) {
    auto positionId = positionIdForOrder(clOrdId);
    return positionId && !positionId->empty() && positionExists(*positionId);
}

bool ExecutionDatabase::positionIndexedForOrder(const std::string& clOrdId) {
    return positionIdForOrder(clOrdId).has_value();
}

std::optional<std::string> ExecutionDatabase::positionIdForOrder(const std::string& clOrdId) {
    return store_->getField(keys_.key(KeyKind::INDEX_ORDER_POSITION), clOrdId);
}

std::optional<std::string> ExecutionDatabase::strategyIdForOrder(const std::string& clOrdId) {
    return store_->getField(keys_.key(KeyKind::INDEX_ORDER_STRATEGY), clOrdId);
}

std::optional<std::string> ExecutionDatabase::strategyIdForPosition(const std::string& positionId) {
    return store_->getField(keys_.key(KeyKind::INDEX_POSITION_STRATEGY), positionId);
}

std::set<std::string> ExecutionDatabase::orderIdsForPosition(const std::string& positionId) {
    return store_->members(keys_.key(KeyKind::INDEX_POSITION_ORDERS, positionId));
}

std::set<std::string> ExecutionDatabase::filtered(
    const std::string& statusKey,
    const std::optional<std::string>& strategyId,
    KeyKind strategyKind)
{
    auto ids = store_->members(statusKey);
    if (!strategyId) {
        return ids;
    }

    auto scoped = store_->members(keys_.key(strategyKind, *strategyId));
    std::set<std::string> result;
    std::set_intersection(ids.begin(), ids.end(), scoped.begin(), scoped.end(),
                          std::inserter(result, result.begin()));
    return result;
}

std::set<std::string> ExecutionDatabase::ordersWorking(const std::optional<std::string>& strategyId) {
    return filtered(keys_.statusKey(domain::OrderStatusSet::WORKING), strategyId, KeyKind::INDEX_STRATEGY_ORDERS);
}

std::set<std::string> ExecutionDatabase::ordersCompleted(const std::optional<std::string>& strategyId) {
    return filtered(keys_.statusKey(domain::OrderStatusSet::COMPLETED), strategyId, KeyKind::INDEX_STRATEGY_ORDERS);
}

std::set<std::string> ExecutionDatabase::positionsOpen(const std::optional<std::string>& strategyId) {
    return filtered(keys_.statusKey(domain::PositionStatusSet::OPEN), strategyId, KeyKind::INDEX_STRATEGY_POSITIONS);
}

std::set<std::string> ExecutionDatabase::positionsClosed(const std::optional<std::string>& strategyId) {
    return filtered(keys_.statusKey(domain::PositionStatusSet::CLOSED), strategyId, KeyKind::INDEX_STRATEGY_POSITIONS);
}

// ============================================
// ОБСЛУЖИВАНИЕ
// ============================================

ports::input::ResidualReport ExecutionDatabase::checkResiduals() {
    ports::input::ResidualReport report;

    try {
        for (const auto& clOrdId : ordersWorking()) {
            report.workingOrders.push_back(clOrdId);
            std::cerr << "[ExecutionDatabase] Residual working order: " << clOrdId << std::endl;
            checkOrder(clOrdId, report);
        }
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("working orders: ") + e.what());
        std::cerr << "[ExecutionDatabase] checkResiduals() failed on working orders: " << e.what() << std::endl;
    }

    try {
        for (const auto& positionId : positionsOpen()) {
            report.openPositions.push_back(positionId);
            std::cerr << "[ExecutionDatabase] Residual open position: " << positionId << std::endl;
            checkPosition(positionId, report);
        }
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("open positions: ") + e.what());
        std::cerr << "[ExecutionDatabase] checkResiduals() failed on open positions: " << e.what() << std::endl;
    }

    for (const auto& broken : report.brokenReferences) {
        std::cerr << "[ExecutionDatabase] Broken reference: " << broken << std::endl;
    }

    std::cout << "[ExecutionDatabase] Residual check: "
              << report.workingOrders.size() << " working order(s), "
              << report.openPositions.size() << " open position(s), "
              << report.brokenReferences.size() << " broken reference(s)" << std::endl;
    return report;
}

void ExecutionDatabase::checkOrder(const std::string& clOrdId, ports::input::ResidualReport& report) {
    try {
        if (!orderExists(clOrdId)) {
            report.brokenReferences.push_back("order " + clOrdId + " is working but not registered");
        }
        if (!strategyIdForOrder(clOrdId)) {
            report.brokenReferences.push_back("order " + clOrdId + " has no strategy");
        }
        auto positionId = positionIdForOrder(clOrdId);
        if (positionId && !store_->isMember(keys_.key(KeyKind::INDEX_POSITION_ORDERS, *positionId), clOrdId)) {
            report.brokenReferences.push_back(
                "order " + clOrdId + " -> position " + *positionId + " is not in the position's orders");
        }
    } catch (const std::exception& e) {
        report.errors.push_back("order " + clOrdId + ": " + e.what());
    }
}

void ExecutionDatabase::checkPosition(const std::string& positionId, ports::input::ResidualReport& report) {
    try {
        if (!positionExists(positionId)) {
            report.brokenReferences.push_back("position " + positionId + " is open but not registered");
        }
        if (!strategyIdForPosition(positionId)) {
            report.brokenReferences.push_back("position " + positionId + " has no strategy");
        }
        for (const auto& clOrdId : orderIdsForPosition(positionId)) {
            auto indexed = positionIdForOrder(clOrdId);
            if (indexed && *indexed != positionId) {
                report.brokenReferences.push_back(
                    "position " + positionId + " lists order " + clOrdId + " indexed to " + *indexed);
            }
        }
    } catch (const std::exception& e) {
        report.errors.push_back("position " + positionId + ": " + e.what());
    }
}

void ExecutionDatabase::reset() {
    std::cout << "[ExecutionDatabase] Cache reset: dropping "
              << cachedAccounts_.size() << " account(s), "
              << cachedOrders_.size() << " order(s), "
              << cachedPositions_.size() << " position(s)" << std::endl;
    cachedAccounts_.clear();
    cachedOrders_.clear();
    cachedPositions_.clear();
}

void ExecutionDatabase::flush() {
    store_->deleteNamespace(keys_.namespacePrefix());
    reset();
    std::cout << "[ExecutionDatabase] Flushed " << keys_.key(KeyKind::TRADER) << std::endl;
}

} // namespace execdb::application
