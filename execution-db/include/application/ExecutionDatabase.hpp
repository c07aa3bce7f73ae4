#pragma once

#include "ports/input/IExecutionDatabase.hpp"
#include "ports/output/ICommandSerializer.hpp"
#include "ports/output/IEventSerializer.hpp"
#include "ports/output/IRecordStore.hpp"
#include "application/AccountSnapshotRepository.hpp"
#include "application/EventSourcedRepository.hpp"
#include "application/KeySpace.hpp"
#include "domain/TraderId.hpp"
#include "ThreadSafeMap.hpp"
#include <memory>
#include <string>

namespace execdb::application {

/**
 * @brief База исполнения одного трейдера
 *
 * Реализует IExecutionDatabase поверх IRecordStore:
 * - журналы ордеров и позиций (EventSourcedRepository)
 * - снимки счетов (AccountSnapshotRepository)
 * - десять вторичных индексов и два множества всех id
 * - кэш id -> объект в памяти процесса (ThreadSafeMap)
 *
 * Каждая запись собирается в один RecordBatch. Кэш меняется только
 * после того, как хранилище приняло пакет.
 */
class ExecutionDatabase : public ports::input::IExecutionDatabase {
public:
    ExecutionDatabase(
        std::shared_ptr<ports::output::IRecordStore> store,
        std::shared_ptr<ports::output::ICommandSerializer> commandSerializer,
        std::shared_ptr<ports::output::IEventSerializer> eventSerializer,
        const domain::TraderId& traderId
    );

    const KeySpace& keys() const { return keys_; }

    // ---- Запись ----

    void addAccount(const domain::Account& account) override;
    void updateAccount(const domain::Account& account) override;

    void addOrder(
        const domain::Order& order,
        const std::optional<std::string>& positionId,
        const std::string& strategyId
    ) override;

    void updateOrder(const domain::Order& order) override;

    void addPosition(const domain::Position& position, const std::string& strategyId) override;
    void updatePosition(const domain::Position& position) override;

    void updateStrategy(const domain::Strategy& strategy) override;
    void deleteStrategy(const domain::Strategy& strategy) override;

    // ---- Чтение ----

    std::optional<domain::Account> loadAccount(const std::string& accountId) override;
    std::optional<domain::Order> loadOrder(const std::string& clOrdId) override;
    std::optional<domain::Position> loadPosition(const std::string& positionId) override;

    std::map<std::string, domain::Account> loadAccounts() override;
    std::map<std::string, domain::Order> loadOrders() override;
    std::map<std::string, domain::Position> loadPositions() override;

    // ---- Кэш ----

    std::optional<domain::Account> account(const std::string& accountId) const override;
    std::optional<domain::Order> order(const std::string& clOrdId) const override;
    std::optional<domain::Position> position(const std::string& positionId) const override;

    std::map<std::string, domain::Account> accounts() const override;
    std::map<std::string, domain::Order> orders() const override;
    std::map<std::string, domain::Position> positions() const override;

    // ---- Индексы и запросы ----

    std::set<std::string> strategyIds() override;
    std::set<std::string> orderIds() override;
    std::set<std::string> positionIds() override;

    bool orderExists(const std::string& clOrdId) override;
    bool positionExists(const std::string& positionId) override;
    bool positionExistsForOrder(const std::string& clOrdId) override;
    bool positionIndexedForOrder(const std::string& clOrdId) override;

    std::optional<std::string> positionIdForOrder(const std::string& clOrdId) override;
    std::optional<std::string> strategyIdForOrder(const std::string& clOrdId) override;
    std::optional<std::string> strategyIdForPosition(const std::string& positionId) override;
    std::set<std::string> orderIdsForPosition(const std::string& positionId) override;

    std::set<std::string> ordersWorking(const std::optional<std::string>& strategyId = std::nullopt) override;
    std::set<std::string> ordersCompleted(const std::optional<std::string>& strategyId = std::nullopt) override;
    std::set<std::string> positionsOpen(const std::optional<std::string>& strategyId = std::nullopt) override;
    std::set<std::string> positionsClosed(const std::optional<std::string>& strategyId = std::nullopt) override;

    // ---- Обслуживание ----

    ports::input::ResidualReport checkResiduals() override;
    void reset() override;
    void flush() override;

private:
    /**
     * @brief Перевести id в целевое множество статуса и убрать из противоположного
     */
    template <typename StatusSet>
    void migrate(ports::output::RecordBatch& batch, const std::string& id, StatusSet target) const {
        batch.setAdd(keys_.statusKey(target), id);
        batch.setRemove(keys_.statusKey(domain::leftBy(target)), id);
    }

    std::set<std::string> filtered(const std::string& statusKey,
                                   const std::optional<std::string>& strategyId,
                                   KeyKind strategyKind);

    void checkOrder(const std::string& clOrdId, ports::input::ResidualReport& report);
    void checkPosition(const std::string& positionId, ports::input::ResidualReport& report);

    std::shared_ptr<ports::output::IRecordStore> store_;
    std::shared_ptr<ports::output::ICommandSerializer> commandSerializer_;
    std::shared_ptr<ports::output::IEventSerializer> eventSerializer_;
    KeySpace keys_;

    AccountSnapshotRepository accountRepository_;
    EventSourcedRepository<domain::Order> orderRepository_;
    EventSourcedRepository<domain::Position> positionRepository_;

    ThreadSafeMap<std::string, domain::Account> cachedAccounts_;
    ThreadSafeMap<std::string, domain::Order> cachedOrders_;
    ThreadSafeMap<std::string, domain::Position> cachedPositions_;
};

} // namespace execdb::application
