#pragma once

#include "domain/Account.hpp"
#include "domain/Order.hpp"
#include "domain/Position.hpp"
#include "domain/Strategy.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace execdb::ports::input {

/**
 * @brief Результат проверки остатков прошлого запуска
 */
struct ResidualReport {
    std::vector<std::string> workingOrders;     ///< Ордера, всё ещё в working
    std::vector<std::string> openPositions;     ///< Позиции, всё ещё open
    std::vector<std::string> brokenReferences;  ///< Описания нарушенных ссылок индексов
    std::vector<std::string> errors;            ///< Ошибки хранилища во время проверки

    bool clean() const {
        return workingOrders.empty() && openPositions.empty() &&
               brokenReferences.empty() && errors.empty();
    }
};

/**
 * @brief Интерфейс базы исполнения
 *
 * Input Port для движка исполнения (запись) и для последовательности
 * прогрева при старте (массовая загрузка, проверка остатков).
 * Все данные принадлежат одному трейдеру.
 */
class IExecutionDatabase {
public:
    virtual ~IExecutionDatabase() = default;

    // ---- Запись ----

    /**
     * @brief Сохранить снимок счёта (upsert)
     */
    virtual void addAccount(const domain::Account& account) = 0;

    virtual void updateAccount(const domain::Account& account) = 0;

    /**
     * @brief Сохранить новый ордер: запись 0 журнала + индексы
     *
     * @param order Ордер
     * @param positionId Позиция, если уже назначена
     * @param strategyId Стратегия, которой принадлежит ордер
     * @throws std::invalid_argument если ордер с таким ID уже существует
     */
    virtual void addOrder(
        const domain::Order& order,
        const std::optional<std::string>& positionId,
        const std::string& strategyId
    ) = 0;

    /**
     * @brief Дописать в журнал все события ордера, которых там ещё нет
     *
     * Повторный вызов без новых событий только подтверждает множество статуса.
     * @throws std::invalid_argument если ордер не добавлен или журнал длиннее истории ордера
     */
    virtual void updateOrder(const domain::Order& order) = 0;

    virtual void addPosition(const domain::Position& position, const std::string& strategyId) = 0;

    /**
     * @brief Дописать в журнал позиции все сделки, которых там ещё нет
     * @throws std::invalid_argument если позиция не добавлена или журнал длиннее истории позиции
     */
    virtual void updatePosition(const domain::Position& position) = 0;

    virtual void updateStrategy(const domain::Strategy& strategy) = 0;

    virtual void deleteStrategy(const domain::Strategy& strategy) = 0;

    // ---- Чтение ----

    virtual std::optional<domain::Account> loadAccount(const std::string& accountId) = 0;

    virtual std::optional<domain::Order> loadOrder(const std::string& clOrdId) = 0;

    virtual std::optional<domain::Position> loadPosition(const std::string& positionId) = 0;

    virtual std::map<std::string, domain::Account> loadAccounts() = 0;

    virtual std::map<std::string, domain::Order> loadOrders() = 0;

    virtual std::map<std::string, domain::Position> loadPositions() = 0;

    // ---- Кэш ----
    // Только содержимое кэша, без обращения к хранилищу

    virtual std::optional<domain::Account> account(const std::string& accountId) const = 0;

    virtual std::optional<domain::Order> order(const std::string& clOrdId) const = 0;

    virtual std::optional<domain::Position> position(const std::string& positionId) const = 0;

    virtual std::map<std::string, domain::Account> accounts() const = 0;

    virtual std::map<std::string, domain::Order> orders() const = 0;

    virtual std::map<std::string, domain::Position> positions() const = 0;

    // ---- Индексы и запросы ----

    virtual std::set<std::string> strategyIds() = 0;

    virtual std::set<std::string> orderIds() = 0;

    virtual std::set<std::string> positionIds() = 0;

    virtual bool orderExists(const std::string& clOrdId) = 0;

    virtual bool positionExists(const std::string& positionId) = 0;

    /**
     * @brief Индекс order -> position указывает на существующую позицию
     */
    virtual bool positionExistsForOrder(const std::string& clOrdId) = 0;

    /**
     * @brief Есть ли запись в индексе order -> position (позиция может ещё не существовать)
     */
    virtual bool positionIndexedForOrder(const std::string& clOrdId) = 0;

    virtual std::optional<std::string> positionIdForOrder(const std::string& clOrdId) = 0;

    virtual std::optional<std::string> strategyIdForOrder(const std::string& clOrdId) = 0;

    virtual std::optional<std::string> strategyIdForPosition(const std::string& positionId) = 0;

    virtual std::set<std::string> orderIdsForPosition(const std::string& positionId) = 0;

    virtual std::set<std::string> ordersWorking(const std::optional<std::string>& strategyId = std::nullopt) = 0;

    virtual std::set<std::string> ordersCompleted(const std::optional<std::string>& strategyId = std::nullopt) = 0;

    virtual std::set<std::string> positionsOpen(const std::optional<std::string>& strategyId = std::nullopt) = 0;

    virtual std::set<std::string> positionsClosed(const std::optional<std::string>& strategyId = std::nullopt) = 0;

    // ---- Обслуживание ----

    /**
     * @brief Проверить остатки прошлого запуска. Никогда не бросает.
     */
    virtual ResidualReport checkResiduals() = 0;

    /**
     * @brief Сбросить только кэш в памяти процесса
     */
    virtual void reset() = 0;

    /**
     * @brief Удалить все данные трейдера (идемпотентно)
     */
    virtual void flush() = 0;
};

} // namespace execdb::ports::input
