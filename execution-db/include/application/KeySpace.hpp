#pragma once

#include "domain/TraderId.hpp"
#include "domain/enums/StatusSet.hpp"
#include <optional>
#include <string>

namespace execdb::application {

/**
 * @brief Вид ключа в пространстве трейдера
 */
enum class KeyKind {
    TRADER,                     ///< Корень: Trader-{id}
    ACCOUNTS,                   ///< Хэш снимков счетов
    ORDERS,                     ///< Журнал ордера (+ id)
    POSITIONS,                  ///< Журнал позиции (+ id)
    STRATEGIES,                 ///< Реестр стратегий
    INDEX_ORDER_POSITION,       ///< Хэш order -> position
    INDEX_ORDER_STRATEGY,       ///< Хэш order -> strategy
    INDEX_POSITION_STRATEGY,    ///< Хэш position -> strategy
    INDEX_POSITION_ORDERS,      ///< Множество ордеров позиции (+ id)
    INDEX_STRATEGY_ORDERS,      ///< Множество ордеров стратегии (+ id)
    INDEX_STRATEGY_POSITIONS,   ///< Множество позиций стратегии (+ id)
    INDEX_ORDERS,               ///< Все ордера
    INDEX_ORDERS_WORKING,
    INDEX_ORDERS_COMPLETED,
    INDEX_POSITIONS,            ///< Все позиции
    INDEX_POSITIONS_OPEN,
    INDEX_POSITIONS_CLOSED
};

/**
 * @brief Вывод ключей хранилища для одного трейдера
 *
 * Шаблоны ключей являются контрактом стабильности: другие процессы
 * читают то же хранилище по тем же строкам.
 *
 * @code
 * KeySpace keys(TraderId("TESTER", "000"));
 * keys.key(KeyKind::ORDERS, "O-1");   // "Trader-TESTER-000:Orders:O-1"
 * @endcode
 */
class KeySpace {
public:
    explicit KeySpace(const domain::TraderId& traderId)
        : traderId_(traderId) {}

    /**
     * @brief Чистая функция вывода ключа
     * @throws std::invalid_argument если id передан для вида без суффикса
     */
    static std::string key(
        const domain::TraderId& traderId,
        KeyKind kind,
        const std::optional<std::string>& id = std::nullopt
    );

    /**
     * @brief Принимает ли вид ключа суффикс-идентификатор
     */
    static bool takesId(KeyKind kind);

    std::string key(KeyKind kind, const std::optional<std::string>& id = std::nullopt) const {
        return key(traderId_, kind, id);
    }

    const domain::TraderId& traderId() const { return traderId_; }

    /**
     * @brief Префикс всех ключей трейдера (для flush)
     */
    std::string namespacePrefix() const {
        return key(KeyKind::TRADER) + ":";
    }

    std::string statusKey(domain::OrderStatusSet set) const {
        return key(set == domain::OrderStatusSet::WORKING
                       ? KeyKind::INDEX_ORDERS_WORKING
                       : KeyKind::INDEX_ORDERS_COMPLETED);
    }

    std::string statusKey(domain::PositionStatusSet set) const {
        return key(set == domain::PositionStatusSet::OPEN
                       ? KeyKind::INDEX_POSITIONS_OPEN
                       : KeyKind::INDEX_POSITIONS_CLOSED);
    }

private:
    domain::TraderId traderId_;
};

} // namespace execdb::application
