#pragma once

#include "enums/OrderSide.hpp"
#include "enums/OrderState.hpp"
#include "enums/OrderType.hpp"
#include "events/Event.hpp"
#include "Price.hpp"
#include "Timestamp.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace execdb::domain {

struct SubmitOrderCommand;

/**
 * @brief Торговый ордер, изменяемый применением событий
 *
 * Состояние выводится только из параметров инициализации и
 * последовательности применённых событий, поэтому ордер можно точно
 * восстановить повторным применением журнала.
 */
struct Order {
    std::string clOrdId;                    ///< Клиентский ID ордера
    std::string symbol;                     ///< Инструмент
    OrderSide side = OrderSide::BUY;        ///< BUY / SELL
    OrderType type = OrderType::MARKET;     ///< MARKET / LIMIT / STOP
    int64_t quantity = 0;                   ///< Количество
    std::optional<Price> price;             ///< Цена (для LIMIT / STOP)
    std::string initId;                     ///< ID инициализации
    Timestamp initTimestamp;                ///< Время создания

    OrderState state = OrderState::INITIALIZED;
    std::optional<std::string> accountId;   ///< Из первого события
    std::optional<std::string> orderId;     ///< ID на бирже
    std::optional<std::string> executionId; ///< Последняя сделка
    std::optional<std::string> positionId;  ///< Позиция из последней сделки
    int64_t filledQuantity = 0;
    std::optional<Price> averagePrice;

    std::vector<std::shared_ptr<const OrderEvent>> events;  ///< Применённые события по порядку

    Order() = default;

    Order(
        const std::string& clOrdId,
        const std::string& symbol,
        OrderSide side,
        OrderType type,
        int64_t quantity,
        const std::optional<Price>& price,
        const std::string& initId,
        const Timestamp& initTimestamp
    );

    /**
     * @brief Фабрика: исходный ордер из команды SubmitOrder
     */
    static Order create(const SubmitOrderCommand& command);

    /**
     * @brief Применить событие
     * @throws std::invalid_argument если событие относится к другому ордеру
     * @throws InvalidStateTrigger если переход не разрешён в текущем состоянии
     */
    void apply(const OrderEvent& event);

    /**
     * @brief Последнее применённое событие или nullptr
     */
    const OrderEvent* lastEvent() const {
        return events.empty() ? nullptr : events.back().get();
    }

    bool isCompleted() const {
        return isCompletedState(state);
    }

    bool isWorking() const {
        return !isCompleted();
    }

    bool operator==(const Order& other) const;

    bool operator!=(const Order& other) const {
        return !(*this == other);
    }
};

} // namespace execdb::domain
