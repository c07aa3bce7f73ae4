#pragma once

#include "Event.hpp"
#include "domain/Price.hpp"
#include "domain/enums/OrderSide.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace execdb::domain {

/**
 * @brief Событие: ордер исполнен (полностью или частично)
 *
 * Открывает позицию или меняет её. Частичное исполнение определяется
 * по leavesQuantity > 0.
 */
struct OrderFilledEvent : public OrderEvent {
    std::string orderId;                    ///< Идентификатор ордера на бирже
    std::string executionId;                ///< Идентификатор сделки
    std::optional<std::string> positionId;  ///< Позиция, к которой относится сделка
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    int64_t filledQuantity = 0;             ///< Исполнено в этой сделке
    int64_t cumulativeQuantity = 0;         ///< Исполнено всего по ордеру
    int64_t leavesQuantity = 0;             ///< Осталось исполнить
    Price averagePrice;                     ///< Цена исполнения
    std::string currency = "USD";

    OrderFilledEvent() : OrderEvent("OrderFilled") {}

    explicit OrderFilledEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderFilledEvent>(*this);
    }

    bool isPartialFill() const {
        return leavesQuantity > 0;
    }
};

} // namespace execdb::domain
