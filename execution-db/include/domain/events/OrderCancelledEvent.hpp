#pragma once

#include "Event.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace execdb::domain {

/**
 * @brief Событие: ордер отменён
 */
struct OrderCancelledEvent : public OrderEvent {
    std::string orderId;

    OrderCancelledEvent() : OrderEvent("OrderCancelled") {}

    /// JSON конструктор для восстановления из журнала
    explicit OrderCancelledEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderCancelledEvent>(*this);
    }
};

} // namespace execdb::domain
