#pragma once

#include "Event.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace execdb::domain {

/**
 * @brief Событие: истёк срок действия ордера
 */
struct OrderExpiredEvent : public OrderEvent {
    std::string orderId;

    OrderExpiredEvent() : OrderEvent("OrderExpired") {}

    /// JSON конструктор для восстановления из журнала
    explicit OrderExpiredEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderExpiredEvent>(*this);
    }
};

} // namespace execdb::domain
