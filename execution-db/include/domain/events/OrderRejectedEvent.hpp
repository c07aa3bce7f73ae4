#pragma once

#include "Event.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace execdb::domain {

/**
 * @brief Событие: ордер отклонён
 */
struct OrderRejectedEvent : public OrderEvent {
    std::string reason;         ///< Причина отказа

    OrderRejectedEvent() : OrderEvent("OrderRejected") {}

    /// JSON конструктор для восстановления из журнала
    explicit OrderRejectedEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderRejectedEvent>(*this);
    }
};

} // namespace execdb::domain
