#pragma once

#include "Event.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace execdb::domain {

/**
 * @brief Событие: ордер отправлен на биржу
 */
struct OrderSubmittedEvent : public OrderEvent {
    OrderSubmittedEvent() : OrderEvent("OrderSubmitted") {}

    /// JSON конструктор для восстановления из журнала
    explicit OrderSubmittedEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderSubmittedEvent>(*this);
    }
};

} // namespace execdb::domain
