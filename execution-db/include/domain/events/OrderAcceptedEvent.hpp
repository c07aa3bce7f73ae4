#pragma once

#include "Event.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace execdb::domain {

/**
 * @brief Событие: ордер принят биржей
 */
struct OrderAcceptedEvent : public OrderEvent {
    std::string orderId;        ///< Идентификатор ордера на бирже

    OrderAcceptedEvent() : OrderEvent("OrderAccepted") {}

    /// JSON конструктор для восстановления из журнала
    explicit OrderAcceptedEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderAcceptedEvent>(*this);
    }
};

} // namespace execdb::domain
