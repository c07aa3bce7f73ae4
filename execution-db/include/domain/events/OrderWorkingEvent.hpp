#pragma once

#include "Event.hpp"
#include "domain/Price.hpp"
#include "domain/enums/OrderSide.hpp"
#include "domain/enums/OrderType.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace execdb::domain {

/**
 * @brief Событие: ордер выставлен в книгу заявок
 */
struct OrderWorkingEvent : public OrderEvent {
    std::string orderId;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType orderType = OrderType::LIMIT;
    int64_t quantity = 0;
    Price price;

    OrderWorkingEvent() : OrderEvent("OrderWorking") {}

    explicit OrderWorkingEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<OrderWorkingEvent>(*this);
    }
};

} // namespace execdb::domain
