#include "domain/Order.hpp"
#include "domain/Exceptions.hpp"
#include "domain/commands/SubmitOrderCommand.hpp"
#include "domain/events/OrderAcceptedEvent.hpp"
#include "domain/events/OrderCancelledEvent.hpp"
#include "domain/events/OrderExpiredEvent.hpp"
#include "domain/events/OrderFilledEvent.hpp"
#include "domain/events/OrderRejectedEvent.hpp"
#include "domain/events/OrderSubmittedEvent.hpp"
#include "domain/events/OrderWorkingEvent.hpp"
#include <map>
#include <set>
#include <stdexcept>

namespace execdb::domain {

namespace {

// Разрешённые переходы; финальные состояния переходов не имеют
const std::map<OrderState, std::set<OrderState>>& transitions() {
    static const std::map<OrderState, std::set<OrderState>> table = {
        {OrderState::INITIALIZED, {OrderState::SUBMITTED}},
        {OrderState::SUBMITTED, {OrderState::REJECTED, OrderState::ACCEPTED}},
        {OrderState::ACCEPTED, {OrderState::WORKING, OrderState::CANCELLED, OrderState::EXPIRED,
                                OrderState::PARTIALLY_FILLED, OrderState::FILLED}},
        {OrderState::WORKING, {OrderState::CANCELLED, OrderState::EXPIRED,
                               OrderState::PARTIALLY_FILLED, OrderState::FILLED}},
        {OrderState::PARTIALLY_FILLED, {OrderState::CANCELLED, OrderState::EXPIRED,
                                        OrderState::PARTIALLY_FILLED, OrderState::FILLED}},
    };
    return table;
}

OrderState targetState(const OrderEvent& event) {
    if (dynamic_cast<const OrderSubmittedEvent*>(&event)) return OrderState::SUBMITTED;
    if (dynamic_cast<const OrderRejectedEvent*>(&event))  return OrderState::REJECTED;
    if (dynamic_cast<const OrderAcceptedEvent*>(&event))  return OrderState::ACCEPTED;
    if (dynamic_cast<const OrderWorkingEvent*>(&event))   return OrderState::WORKING;
    if (dynamic_cast<const OrderCancelledEvent*>(&event)) return OrderState::CANCELLED;
    if (dynamic_cast<const OrderExpiredEvent*>(&event))   return OrderState::EXPIRED;
    if (auto filled = dynamic_cast<const OrderFilledEvent*>(&event)) {
        return filled->isPartialFill() ? OrderState::PARTIALLY_FILLED : OrderState::FILLED;
    }
    throw InvalidStateTrigger("Unsupported order event: " + event.eventType);
}

std::shared_ptr<const OrderEvent> copyOf(const OrderEvent& event) {
    std::shared_ptr<const Event> copy = event.clone();
    return std::dynamic_pointer_cast<const OrderEvent>(copy);
}

} // namespace

Order::Order(
    const std::string& clOrdId,
    const std::string& symbol,
    OrderSide side,
    OrderType type,
    int64_t quantity,
    const std::optional<Price>& price,
    const std::string& initId,
    const Timestamp& initTimestamp
) : clOrdId(clOrdId), symbol(symbol), side(side), type(type), quantity(quantity),
    price(price), initId(initId), initTimestamp(initTimestamp) {}

Order Order::create(const SubmitOrderCommand& command) {
    return Order(
        command.clOrdId,
        command.symbol,
        command.side,
        command.orderType,
        command.quantity,
        command.price,
        command.initId,
        command.initTimestamp
    );
}

void Order::apply(const OrderEvent& event) {
    if (event.clOrdId != clOrdId) {
        throw std::invalid_argument(
            "Event " + event.eventType + " for " + event.clOrdId + " applied to order " + clOrdId);
    }

    OrderState next = targetState(event);
    auto it = transitions().find(state);
    if (it == transitions().end() || it->second.count(next) == 0) {
        throw InvalidStateTrigger(
            "Order " + clOrdId + ": " + toString(state) + " -> " + toString(next) + " not allowed");
    }

    if (!accountId) {
        accountId = event.accountId;
    }

    if (auto accepted = dynamic_cast<const OrderAcceptedEvent*>(&event)) {
        orderId = accepted->orderId;
    } else if (auto working = dynamic_cast<const OrderWorkingEvent*>(&event)) {
        orderId = working->orderId;
        price = working->price;
    } else if (auto filled = dynamic_cast<const OrderFilledEvent*>(&event)) {
        orderId = filled->orderId;
        executionId = filled->executionId;
        if (filled->positionId) {
            positionId = filled->positionId;
        }
        filledQuantity = filled->cumulativeQuantity;
        averagePrice = filled->averagePrice;
    }

    state = next;
    events.push_back(copyOf(event));
}

bool Order::operator==(const Order& other) const {
    if (clOrdId != other.clOrdId || symbol != other.symbol || side != other.side ||
        type != other.type || quantity != other.quantity || price != other.price ||
        initId != other.initId || initTimestamp != other.initTimestamp ||
        state != other.state || accountId != other.accountId || orderId != other.orderId ||
        executionId != other.executionId || positionId != other.positionId ||
        filledQuantity != other.filledQuantity || averagePrice != other.averagePrice ||
        events.size() != other.events.size()) {
        return false;
    }

    for (size_t i = 0; i < events.size(); ++i) {
        if (!events[i]->sameAs(*other.events[i])) {
            return false;
        }
    }
    return true;
}

} // namespace execdb::domain
