#include "domain/events/OrderCancelledEvent.hpp"

namespace execdb::domain {

OrderCancelledEvent::OrderCancelledEvent(const nlohmann::json& j)
    : OrderEvent("OrderCancelled")
{
    readOrderHeader(j);
    orderId = j.at("orderId").get<std::string>();
}

std::string OrderCancelledEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    j["orderId"] = orderId;
    return j.dump();
}

} // namespace execdb::domain
