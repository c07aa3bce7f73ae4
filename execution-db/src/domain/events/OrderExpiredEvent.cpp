#include "domain/events/OrderExpiredEvent.hpp"

namespace execdb::domain {

OrderExpiredEvent::OrderExpiredEvent(const nlohmann::json& j)
    : OrderEvent("OrderExpired")
{
    readOrderHeader(j);
    orderId = j.at("orderId").get<std::string>();
}

std::string OrderExpiredEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    j["orderId"] = orderId;
    return j.dump();
}

} // namespace execdb::domain
