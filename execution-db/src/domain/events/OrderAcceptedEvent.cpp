#include "domain/events/OrderAcceptedEvent.hpp"

namespace execdb::domain {

OrderAcceptedEvent::OrderAcceptedEvent(const nlohmann::json& j)
    : OrderEvent("OrderAccepted")
{
    readOrderHeader(j);
    orderId = j.at("orderId").get<std::string>();
}

std::string OrderAcceptedEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    j["orderId"] = orderId;
    return j.dump();
}

} // namespace execdb::domain
