#include "domain/events/OrderRejectedEvent.hpp"

namespace execdb::domain {

OrderRejectedEvent::OrderRejectedEvent(const nlohmann::json& j)
    : OrderEvent("OrderRejected")
{
    readOrderHeader(j);
    reason = j.at("reason").get<std::string>();
}

std::string OrderRejectedEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    j["reason"] = reason;
    return j.dump();
}

} // namespace execdb::domain
