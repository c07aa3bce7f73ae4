#include "domain/events/OrderSubmittedEvent.hpp"

namespace execdb::domain {

OrderSubmittedEvent::OrderSubmittedEvent(const nlohmann::json& j)
    : OrderEvent("OrderSubmitted")
{
    readOrderHeader(j);
}

std::string OrderSubmittedEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    return j.dump();
}

} // namespace execdb::domain
