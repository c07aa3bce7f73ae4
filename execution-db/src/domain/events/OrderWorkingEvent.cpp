#include "domain/events/OrderWorkingEvent.hpp"

namespace execdb::domain {

OrderWorkingEvent::OrderWorkingEvent(const nlohmann::json& j)
    : OrderEvent("OrderWorking")
{
    readOrderHeader(j);
    orderId = j.at("orderId").get<std::string>();
    symbol = j.at("symbol").get<std::string>();
    side = orderSideFromString(j.at("side").get<std::string>());
    orderType = orderTypeFromString(j.at("orderType").get<std::string>());
    quantity = j.at("quantity").get<int64_t>();
    price = Price::fromString(j.at("price").get<std::string>());
}

std::string OrderWorkingEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    j["orderId"] = orderId;
    j["symbol"] = symbol;
    j["side"] = toString(side);
    j["orderType"] = toString(orderType);
    j["quantity"] = quantity;
    j["price"] = price.toString();
    return j.dump();
}

} // namespace execdb::domain
