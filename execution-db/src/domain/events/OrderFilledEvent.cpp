#include "domain/events/OrderFilledEvent.hpp"
#include "domain/JsonFields.hpp"

namespace execdb::domain {

OrderFilledEvent::OrderFilledEvent(const nlohmann::json& j)
    : OrderEvent("OrderFilled")
{
    readOrderHeader(j);
    orderId = j.at("orderId").get<std::string>();
    executionId = j.at("executionId").get<std::string>();
    positionId = json::toOptionalString(j.at("positionId"));
    symbol = j.at("symbol").get<std::string>();
    side = orderSideFromString(j.at("side").get<std::string>());
    filledQuantity = j.at("filledQuantity").get<int64_t>();
    cumulativeQuantity = j.at("cumulativeQuantity").get<int64_t>();
    leavesQuantity = j.at("leavesQuantity").get<int64_t>();
    averagePrice = Price::fromString(j.at("averagePrice").get<std::string>());
    currency = j.at("currency").get<std::string>();
}

std::string OrderFilledEvent::toJson() const {
    nlohmann::json j;
    writeOrderHeader(j);
    j["orderId"] = orderId;
    j["executionId"] = executionId;
    j["positionId"] = json::fromOptional(positionId);
    j["symbol"] = symbol;
    j["side"] = toString(side);
    j["filledQuantity"] = filledQuantity;
    j["cumulativeQuantity"] = cumulativeQuantity;
    j["leavesQuantity"] = leavesQuantity;
    j["averagePrice"] = averagePrice.toString();
    j["currency"] = currency;
    return j.dump();
}

} // namespace execdb::domain
