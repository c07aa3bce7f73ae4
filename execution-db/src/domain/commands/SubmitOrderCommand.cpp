#include "domain/commands/SubmitOrderCommand.hpp"
#include "domain/JsonFields.hpp"

namespace execdb::domain {

SubmitOrderCommand::SubmitOrderCommand(const nlohmann::json& j)
    : Command("SubmitOrder")
{
    readHeader(j);
    traderId = TraderId(
        j.at("traderName").get<std::string>(),
        j.at("traderTag").get<std::string>()
    );
    strategyId = j.at("strategyId").get<std::string>();
    positionId = json::toOptionalString(j.at("positionId"));

    clOrdId = j.at("clOrdId").get<std::string>();
    symbol = j.at("symbol").get<std::string>();
    side = orderSideFromString(j.at("side").get<std::string>());
    orderType = orderTypeFromString(j.at("orderType").get<std::string>());
    quantity = j.at("quantity").get<int64_t>();
    price = json::toOptionalPrice(j.at("price"));
    initId = j.at("initId").get<std::string>();
    initTimestamp = json::toTimestamp(j.at("initTimestamp"));
}

std::string SubmitOrderCommand::toJson() const {
    nlohmann::json j;
    writeHeader(j);
    j["traderName"] = traderId.name;
    j["traderTag"] = traderId.tag;
    j["strategyId"] = strategyId;
    j["positionId"] = json::fromOptional(positionId);

    j["clOrdId"] = clOrdId;
    j["symbol"] = symbol;
    j["side"] = toString(side);
    j["orderType"] = toString(orderType);
    j["quantity"] = quantity;
    j["price"] = json::fromOptional(price);
    j["initId"] = initId;
    j["initTimestamp"] = json::fromTimestamp(initTimestamp);
    return j.dump();
}

} // namespace execdb::domain
