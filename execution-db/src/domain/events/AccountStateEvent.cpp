#include "domain/events/AccountStateEvent.hpp"
#include "domain/JsonFields.hpp"

namespace execdb::domain {

AccountStateEvent::AccountStateEvent(const nlohmann::json& j)
    : Event("AccountState")
{
    readHeader(j);
    accountId = j.at("accountId").get<std::string>();
    currency = j.at("currency").get<std::string>();
    cashBalance = json::toMoney(j.at("cashBalance"));
    cashStartDay = json::toMoney(j.at("cashStartDay"));
    cashActivityDay = json::toMoney(j.at("cashActivityDay"));
    marginUsedLiquidation = json::toMoney(j.at("marginUsedLiquidation"));
    marginUsedMaintenance = json::toMoney(j.at("marginUsedMaintenance"));
    marginRatio = j.at("marginRatio").get<double>();
    marginCallStatus = j.at("marginCallStatus").get<std::string>();
}

std::string AccountStateEvent::toJson() const {
    nlohmann::json j;
    writeHeader(j);
    j["accountId"] = accountId;
    j["currency"] = currency;
    j["cashBalance"] = json::fromMoney(cashBalance);
    j["cashStartDay"] = json::fromMoney(cashStartDay);
    j["cashActivityDay"] = json::fromMoney(cashActivityDay);
    j["marginUsedLiquidation"] = json::fromMoney(marginUsedLiquidation);
    j["marginUsedMaintenance"] = json::fromMoney(marginUsedMaintenance);
    j["marginRatio"] = marginRatio;
    j["marginCallStatus"] = marginCallStatus;
    return j.dump();
}

} // namespace execdb::domain
