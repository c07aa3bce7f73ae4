#pragma once

#include "Event.hpp"
#include "domain/Money.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace execdb::domain {

/**
 * @brief Событие: состояние брокерского счёта
 *
 * Последнее такое событие и есть снимок счёта в хранилище.
 */
struct AccountStateEvent : public Event {
    std::string accountId;
    std::string currency = "USD";
    Money cashBalance;
    Money cashStartDay;
    Money cashActivityDay;
    Money marginUsedLiquidation;
    Money marginUsedMaintenance;
    double marginRatio = 0.0;
    std::string marginCallStatus = "N";

    AccountStateEvent() : Event("AccountState") {}

    explicit AccountStateEvent(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Event> clone() const override {
        return std::make_unique<AccountStateEvent>(*this);
    }
};

} // namespace execdb::domain
