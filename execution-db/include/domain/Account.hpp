#pragma once

#include "events/AccountStateEvent.hpp"
#include "Money.hpp"
#include <memory>
#include <string>
#include <stdexcept>
#include <vector>

namespace execdb::domain {

/**
 * @brief Брокерский счёт
 *
 * Строится из события AccountState и обновляется следующими такими событиями.
 * В хранилище лежит только последнее событие (снимок).
 */
struct Account {
    std::string id;                 ///< ID счёта
    std::string currency;           ///< Валюта счёта
    Money cashBalance;
    Money cashStartDay;
    Money cashActivityDay;
    Money marginUsedLiquidation;
    Money marginUsedMaintenance;
    double marginRatio = 0.0;
    std::string marginCallStatus;

    std::vector<std::shared_ptr<const AccountStateEvent>> events;

    explicit Account(const AccountStateEvent& event) {
        apply(event);
    }

    /**
     * @brief Применить новое состояние счёта
     * @throws std::invalid_argument если событие относится к другому счёту
     */
    void apply(const AccountStateEvent& event) {
        if (!events.empty() && event.accountId != id) {
            throw std::invalid_argument("Account state for " + event.accountId + " applied to " + id);
        }

        id = event.accountId;
        currency = event.currency;
        cashBalance = event.cashBalance;
        cashStartDay = event.cashStartDay;
        cashActivityDay = event.cashActivityDay;
        marginUsedLiquidation = event.marginUsedLiquidation;
        marginUsedMaintenance = event.marginUsedMaintenance;
        marginRatio = event.marginRatio;
        marginCallStatus = event.marginCallStatus;
        events.push_back(std::make_shared<const AccountStateEvent>(event));
    }

    const AccountStateEvent& lastEvent() const {
        return *events.back();
    }

    /**
     * @brief Сравнение по текущему состоянию
     *
     * История событий не участвует: снимок хранит только последнее событие.
     */
    bool operator==(const Account& other) const {
        return id == other.id && lastEvent().sameAs(other.lastEvent());
    }

    bool operator!=(const Account& other) const {
        return !(*this == other);
    }
};

} // namespace execdb::domain
