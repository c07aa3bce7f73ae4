#pragma once

#include "Command.hpp"
#include "domain/Price.hpp"
#include "domain/TraderId.hpp"
#include "domain/enums/OrderSide.hpp"
#include "domain/enums/OrderType.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace execdb::domain {

/**
 * @brief Команда: выставить ордер
 *
 * Запись 0 в журнале ордера. Содержит всё, из чего Order::create()
 * строит исходный ордер, плюс привязку к стратегии и позиции.
 */
struct SubmitOrderCommand : public Command {
    TraderId traderId;
    std::string strategyId;
    std::optional<std::string> positionId;

    // Параметры инициализации ордера
    std::string clOrdId;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType orderType = OrderType::MARKET;
    int64_t quantity = 0;
    std::optional<Price> price;
    std::string initId;
    Timestamp initTimestamp;

    SubmitOrderCommand() : Command("SubmitOrder") {}

    explicit SubmitOrderCommand(const nlohmann::json& j);

    std::string toJson() const override;

    std::unique_ptr<Command> clone() const override {
        return std::make_unique<SubmitOrderCommand>(*this);
    }
};

} // namespace execdb::domain
