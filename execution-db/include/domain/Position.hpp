#pragma once

#include "enums/OrderSide.hpp"
#include "enums/PositionSide.hpp"
#include "events/OrderFilledEvent.hpp"
#include "Timestamp.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace execdb::domain {

/**
 * @brief Позиция, открытая сделкой и изменяемая последующими сделками
 *
 * Описывает состояние позиции по одному инструменту: знаковое количество,
 * средние цены открытия/закрытия, реализованный результат и список ордеров.
 * Позиция закрыта, когда относительное количество равно нулю.
 */
struct Position {
    std::string id;                         ///< ID позиции
    std::string accountId;                  ///< Счёт
    std::string fromOrder;                  ///< Ордер, открывший позицию
    std::string symbol;                     ///< Инструмент
    OrderSide entry = OrderSide::BUY;       ///< Сторона открывающей сделки
    PositionSide side = PositionSide::FLAT;
    int64_t relativeQuantity = 0;           ///< Знаковое количество (>0 LONG, <0 SHORT)
    int64_t quantity = 0;                   ///< Модуль относительного количества
    int64_t peakQuantity = 0;
    int64_t closedQuantity = 0;             ///< Сколько закрыто всего
    double averageOpenPrice = 0.0;
    std::optional<double> averageClosePrice;
    double realizedPnl = 0.0;               ///< В валюте котировки
    std::string quoteCurrency;
    Timestamp openedTime;
    std::optional<Timestamp> closedTime;

    std::set<std::string> orderIds;         ///< Ордера, участвовавшие в позиции
    std::vector<std::string> executionIds;
    std::vector<std::shared_ptr<const OrderFilledEvent>> events;

    /**
     * @brief Открыть позицию сделкой
     * @throws std::invalid_argument если в сделке нет positionId или количество не положительное
     */
    explicit Position(const OrderFilledEvent& opening);

    /**
     * @brief Применить очередную сделку
     * @throws std::invalid_argument если сделка относится к другой позиции или инструменту,
     *         или её количество не положительное
     */
    void apply(const OrderFilledEvent& fill);

    const OrderFilledEvent* lastEvent() const {
        return events.empty() ? nullptr : events.back().get();
    }

    bool isOpen() const {
        return relativeQuantity != 0;
    }

    bool isClosed() const {
        return !isOpen();
    }

    bool operator==(const Position& other) const;

    bool operator!=(const Position& other) const {
        return !(*this == other);
    }

private:
    void fold(const OrderFilledEvent& fill);
};

} // namespace execdb::domain
