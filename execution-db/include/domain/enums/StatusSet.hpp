#pragma once

#include <string>

namespace execdb::domain {

/**
 * @brief Индекс статуса ордера: ровно одно из двух множеств
 */
enum class OrderStatusSet {
    WORKING,
    COMPLETED
};

/**
 * @brief Индекс статуса позиции: ровно одно из двух множеств
 */
enum class PositionStatusSet {
    OPEN,
    CLOSED
};

inline std::string toString(OrderStatusSet set) {
    return set == OrderStatusSet::WORKING ? "WORKING" : "COMPLETED";
}

inline std::string toString(PositionStatusSet set) {
    return set == PositionStatusSet::OPEN ? "OPEN" : "CLOSED";
}

/**
 * @brief Таблица переходов: из какого множества уходит сущность,
 * попадая в заданное.
 *
 * working <-> completed, open <-> closed.
 */
inline OrderStatusSet leftBy(OrderStatusSet target) {
    return target == OrderStatusSet::WORKING ? OrderStatusSet::COMPLETED : OrderStatusSet::WORKING;
}

inline PositionStatusSet leftBy(PositionStatusSet target) {
    return target == PositionStatusSet::OPEN ? PositionStatusSet::CLOSED : PositionStatusSet::OPEN;
}

} // namespace execdb::domain
