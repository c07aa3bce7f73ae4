#pragma once

#include <stdexcept>
#include <string>

namespace execdb::domain {

/**
 * @brief Вид ордера в команде SubmitOrder
 *
 * Для LIMIT и STOP в команде задана цена, для MARKET её нет.
 */
enum class OrderType {
    MARKET,
    LIMIT,
    STOP
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT:  return "LIMIT";
        case OrderType::STOP:   return "STOP";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument для неизвестного имени (повреждённая запись журнала)
 */
inline OrderType orderTypeFromString(const std::string& name) {
    for (OrderType type : {OrderType::MARKET, OrderType::LIMIT, OrderType::STOP}) {
        if (toString(type) == name) {
            return type;
        }
    }
    throw std::invalid_argument("Unknown order type in record: " + name);
}

} // namespace execdb::domain
