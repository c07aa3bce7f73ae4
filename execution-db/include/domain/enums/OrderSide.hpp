#pragma once

#include <string>
#include <stdexcept>

namespace execdb::domain {

/**
 * @brief Сторона ордера
 */
enum class OrderSide {
    BUY,    ///< Покупка
    SELL    ///< Продажа
};

inline std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY:  return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderSide orderSideFromString(const std::string& str) {
    if (str == "BUY")  return OrderSide::BUY;
    if (str == "SELL") return OrderSide::SELL;
    throw std::invalid_argument("Unknown OrderSide: " + str);
}

} // namespace execdb::domain
