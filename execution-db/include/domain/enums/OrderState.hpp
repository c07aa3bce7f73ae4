#pragma once

#include <string>
#include <stdexcept>

namespace execdb::domain {

/**
 * @brief Состояние ордера в жизненном цикле
 *
 * Переходы задаются таблицей в Order::apply().
 */
enum class OrderState {
    INITIALIZED,       ///< Создан, ещё не отправлен
    SUBMITTED,         ///< Отправлен на биржу
    REJECTED,          ///< Отклонён биржей
    ACCEPTED,          ///< Принят биржей
    WORKING,           ///< Выставлен в книгу заявок
    CANCELLED,         ///< Отменён
    EXPIRED,           ///< Истёк срок действия
    PARTIALLY_FILLED,  ///< Исполнен частично
    FILLED             ///< Исполнен полностью
};

inline std::string toString(OrderState state) {
    switch (state) {
        case OrderState::INITIALIZED:      return "INITIALIZED";
        case OrderState::SUBMITTED:        return "SUBMITTED";
        case OrderState::REJECTED:         return "REJECTED";
        case OrderState::ACCEPTED:         return "ACCEPTED";
        case OrderState::WORKING:          return "WORKING";
        case OrderState::CANCELLED:        return "CANCELLED";
        case OrderState::EXPIRED:          return "EXPIRED";
        case OrderState::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderState::FILLED:           return "FILLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderState orderStateFromString(const std::string& str) {
    if (str == "INITIALIZED")      return OrderState::INITIALIZED;
    if (str == "SUBMITTED")        return OrderState::SUBMITTED;
    if (str == "REJECTED")         return OrderState::REJECTED;
    if (str == "ACCEPTED")         return OrderState::ACCEPTED;
    if (str == "WORKING")          return OrderState::WORKING;
    if (str == "CANCELLED")        return OrderState::CANCELLED;
    if (str == "EXPIRED")          return OrderState::EXPIRED;
    if (str == "PARTIALLY_FILLED") return OrderState::PARTIALLY_FILLED;
    if (str == "FILLED")           return OrderState::FILLED;
    throw std::invalid_argument("Unknown OrderState: " + str);
}

/**
 * @brief Является ли состояние финальным (ордер больше не может измениться)
 */
inline bool isCompletedState(OrderState state) {
    return state == OrderState::REJECTED ||
           state == OrderState::CANCELLED ||
           state == OrderState::EXPIRED ||
           state == OrderState::FILLED;
}

} // namespace execdb::domain
