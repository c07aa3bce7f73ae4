#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <memory>

namespace execdb::domain {

/**
 * @brief Базовый класс для всех событий исполнения
 *
 * События неизменяемы после создания: журнал хранит их в порядке
 * применения, а восстановление сущности есть свёртка по этому журналу.
 */
struct Event {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (OrderFilled, AccountState, ...)
    Timestamp timestamp;        ///< Время события

    explicit Event(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~Event() = default;

    /**
     * @brief Сериализовать в JSON (поле "type" = eventType)
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<Event> clone() const = 0;

    /**
     * @brief Структурное сравнение через сериализованную форму
     */
    bool sameAs(const Event& other) const {
        return toJson() == other.toJson();
    }

protected:
    void writeHeader(nlohmann::json& j) const;
    void readHeader(const nlohmann::json& j);
};

/**
 * @brief Событие, относящееся к одному ордеру
 */
struct OrderEvent : public Event {
    std::string clOrdId;        ///< Клиентский идентификатор ордера
    std::string accountId;      ///< Счёт, через который идёт ордер

    explicit OrderEvent(const std::string& type) : Event(type) {}

protected:
    void writeOrderHeader(nlohmann::json& j) const;
    void readOrderHeader(const nlohmann::json& j);
};

} // namespace execdb::domain
