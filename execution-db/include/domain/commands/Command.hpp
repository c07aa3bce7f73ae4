#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <memory>

namespace execdb::domain {

/**
 * @brief Базовый класс команд (намерений), порождающих сущности
 */
struct Command {
    std::string commandId;      ///< UUID команды
    std::string commandType;    ///< Тип команды (SubmitOrder)
    Timestamp timestamp;        ///< Время создания команды

    explicit Command(const std::string& type)
        : commandType(type), timestamp(Timestamp::now()) {}

    virtual ~Command() = default;

    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<Command> clone() const = 0;

protected:
    void writeHeader(nlohmann::json& j) const;
    void readHeader(const nlohmann::json& j);
};

} // namespace execdb::domain
