#pragma once

#include <stdexcept>
#include <string>

namespace execdb::domain {

/**
 * @brief Сохранённая запись не может быть декодирована
 *
 * Фатально для восстановления одной записи, но не для соседних
 * записей при массовой загрузке.
 */
class DeserializationError : public std::runtime_error {
public:
    explicit DeserializationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Хранилище недоступно (потеря соединения)
 *
 * Запись, при которой возникло исключение, не применена ни частично, ни полностью.
 */
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Событие не может быть применено в текущем состоянии сущности
 */
class InvalidStateTrigger : public std::logic_error {
public:
    explicit InvalidStateTrigger(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace execdb::domain
