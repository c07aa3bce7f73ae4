#pragma once

#include "domain/Money.hpp"
#include "domain/Price.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace execdb::domain::json {

// Общие правила записи полей в журнал.
// Чтение строгое: отсутствующее поле или неверный тип бросают nlohmann::json::exception.

inline nlohmann::json fromMoney(const Money& money) {
    return {
        {"units", money.units},
        {"nano", money.nano},
        {"currency", money.currency}
    };
}

inline Money toMoney(const nlohmann::json& j) {
    return Money(
        j.at("units").get<int64_t>(),
        j.at("nano").get<int32_t>(),
        j.at("currency").get<std::string>()
    );
}

inline nlohmann::json fromTimestamp(const Timestamp& ts) {
    return ts.toUnixNanos();
}

inline Timestamp toTimestamp(const nlohmann::json& j) {
    return Timestamp::fromUnixNanos(j.get<int64_t>());
}

inline nlohmann::json fromOptional(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline std::optional<std::string> toOptionalString(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<std::string>();
}

inline nlohmann::json fromOptional(const std::optional<Price>& price) {
    return price ? nlohmann::json(price->toString()) : nlohmann::json(nullptr);
}

/**
 * @throws std::invalid_argument если строка цены некорректна
 */
inline std::optional<Price> toOptionalPrice(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return Price::fromString(j.get<std::string>());
}

} // namespace execdb::domain::json
