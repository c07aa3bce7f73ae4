#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <stdexcept>

namespace execdb::domain {

/**
 * @brief Цена с фиксированной точностью
 *
 * Та же схема units/nano, что и Money, плюс число знаков после точки.
 * Строковое представление ("1.00001") переживает сериализацию без потерь.
 */
class Price {
public:
    int64_t units = 0;
    int32_t nano = 0;
    int precision = 0;

    Price() = default;

    Price(int64_t u, int32_t n, int p) : units(u), nano(n), precision(p) {}

    /**
     * @brief Разобрать десятичную строку
     * @throws std::invalid_argument если строка не является неотрицательным числом
     *         или точность больше 9 знаков
     */
    static Price fromString(const std::string& str) {
        if (str.empty()) {
            throw std::invalid_argument("Empty price string");
        }

        auto dot = str.find('.');
        std::string whole = str.substr(0, dot);
        std::string fraction = dot == std::string::npos ? "" : str.substr(dot + 1);

        if (whole.empty() || fraction.size() > 9 ||
            whole.find_first_not_of("0123456789") != std::string::npos ||
            fraction.find_first_not_of("0123456789") != std::string::npos ||
            (dot != std::string::npos && fraction.empty())) {
            throw std::invalid_argument("Invalid price: " + str);
        }

        Price p;
        p.units = std::stoll(whole);
        p.precision = static_cast<int>(fraction.size());
        std::string padded = fraction + std::string(9 - fraction.size(), '0');
        p.nano = static_cast<int32_t>(std::stol(padded));
        return p;
    }

    /**
     * @brief Округлить double до заданной точности
     */
    static Price fromDouble(double value, int precision) {
        double scale = std::pow(10.0, precision);
        int64_t scaled = std::llround(value * scale);
        int64_t factor = static_cast<int64_t>(std::llround(std::pow(10.0, 9 - precision)));
        int64_t divisor = static_cast<int64_t>(std::llround(scale));

        Price p;
        p.precision = precision;
        p.units = scaled / divisor;
        p.nano = static_cast<int32_t>((scaled % divisor) * factor);
        return p;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    std::string toString() const {
        if (precision == 0) {
            return std::to_string(units);
        }
        std::string fraction = std::to_string(nano);
        fraction = std::string(9 - fraction.size(), '0') + fraction;
        return std::to_string(units) + "." + fraction.substr(0, precision);
    }

    bool operator==(const Price& other) const {
        return units == other.units && nano == other.nano && precision == other.precision;
    }

    bool operator!=(const Price& other) const {
        return !(*this == other);
    }
};

} // namespace execdb::domain
