#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace execdb::domain {

/**
 * @brief Сумма в валюте счёта
 *
 * units - целая часть, nano - дробная в 10^-9 с тем же знаком.
 * Поля пишутся в журнал как есть, без перевода в double.
 */
struct Money {
    int64_t units = 0;
    int32_t nano = 0;
    std::string currency = "USD";

    Money() = default;

    Money(int64_t wholeUnits, int32_t nanoUnits, const std::string& currencyCode = "USD")
        : units(wholeUnits), nano(nanoUnits), currency(currencyCode) {}

    /**
     * @brief Округлить до нано-единиц
     */
    static Money fromDouble(double amount, const std::string& currencyCode = "USD") {
        const int64_t totalNanos = std::llround(amount * 1e9);
        return Money(totalNanos / 1000000000LL,
                     static_cast<int32_t>(totalNanos % 1000000000LL),
                     currencyCode);
    }

    double toDouble() const {
        return static_cast<double>(units) + nano / 1e9;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }
};

} // namespace execdb::domain
