#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace execdb::settings::env {

// Чтение переменных окружения для классов настроек.
// Некорректное значение - std::invalid_argument с именем переменной.

inline std::string text(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool flag(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    const std::string s(value);
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    throw std::invalid_argument(std::string(name) + " must be true or false, got: " + s);
}

/**
 * @brief Целое в диапазоне [min, max]
 */
inline int integer(const char* name, int defaultValue, int min, int max) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    const std::string s(value);
    size_t parsed = 0;
    long result = 0;
    try {
        result = std::stol(s, &parsed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + s);
    }
    if (parsed != s.size() || result < min || result > max) {
        throw std::invalid_argument(std::string(name) + " is out of range: " + s);
    }
    return static_cast<int>(result);
}

} // namespace execdb::settings::env
