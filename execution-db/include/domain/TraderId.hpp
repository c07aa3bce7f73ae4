#pragma once

#include <string>

namespace execdb::domain {

/**
 * @brief Идентификатор трейдера: корень пространства ключей
 *
 * Значение имеет вид NAME-TAG, например "TESTER-000".
 */
struct TraderId {
    std::string name;
    std::string tag;

    TraderId() = default;

    TraderId(const std::string& name, const std::string& tag)
        : name(name), tag(tag) {}

    std::string value() const {
        return name + "-" + tag;
    }

    bool operator==(const TraderId& other) const {
        return name == other.name && tag == other.tag;
    }
};

} // namespace execdb::domain
