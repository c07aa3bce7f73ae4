#pragma once

#include <string>

namespace execdb::domain {

/**
 * @brief Торговая стратегия
 *
 * Для базы исполнения важен только идентификатор: стратегия живёт
 * как членство в реестре и индексах, без собственного журнала.
 * Идентификатор имеет вид NAME-TAG, например "EmptyStrategy-001".
 */
struct Strategy {
    std::string name;           ///< Название класса стратегии
    std::string orderIdTag;     ///< Тег в идентификаторах ордеров

    Strategy() = default;

    Strategy(const std::string& name, const std::string& orderIdTag)
        : name(name), orderIdTag(orderIdTag) {}

    std::string id() const {
        return name + "-" + orderIdTag;
    }
};

} // namespace execdb::domain
