#pragma once

#include "domain/TraderId.hpp"
#include "settings/EnvReader.hpp"
#include <stdexcept>
#include <string>

namespace execdb::settings {

/**
 * @brief Идентичность трейдера, чьё пространство ключей обслуживается
 *
 * Читает из ENV:
 * - EXECDB_TRADER_NAME (default: TESTER)
 * - EXECDB_TRADER_TAG (default: 000)
 */
class TraderSettings {
public:
    TraderSettings()
        : name_(env::text("EXECDB_TRADER_NAME", "TESTER"))
        , tag_(env::text("EXECDB_TRADER_TAG", "000"))
    {
        if (name_.empty() || tag_.empty()) {
            throw std::invalid_argument("Trader name and tag must not be empty");
        }
    }

    std::string getName() const { return name_; }
    std::string getTag() const { return tag_; }

    domain::TraderId getTraderId() const {
        return domain::TraderId(name_, tag_);
    }

private:
    std::string name_;
    std::string tag_;
};

} // namespace execdb::settings
