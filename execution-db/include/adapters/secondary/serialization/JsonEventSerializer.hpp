#pragma once

#include "ports/output/IEventSerializer.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>

namespace execdb::adapters::secondary {

/**
 * @brief Кодек событий в JSON (nlohmann::json)
 *
 * Поддерживаемые типы: AccountState, OrderSubmitted, OrderRejected,
 * OrderAccepted, OrderWorking, OrderCancelled, OrderExpired, OrderFilled.
 */
class JsonEventSerializer : public ports::output::IEventSerializer {
public:
    JsonEventSerializer();

    std::string serialize(const domain::Event& event) const override;

    std::unique_ptr<domain::Event> deserialize(const std::string& bytes) const override;

private:
    using Factory = std::function<std::unique_ptr<domain::Event>(const nlohmann::json&)>;

    std::map<std::string, Factory> factories_;
};

} // namespace execdb::adapters::secondary
