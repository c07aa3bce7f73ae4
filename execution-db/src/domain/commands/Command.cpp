#include "domain/commands/Command.hpp"
#include "domain/JsonFields.hpp"

namespace execdb::domain {

void Command::writeHeader(nlohmann::json& j) const {
    j["type"] = commandType;
    j["commandId"] = commandId;
    j["timestamp"] = json::fromTimestamp(timestamp);
}

void Command::readHeader(const nlohmann::json& j) {
    commandId = j.at("commandId").get<std::string>();
    timestamp = json::toTimestamp(j.at("timestamp"));
}

} // namespace execdb::domain
