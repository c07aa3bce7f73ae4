#include "adapters/secondary/serialization/JsonCommandSerializer.hpp"
#include "domain/Exceptions.hpp"
#include "domain/commands/SubmitOrderCommand.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace execdb::adapters::secondary {

std::string JsonCommandSerializer::serialize(const domain::Command& command) const {
    return command.toJson();
}

std::unique_ptr<domain::Command> JsonCommandSerializer::deserialize(const std::string& bytes) const {
    try {
        auto j = nlohmann::json::parse(bytes);
        const auto type = j.at("type").get<std::string>();

        if (type == "SubmitOrder") {
            return std::make_unique<domain::SubmitOrderCommand>(j);
        }
        throw domain::DeserializationError("Unknown command type: " + type);

    } catch (const nlohmann::json::exception& e) {
        throw domain::DeserializationError(std::string("Malformed command: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::DeserializationError(std::string("Invalid command field: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw domain::DeserializationError(std::string("Command field out of range: ") + e.what());
    }
}

} // namespace execdb::adapters::secondary
