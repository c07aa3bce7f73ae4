#include "domain/events/Event.hpp"
#include "domain/JsonFields.hpp"

namespace execdb::domain {

void Event::writeHeader(nlohmann::json& j) const {
    j["type"] = eventType;
    j["eventId"] = eventId;
    j["timestamp"] = json::fromTimestamp(timestamp);
}

void Event::readHeader(const nlohmann::json& j) {
    eventId = j.at("eventId").get<std::string>();
    timestamp = json::toTimestamp(j.at("timestamp"));
}

void OrderEvent::writeOrderHeader(nlohmann::json& j) const {
    writeHeader(j);
    j["clOrdId"] = clOrdId;
    j["accountId"] = accountId;
}

void OrderEvent::readOrderHeader(const nlohmann::json& j) {
    readHeader(j);
    clOrdId = j.at("clOrdId").get<std::string>();
    accountId = j.at("accountId").get<std::string>();
}

} // namespace execdb::domain
