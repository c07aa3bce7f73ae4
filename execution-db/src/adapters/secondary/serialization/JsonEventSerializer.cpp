#include "adapters/secondary/serialization/JsonEventSerializer.hpp"
#include "domain/Exceptions.hpp"
#include "domain/events/AccountStateEvent.hpp"
#include "domain/events/OrderAcceptedEvent.hpp"
#include "domain/events/OrderCancelledEvent.hpp"
#include "domain/events/OrderExpiredEvent.hpp"
#include "domain/events/OrderFilledEvent.hpp"
#include "domain/events/OrderRejectedEvent.hpp"
#include "domain/events/OrderSubmittedEvent.hpp"
#include "domain/events/OrderWorkingEvent.hpp"
#include <stdexcept>

namespace execdb::adapters::secondary {

namespace {

template <typename E>
std::unique_ptr<domain::Event> make(const nlohmann::json& j) {
    return std::make_unique<E>(j);
}

} // namespace

JsonEventSerializer::JsonEventSerializer()
    : factories_{
        {"AccountState", make<domain::AccountStateEvent>},
        {"OrderSubmitted", make<domain::OrderSubmittedEvent>},
        {"OrderRejected", make<domain::OrderRejectedEvent>},
        {"OrderAccepted", make<domain::OrderAcceptedEvent>},
        {"OrderWorking", make<domain::OrderWorkingEvent>},
        {"OrderCancelled", make<domain::OrderCancelledEvent>},
        {"OrderExpired", make<domain::OrderExpiredEvent>},
        {"OrderFilled", make<domain::OrderFilledEvent>},
    }
{
}

std::string JsonEventSerializer::serialize(const domain::Event& event) const {
    return event.toJson();
}

std::unique_ptr<domain::Event> JsonEventSerializer::deserialize(const std::string& bytes) const {
    try {
        auto j = nlohmann::json::parse(bytes);
        const auto type = j.at("type").get<std::string>();

        auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw domain::DeserializationError("Unknown event type: " + type);
        }
        return it->second(j);

    } catch (const nlohmann::json::exception& e) {
        throw domain::DeserializationError(std::string("Malformed event: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::DeserializationError(std::string("Invalid event field: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw domain::DeserializationError(std::string("Event field out of range: ") + e.what());
    }
}

} // namespace execdb::adapters::secondary
