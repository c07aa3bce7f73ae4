#pragma once

#include "domain/events/Event.hpp"
#include <memory>
#include <string>

namespace execdb::ports::output {

/**
 * @brief Интерфейс кодека событий
 *
 * Output Port: событие <-> байты. Кодирование детерминировано.
 */
class IEventSerializer {
public:
    virtual ~IEventSerializer() = default;

    virtual std::string serialize(const domain::Event& event) const = 0;

    /**
     * @throws domain::DeserializationError если байты не являются корректным событием
     */
    virtual std::unique_ptr<domain::Event> deserialize(const std::string& bytes) const = 0;
};

} // namespace execdb::ports::output
