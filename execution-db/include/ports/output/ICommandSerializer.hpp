#pragma once

#include "domain/commands/Command.hpp"
#include <memory>
#include <string>

namespace execdb::ports::output {

/**
 * @brief Интерфейс кодека команд
 *
 * Output Port: команда <-> байты. Кодирование детерминировано
 * (одна и та же команда даёт одни и те же байты).
 */
class ICommandSerializer {
public:
    virtual ~ICommandSerializer() = default;

    virtual std::string serialize(const domain::Command& command) const = 0;

    /**
     * @throws domain::DeserializationError если байты не являются корректной командой
     */
    virtual std::unique_ptr<domain::Command> deserialize(const std::string& bytes) const = 0;
};

} // namespace execdb::ports::output
