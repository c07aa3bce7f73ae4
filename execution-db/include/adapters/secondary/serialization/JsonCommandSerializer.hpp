#pragma once

#include "ports/output/ICommandSerializer.hpp"

namespace execdb::adapters::secondary {

/**
 * @brief Кодек команд в JSON (nlohmann::json)
 *
 * Тип команды определяется полем "type". Ключи объекта
 * упорядочены, поэтому кодирование детерминировано.
 */
class JsonCommandSerializer : public ports::output::ICommandSerializer {
public:
    std::string serialize(const domain::Command& command) const override;

    std::unique_ptr<domain::Command> deserialize(const std::string& bytes) const override;
};

} // namespace execdb::adapters::secondary
