#pragma once

#include "RecordBatch.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace execdb::ports::output {

/**
 * @brief Интерфейс хранилища записей (ключ-значение)
 *
 * Output Port над внешним хранилищем: упорядоченные журналы, множества,
 * хэши, удаление пространства ключей и атомарное выполнение пакета.
 *
 * Реализации:
 * - PostgresRecordStore - libpqxx, пакет = одна транзакция
 * - InMemoryRecordStore - для тестов и локального запуска
 *
 * Потеря соединения сообщается исключением domain::StoreUnavailable.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    /**
     * @brief Выполнить пакет операций атомарно
     *
     * Если метод бросил исключение, ни одна операция пакета не применена.
     */
    virtual void execute(const RecordBatch& batch) = 0;

    /**
     * @brief Прочитать журнал в порядке добавления (пусто, если ключа нет)
     */
    virtual std::vector<std::string> readLog(const std::string& key) = 0;

    /**
     * @brief Число записей журнала (0, если ключа нет)
     */
    virtual size_t logLength(const std::string& key) = 0;

    virtual std::set<std::string> members(const std::string& key) = 0;

    virtual bool isMember(const std::string& key, const std::string& member) = 0;

    virtual std::optional<std::string> getField(const std::string& key, const std::string& field) = 0;

    virtual std::map<std::string, std::string> getAll(const std::string& key) = 0;

    /**
     * @brief Удалить все ключи, начинающиеся с prefix
     *
     * Повторный вызов на пустом пространстве ничего не делает.
     */
    virtual void deleteNamespace(const std::string& prefix) = 0;
};

} // namespace execdb::ports::output
