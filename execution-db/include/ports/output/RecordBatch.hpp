#pragma once

#include <string>
#include <vector>

namespace execdb::ports::output {

/**
 * @brief Одна примитивная операция записи
 */
struct RecordOp {
    enum class Kind {
        APPEND,       ///< Добавить значение в конец журнала key
        SET_ADD,      ///< Добавить member во множество key
        SET_REMOVE,   ///< Удалить member из множества key (отсутствие не ошибка)
        HASH_SET      ///< Записать field = value в хэш key
    };

    Kind kind;
    std::string key;
    std::string member;   ///< member для множеств, field для хэша
    std::string value;    ///< Значение для APPEND / HASH_SET
};

/**
 * @brief Набор операций, применяемых хранилищем атомарно
 *
 * Читатель видит либо все операции пакета, либо ни одной.
 */
class RecordBatch {
public:
    RecordBatch& append(const std::string& key, const std::string& value) {
        ops_.push_back({RecordOp::Kind::APPEND, key, "", value});
        return *this;
    }

    RecordBatch& setAdd(const std::string& key, const std::string& member) {
        ops_.push_back({RecordOp::Kind::SET_ADD, key, member, ""});
        return *this;
    }

    RecordBatch& setRemove(const std::string& key, const std::string& member) {
        ops_.push_back({RecordOp::Kind::SET_REMOVE, key, member, ""});
        return *this;
    }

    RecordBatch& hashSet(const std::string& key, const std::string& field, const std::string& value) {
        ops_.push_back({RecordOp::Kind::HASH_SET, key, field, value});
        return *this;
    }

    const std::vector<RecordOp>& ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }
    size_t size() const { return ops_.size(); }

private:
    std::vector<RecordOp> ops_;
};

} // namespace execdb::ports::output
