#pragma once

#include "ports/output/IRecordStore.hpp"
#include <map>
#include <optional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace execdb::adapters::secondary {

/**
 * @brief In-memory реализация хранилища записей
 *
 * Пакет применяется целиком под одним мьютексом, поэтому читатели
 * никогда не видят его частично.
 */
class InMemoryRecordStore : public ports::output::IRecordStore {
public:
    void execute(const ports::output::RecordBatch& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& op : batch.ops()) {
            switch (op.kind) {
                case ports::output::RecordOp::Kind::APPEND:
                    logs_[op.key].push_back(op.value);
                    break;
                case ports::output::RecordOp::Kind::SET_ADD:
                    sets_[op.key].insert(op.member);
                    break;
                case ports::output::RecordOp::Kind::SET_REMOVE: {
                    auto it = sets_.find(op.key);
                    if (it != sets_.end()) {
                        it->second.erase(op.member);
                        if (it->second.empty()) {
                            sets_.erase(it);
                        }
                    }
                    break;
                }
                case ports::output::RecordOp::Kind::HASH_SET:
                    hashes_[op.key][op.member] = op.value;
                    break;
            }
        }
    }

    std::vector<std::string> readLog(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = logs_.find(key);
        return it != logs_.end() ? it->second : std::vector<std::string>{};
    }

    size_t logLength(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = logs_.find(key);
        return it != logs_.end() ? it->second.size() : 0;
    }

    std::set<std::string> members(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sets_.find(key);
        return it != sets_.end() ? it->second : std::set<std::string>{};
    }

    bool isMember(const std::string& key, const std::string& member) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sets_.find(key);
        return it != sets_.end() && it->second.count(member) > 0;
    }

    std::optional<std::string> getField(const std::string& key, const std::string& field) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hashes_.find(key);
        if (it == hashes_.end()) {
            return std::nullopt;
        }
        auto fieldIt = it->second.find(field);
        if (fieldIt == it->second.end()) {
            return std::nullopt;
        }
        return fieldIt->second;
    }

    std::map<std::string, std::string> getAll(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hashes_.find(key);
        return it != hashes_.end() ? it->second : std::map<std::string, std::string>{};
    }

    void deleteNamespace(const std::string& prefix) override {
        std::lock_guard<std::mutex> lock(mutex_);
        erasePrefix(logs_, prefix);
        erasePrefix(sets_, prefix);
        erasePrefix(hashes_, prefix);
    }

    /**
     * @brief Все ключи, хранимые сейчас (для тестов и диагностики)
     */
    std::set<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> result;
        for (const auto& [key, _] : logs_) result.insert(key);
        for (const auto& [key, _] : sets_) result.insert(key);
        for (const auto& [key, _] : hashes_) result.insert(key);
        return result;
    }

    /**
     * @brief Подменить сырое значение записи журнала (для тестов повреждений)
     */
    void overwriteLogEntry(const std::string& key, size_t index, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_.at(key).at(index) = value;
    }

    /**
     * @brief Подменить сырое значение поля хэша (для тестов повреждений)
     */
    void overwriteField(const std::string& key, const std::string& field, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        hashes_[key][field] = value;
    }

private:
    template <typename Map>
    static void erasePrefix(Map& map, const std::string& prefix) {
        auto it = map.lower_bound(prefix);
        while (it != map.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
            it = map.erase(it);
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> logs_;
    std::map<std::string, std::set<std::string>> sets_;
    std::map<std::string, std::map<std::string, std::string>> hashes_;
};

} // namespace execdb::adapters::secondary
