#pragma once

#include "ports/output/IRecordStore.hpp"
#include "domain/Exceptions.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace execdb::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища записей
 *
 * Три таблицы повторяют три вида записей:
 * - execdb_logs: append-only журналы (порядок по BIGSERIAL id)
 * - execdb_sets: множества (key, member)
 * - execdb_hashes: хэши (key, field, value)
 *
 * Один пакет = одна pqxx::work. Потеря соединения -> StoreUnavailable.
 */
class PostgresRecordStore : public ports::output::IRecordStore {
public:
    explicit PostgresRecordStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresRecordStore] Connecting to PostgreSQL at "
                  << settings_->getHost() << ":" << settings_->getPort() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresRecordStore] Connected successfully" << std::endl;
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresRecordStore] Connection failed: " << e.what() << std::endl;
            throw domain::StoreUnavailable(e.what());
        }

        if (settings_->getCreateSchema()) {
            createSchema();
        }
    }

    ~PostgresRecordStore() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
            std::cout << "[PostgresRecordStore] Disconnected" << std::endl;
        }
    }

    void execute(const ports::output::RecordBatch& batch) override {
        if (batch.empty()) {
            return;
        }

        withTransaction("execute", [&batch](pqxx::work& txn) {
            for (const auto& op : batch.ops()) {
                switch (op.kind) {
                    case ports::output::RecordOp::Kind::APPEND:
                        txn.exec_params(
                            "INSERT INTO execdb_logs (key, value) VALUES ($1, $2)",
                            op.key, op.value);
                        break;
                    case ports::output::RecordOp::Kind::SET_ADD:
                        txn.exec_params(
                            "INSERT INTO execdb_sets (key, member) VALUES ($1, $2) "
                            "ON CONFLICT (key, member) DO NOTHING",
                            op.key, op.member);
                        break;
                    case ports::output::RecordOp::Kind::SET_REMOVE:
                        txn.exec_params(
                            "DELETE FROM execdb_sets WHERE key = $1 AND member = $2",
                            op.key, op.member);
                        break;
                    case ports::output::RecordOp::Kind::HASH_SET:
                        txn.exec_params(
                            R"(
                                INSERT INTO execdb_hashes (key, field, value)
                                VALUES ($1, $2, $3)
                                ON CONFLICT (key, field) DO UPDATE SET value = EXCLUDED.value
                            )",
                            op.key, op.member, op.value);
                        break;
                }
            }
        });
    }

    std::vector<std::string> readLog(const std::string& key) override {
        std::vector<std::string> entries;
        withTransaction("readLog", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "SELECT value FROM execdb_logs WHERE key = $1 ORDER BY id", key);
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(row["value"].as<std::string>());
            }
        });
        return entries;
    }

    size_t logLength(const std::string& key) override {
        size_t length = 0;
        withTransaction("logLength", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "SELECT count(*) FROM execdb_logs WHERE key = $1", key);
            length = result[0][0].as<size_t>();
        });
        return length;
    }

    std::set<std::string> members(const std::string& key) override {
        std::set<std::string> result;
        withTransaction("members", [&](pqxx::work& txn) {
            for (const auto& row : txn.exec_params(
                     "SELECT member FROM execdb_sets WHERE key = $1", key)) {
                result.insert(row["member"].as<std::string>());
            }
        });
        return result;
    }

    bool isMember(const std::string& key, const std::string& member) override {
        bool found = false;
        withTransaction("isMember", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "SELECT 1 FROM execdb_sets WHERE key = $1 AND member = $2 LIMIT 1",
                key, member);
            found = !result.empty();
        });
        return found;
    }

    std::optional<std::string> getField(const std::string& key, const std::string& field) override {
        std::optional<std::string> value;
        withTransaction("getField", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "SELECT value FROM execdb_hashes WHERE key = $1 AND field = $2",
                key, field);
            if (!result.empty()) {
                value = result[0]["value"].as<std::string>();
            }
        });
        return value;
    }

    std::map<std::string, std::string> getAll(const std::string& key) override {
        std::map<std::string, std::string> fields;
        withTransaction("getAll", [&](pqxx::work& txn) {
            for (const auto& row : txn.exec_params(
                     "SELECT field, value FROM execdb_hashes WHERE key = $1", key)) {
                fields[row["field"].as<std::string>()] = row["value"].as<std::string>();
            }
        });
        return fields;
    }

    void deleteNamespace(const std::string& prefix) override {
        withTransaction("deleteNamespace", [&prefix](pqxx::work& txn) {
            txn.exec_params("DELETE FROM execdb_logs WHERE left(key, length($1)) = $1", prefix);
            txn.exec_params("DELETE FROM execdb_sets WHERE left(key, length($1)) = $1", prefix);
            txn.exec_params("DELETE FROM execdb_hashes WHERE left(key, length($1)) = $1", prefix);
        });
        std::cout << "[PostgresRecordStore] Deleted namespace: " << prefix << std::endl;
    }

private:
    /**
     * @brief Выполнить fn в одной транзакции под мьютексом
     *
     * broken_connection превращается в StoreUnavailable, прочие ошибки
     * логируются и пробрасываются как есть.
     */
    template <typename Fn>
    void withTransaction(const char* operation, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            fn(txn);
            txn.commit();
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresRecordStore] " << operation
                      << "() lost connection: " << e.what() << std::endl;
            throw domain::StoreUnavailable(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresRecordStore] " << operation
                      << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void createSchema() {
        withTransaction("createSchema", [](pqxx::work& txn) {
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS execdb_logs (
                    id BIGSERIAL PRIMARY KEY,
                    key TEXT NOT NULL,
                    value TEXT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS execdb_logs_key_idx ON execdb_logs (key, id)");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS execdb_sets (
                    key TEXT NOT NULL,
                    member TEXT NOT NULL,
                    PRIMARY KEY (key, member)
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS execdb_hashes (
                    key TEXT NOT NULL,
                    field TEXT NOT NULL,
                    value TEXT NOT NULL,
                    PRIMARY KEY (key, field)
                )
            )");
        });
        std::cout << "[PostgresRecordStore] Schema ready" << std::endl;
    }

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace execdb::adapters::secondary
