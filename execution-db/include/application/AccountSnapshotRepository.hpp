#pragma once

#include "application/KeySpace.hpp"
#include "domain/Account.hpp"
#include "domain/Exceptions.hpp"
#include "ports/output/IEventSerializer.hpp"
#include "ports/output/IRecordStore.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace execdb::application {

/**
 * @brief Снимки счетов: одно поле хэша на счёт, перезапись при сохранении
 */
class AccountSnapshotRepository {
public:
    AccountSnapshotRepository(
        std::shared_ptr<ports::output::IRecordStore> store,
        const KeySpace& keys,
        std::shared_ptr<ports::output::IEventSerializer> events
    )
        : store_(std::move(store))
        , keys_(keys)
        , events_(std::move(events))
    {}

    void upsert(ports::output::RecordBatch& batch, const domain::Account& account) const {
        batch.hashSet(keys_.key(KeyKind::ACCOUNTS), account.id, events_->serialize(account.lastEvent()));
    }

    /**
     * @return std::nullopt если снимка нет
     * @throws domain::DeserializationError если снимок повреждён
     */
    std::optional<domain::Account> load(const std::string& accountId) {
        auto bytes = store_->getField(keys_.key(KeyKind::ACCOUNTS), accountId);
        if (!bytes) {
            return std::nullopt;
        }
        return decode(*bytes);
    }

    /**
     * @brief Все снимки; повреждённые пропускаются с записью в stderr
     */
    std::map<std::string, domain::Account> loadAll() {
        std::map<std::string, domain::Account> result;

        for (const auto& [accountId, bytes] : store_->getAll(keys_.key(KeyKind::ACCOUNTS))) {
            try {
                result.emplace(accountId, decode(bytes));
            } catch (const std::exception& e) {
                std::cerr << "[AccountRepository] Skipped " << accountId
                          << ": " << e.what() << std::endl;
            }
        }

        return result;
    }

private:
    domain::Account decode(const std::string& bytes) const {
        auto event = events_->deserialize(bytes);
        auto* state = dynamic_cast<const domain::AccountStateEvent*>(event.get());
        if (!state) {
            throw domain::DeserializationError("Account snapshot is not AccountState: " + event->eventType);
        }
        return domain::Account(*state);
    }

    std::shared_ptr<ports::output::IRecordStore> store_;
    KeySpace keys_;
    std::shared_ptr<ports::output::IEventSerializer> events_;
};

} // namespace execdb::application
