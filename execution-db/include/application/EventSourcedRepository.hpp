#pragma once

#include "application/KeySpace.hpp"
#include "domain/Exceptions.hpp"
#include "domain/Order.hpp"
#include "domain/Position.hpp"
#include "domain/commands/SubmitOrderCommand.hpp"
#include "domain/events/OrderFilledEvent.hpp"
#include "ports/output/ICommandSerializer.hpp"
#include "ports/output/IEventSerializer.hpp"
#include "ports/output/IRecordStore.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace execdb::application {

/**
 * @brief Пара кодеков, через которые идёт журнал сущности
 */
struct Codecs {
    std::shared_ptr<ports::output::ICommandSerializer> commands;
    std::shared_ptr<ports::output::IEventSerializer> events;
};

/**
 * @brief Различия между видами сущностей для EventSourcedRepository
 *
 * Специализация задаёт:
 * - name()      имя для логов
 * - logKind()   вид ключа журнала
 * - idsKind()   вид ключа множества всех идентификаторов
 * - seed()      сущность из записи 0
 * - replay()    применить запись 1..n
 */
template <typename Entity>
struct EntityTraits;

template <>
struct EntityTraits<domain::Order> {
    static const char* name() { return "Order"; }
    static KeyKind logKind() { return KeyKind::ORDERS; }
    static KeyKind idsKind() { return KeyKind::INDEX_ORDERS; }

    static domain::Order seed(const std::string& entry, const Codecs& codecs) {
        auto command = codecs.commands->deserialize(entry);
        auto* submit = dynamic_cast<const domain::SubmitOrderCommand*>(command.get());
        if (!submit) {
            throw domain::DeserializationError(
                "Order log entry 0 is not SubmitOrder: " + command->commandType);
        }
        return domain::Order::create(*submit);
    }

    static void replay(domain::Order& order, const std::string& entry, const Codecs& codecs) {
        auto event = codecs.events->deserialize(entry);
        auto* orderEvent = dynamic_cast<const domain::OrderEvent*>(event.get());
        if (!orderEvent) {
            throw domain::DeserializationError(
                "Order log entry is not an order event: " + event->eventType);
        }
        order.apply(*orderEvent);
    }
};

template <>
struct EntityTraits<domain::Position> {
    static const char* name() { return "Position"; }
    static KeyKind logKind() { return KeyKind::POSITIONS; }
    static KeyKind idsKind() { return KeyKind::INDEX_POSITIONS; }

    static domain::Position seed(const std::string& entry, const Codecs& codecs) {
        return domain::Position(fill(entry, codecs));
    }

    static void replay(domain::Position& position, const std::string& entry, const Codecs& codecs) {
        position.apply(fill(entry, codecs));
    }

private:
    static domain::OrderFilledEvent fill(const std::string& entry, const Codecs& codecs) {
        auto event = codecs.events->deserialize(entry);
        auto* filled = dynamic_cast<const domain::OrderFilledEvent*>(event.get());
        if (!filled) {
            throw domain::DeserializationError(
                "Position log entry is not a fill: " + event->eventType);
        }
        return *filled;
    }
};

/**
 * @brief Обобщённый репозиторий сущности с журналом событий
 *
 * Хранит журнал по ключу logKind + id и множество всех id.
 * Восстановление = seed(запись 0) + replay(записи 1..n).
 * Запись идёт через RecordBatch, собираемый вызывающим кодом,
 * чтобы журнал и индексы попадали в одну транзакцию.
 */
template <typename Entity>
class EventSourcedRepository {
public:
    using Traits = EntityTraits<Entity>;

    EventSourcedRepository(
        std::shared_ptr<ports::output::IRecordStore> store,
        const KeySpace& keys,
        const Codecs& codecs
    )
        : store_(std::move(store))
        , keys_(keys)
        , codecs_(codecs)
    {}

    std::string logKey(const std::string& id) const {
        return keys_.key(Traits::logKind(), id);
    }

    std::string idsKey() const {
        return keys_.key(Traits::idsKind());
    }

    /**
     * @brief Первая запись журнала + регистрация id
     */
    void appendFirst(ports::output::RecordBatch& batch, const std::string& id, const std::string& bytes) const {
        batch.append(logKey(id), bytes);
        batch.setAdd(idsKey(), id);
    }

    void appendNext(ports::output::RecordBatch& batch, const std::string& id, const std::string& bytes) const {
        batch.append(logKey(id), bytes);
    }

    bool exists(const std::string& id) {
        return store_->isMember(idsKey(), id);
    }

    std::set<std::string> ids() {
        return store_->members(idsKey());
    }

    /**
     * @brief Восстановить сущность из журнала
     * @return std::nullopt если журнал пуст
     * @throws domain::DeserializationError при повреждённой записи
     * @throws domain::InvalidStateTrigger если журнал не воспроизводится
     */
    std::optional<Entity> load(const std::string& id) {
        auto entries = store_->readLog(logKey(id));
        if (entries.empty()) {
            return std::nullopt;
        }

        Entity entity = Traits::seed(entries.front(), codecs_);
        for (size_t i = 1; i < entries.size(); ++i) {
            Traits::replay(entity, entries[i], codecs_);
        }
        return entity;
    }

    /**
     * @brief Загрузить все сущности из множества id
     *
     * Запись, которую не удалось восстановить, пропускается и
     * попадает в stderr. Ошибки хранилища пробрасываются.
     */
    std::map<std::string, Entity> loadAll() {
        std::map<std::string, Entity> result;

        for (const auto& id : ids()) {
            try {
                auto entity = load(id);
                if (entity) {
                    result.emplace(id, std::move(*entity));
                } else {
                    std::cerr << "[" << Traits::name() << "Repository] Indexed id has no log: "
                              << id << std::endl;
                }
            } catch (const domain::StoreUnavailable&) {
                throw;
            } catch (const std::exception& e) {
                std::cerr << "[" << Traits::name() << "Repository] Skipped " << id
                          << ": " << e.what() << std::endl;
            }
        }

        return result;
    }

private:
    std::shared_ptr<ports::output::IRecordStore> store_;
    KeySpace keys_;
    Codecs codecs_;
};

} // namespace execdb::application
