#pragma once

#include <boost/di.hpp>
#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace execdb::ports::input {
    class IExecutionDatabase;
}

namespace execdb::settings {
    class DatabaseSettings;
}

/**
 * @class ExecDbApp
 * @brief Прогрев базы исполнения при старте движка
 *
 * Порядок работы run():
 * 1. configureInjection() - Boost.DI: настройки, PostgresRecordStore, JSON кодеки, ExecutionDatabase
 * 2. warmUp() - flush (по настройке), загрузка счетов / ордеров / позиций в кэш,
 *    проверка остатков прошлого запуска, итоговая сводка
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Input Port: IExecutionDatabase
 * - Secondary Adapters: PostgresRecordStore, JsonCommandSerializer, JsonEventSerializer
 */
class ExecDbApp
{
public:
    ExecDbApp();
    ~ExecDbApp();

    /**
     * @brief Выполнить прогрев
     * @return 0 если остатков нет, 2 если найдены остатки
     * @throws std::exception при фатальной ошибке (недоступно хранилище, неверные настройки)
     */
    int run();

    /**
     * @brief Прервать прогрев между шагами
     */
    void stop();

private:
    void configureInjection();
    int warmUp();
    bool stopped() const;
    void printStartupBanner();

    std::shared_ptr<execdb::settings::DatabaseSettings> databaseSettings_;
    std::shared_ptr<execdb::ports::input::IExecutionDatabase> database_;
    std::atomic<bool> stopRequested_{false};
};
