#pragma once

#include "settings/EnvReader.hpp"

namespace execdb::settings {

/**
 * @brief Поведение базы исполнения при старте
 *
 * Читает из ENV:
 * - EXECDB_LOAD_CACHES (default: true) - массовая загрузка в кэш
 * - EXECDB_FLUSH_ON_START (default: false) - стереть пространство трейдера
 * - EXECDB_CHECK_RESIDUALS (default: true) - проверить остатки прошлого запуска
 */
class DatabaseSettings {
public:
    DatabaseSettings()
        : loadCaches_(env::flag("EXECDB_LOAD_CACHES", true))
        , flushOnStart_(env::flag("EXECDB_FLUSH_ON_START", false))
        , checkResiduals_(env::flag("EXECDB_CHECK_RESIDUALS", true))
    {}

    bool getLoadCaches() const { return loadCaches_; }
    bool getFlushOnStart() const { return flushOnStart_; }
    bool getCheckResiduals() const { return checkResiduals_; }

private:
    bool loadCaches_;
    bool flushOnStart_;
    bool checkResiduals_;
};

} // namespace execdb::settings
