// include/settings/DbSettings.hpp
#pragma once

#include "settings/EnvReader.hpp"
#include <string>

namespace execdb::settings
{

    /**
     * @brief Подключение PostgresRecordStore к PostgreSQL
     *
     * Переменные окружения:
     * - EXECDB_DB_HOST (default: localhost)
     * - EXECDB_DB_PORT (default: 5432)
     * - EXECDB_DB_NAME (default: execdb)
     * - EXECDB_DB_USER (default: execdb)
     * - EXECDB_DB_PASSWORD (default: execdb_secret_password)
     * - EXECDB_DB_CREATE_SCHEMA (default: true) - создать таблицы журналов, множеств и хешей
     *
     * @throws std::invalid_argument при нечисловом порте или неверном флаге
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(env::text("EXECDB_DB_HOST", "localhost"))
            , port_(env::integer("EXECDB_DB_PORT", 5432, 1, 65535))
            , name_(env::text("EXECDB_DB_NAME", "execdb"))
            , user_(env::text("EXECDB_DB_USER", "execdb"))
            , password_(env::text("EXECDB_DB_PASSWORD", "execdb_secret_password"))
            , createSchema_(env::flag("EXECDB_DB_CREATE_SCHEMA", true))
        {
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        bool getCreateSchema() const { return createSchema_; }

        /**
         * @brief Строка подключения libpq
         */
        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        bool createSchema_;
    };

} // namespace execdb::settings
