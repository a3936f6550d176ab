#ifndef ROSGATE_STORAGE_CONFIG_STORE_HPP
#define ROSGATE_STORAGE_CONFIG_STORE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/connection_config.hpp"
#include "core/logger.hpp"
#include "database/models.hpp"

namespace rosgate
{
    namespace storage
    {

        /**
         * Durable home of the current ConnectionConfig
         */
        class ConfigStore
        {
        public:
            virtual ~ConfigStore() = default;

            virtual void save(const core::ConnectionConfig &config) = 0;
            virtual std::optional<core::ConnectionConfig> load() = 0;
            virtual void clear() = 0;
        };

        /**
         * SQLite-backed store (sqlite_orm), one row in router_connection
         */
        class SqliteConfigStore : public ConfigStore
        {
        public:
            /**
             * Opens or creates the database and syncs the schema
             * @throws db::DatabaseException when the database cannot be opened
             */
            explicit SqliteConfigStore(const std::string &path);

            void save(const core::ConnectionConfig &config) override;
            std::optional<core::ConnectionConfig> load() override;
            void clear() override;

        private:
            std::shared_ptr<db::Storage> storage_;
            std::mutex mutex_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * JSON file store (nlohmann/json); the file holds {"router": {...}, "saved_at": ...}
         */
        class JsonFileConfigStore : public ConfigStore
        {
        public:
            explicit JsonFileConfigStore(const std::string &path);

            void save(const core::ConnectionConfig &config) override;
            std::optional<core::ConnectionConfig> load() override;
            void clear() override;

            const std::string &path() const { return path_; }

        private:
            std::string path_;
            std::mutex mutex_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * @param backend "sqlite" or "json"
         * @throws std::invalid_argument for an unknown backend
         */
        std::unique_ptr<ConfigStore> make_config_store(const std::string &backend, const std::string &path);

    } // namespace storage
} // namespace rosgate

#endif // ROSGATE_STORAGE_CONFIG_STORE_HPP
