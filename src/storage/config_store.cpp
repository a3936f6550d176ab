#include "storage/config_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace rosgate
{
    namespace storage
    {

        namespace
        {
            constexpr int64_t CONNECTION_ROW_ID = 1;

            db::RouterConnection to_row(const core::ConnectionConfig &config)
            {
                db::RouterConnection row;
                row.id = CONNECTION_ROW_ID;
                row.host = config.host;
                row.username = config.username;
                row.password = config.password;
                row.port = config.port;
                row.secure = config.secure ? 1 : 0;
                row.rest_port = config.rest_port;
                row.updated_at = db::getCurrentTimestamp();
                return row;
            }

            core::ConnectionConfig from_row(const db::RouterConnection &row)
            {
                core::ConnectionConfig config;
                config.host = row.host;
                config.username = row.username;
                config.password = row.password;
                config.port = static_cast<uint16_t>(row.port);
                config.secure = row.secure != 0;
                config.rest_port = static_cast<uint16_t>(row.rest_port);
                return config;
            }
        } // namespace

        // SqliteConfigStore implementation
        SqliteConfigStore::SqliteConfigStore(const std::string &path)
            : logger_(core::get_logger("SqliteConfigStore"))
        {
            try
            {
                storage_ = std::make_shared<db::Storage>(db::initStorage(path));
                storage_->sync_schema();
            }
            catch (const std::system_error &e)
            {
                throw db::DatabaseException("Cannot open config database " + path + ": " + e.what());
            }

            logger_->debug("Config database ready", core::LogContext().add("path", path));
        }

        void SqliteConfigStore::save(const core::ConnectionConfig &config)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            try
            {
                storage_->replace(to_row(config));
            }
            catch (const std::system_error &e)
            {
                throw db::DatabaseException(std::string("Failed to save connection: ") + e.what());
            }

            logger_->info("Connection saved",
                          core::LogContext().add("router", config.key()).add("user", config.username));
        }

        std::optional<core::ConnectionConfig> SqliteConfigStore::load()
        {
            using namespace sqlite_orm;

            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<db::RouterConnection> rows;
            try
            {
                rows = storage_->get_all<db::RouterConnection>(
                    where(c(&db::RouterConnection::id) == CONNECTION_ROW_ID));
            }
            catch (const std::system_error &e)
            {
                throw db::DatabaseException(std::string("Failed to load connection: ") + e.what());
            }

            if (rows.empty())
            {
                return std::nullopt;
            }
            return from_row(rows.front());
        }

        void SqliteConfigStore::clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            try
            {
                storage_->remove_all<db::RouterConnection>();
            }
            catch (const std::system_error &e)
            {
                throw db::DatabaseException(std::string("Failed to clear connection: ") + e.what());
            }
        }

        // JsonFileConfigStore implementation
        JsonFileConfigStore::JsonFileConfigStore(const std::string &path)
            : path_(path), logger_(core::get_logger("JsonFileConfigStore"))
        {
        }

        void JsonFileConfigStore::save(const core::ConnectionConfig &config)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            nlohmann::json j{
                {"router", config.to_json()},
                {"saved_at", db::getCurrentTimestamp()}};

            // Write beside the target, then rename over it
            const std::string temp_path = path_ + ".tmp";
            {
                std::ofstream file(temp_path);
                if (!file.is_open())
                {
                    throw std::runtime_error("Cannot open connection file for writing: " + temp_path);
                }
                file << j.dump(4);
                if (!file.good())
                {
                    throw std::runtime_error("Failed to write connection file: " + temp_path);
                }
            }
            if (std::rename(temp_path.c_str(), path_.c_str()) != 0)
            {
                throw std::runtime_error("Failed to replace connection file: " + path_);
            }

            logger_->info("Connection saved",
                          core::LogContext().add("router", config.key()).add("path", path_));
        }

        std::optional<core::ConnectionConfig> JsonFileConfigStore::load()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            std::ifstream file(path_);
            if (!file.is_open())
            {
                return std::nullopt;
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in connection file: " + std::string(e.what()));
            }

            if (!j.is_object() || !j.contains("router") || !j["router"].is_object())
            {
                return std::nullopt;
            }

            core::ConnectionConfig config;
            try
            {
                config.from_json(j["router"]);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("Malformed connection in " + path_ + ": " + e.what());
            }
            return config;
        }

        void JsonFileConfigStore::clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::remove(path_.c_str()) != 0)
            {
                logger_->debug("No connection file to remove", core::LogContext().add("path", path_));
            }
        }

        std::unique_ptr<ConfigStore> make_config_store(const std::string &backend, const std::string &path)
        {
            if (backend == "sqlite")
            {
                return std::make_unique<SqliteConfigStore>(path);
            }
            if (backend == "json")
            {
                return std::make_unique<JsonFileConfigStore>(path);
            }
            throw std::invalid_argument("Unknown storage backend: " + backend);
        }

    } // namespace storage
} // namespace rosgate
