#ifndef ROSGATE_CORE_CONFIG_HPP
#define ROSGATE_CORE_CONFIG_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/connection_config.hpp"
#include "core/session.hpp"
#include "core/transport_interface.hpp"

namespace rosgate
{
    namespace core
    {

        /**
         * Timeouts in milliseconds; 0 disables the command deadline
         */
        struct TimeoutConfig
        {
            int connect_ms = 10000;
            int login_ms = 10000;
            int command_ms = 30000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Where the connection is persisted
         */
        struct StorageConfig
        {
            std::string backend = "sqlite"; // "sqlite" or "json"
            std::string path = "rosgate.db";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete gateway configuration
         */
        class GatewayConfig
        {
        public:
            // Access methods by id ("api", "websocket", "rest"), tried in order
            std::vector<std::string> methods{"api", "websocket", "rest"};

            // Sub-configurations
            TimeoutConfig timeouts;
            StorageConfig storage;
            LoggingConfig logging;

            // Initial router, if any
            std::optional<ConnectionConfig> router;

        public:
            GatewayConfig() = default;

            // Factory methods
            static std::unique_ptr<GatewayConfig> from_file(const std::string &config_path);
            static std::unique_ptr<GatewayConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<GatewayConfig> create_default();

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Validation
            bool validate() const;

            /**
             * @throws std::invalid_argument for an unknown method id
             */
            std::vector<TransportKind> method_priority() const;
            SessionOptions session_options() const;
        };

    } // namespace core
} // namespace rosgate

#endif // ROSGATE_CORE_CONFIG_HPP
