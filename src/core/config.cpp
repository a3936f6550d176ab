#include "core/config.hpp"
#include <fstream>
#include <stdexcept>
#include <iostream>

namespace rosgate
{
    namespace core
    {

        // TimeoutConfig implementation
        void TimeoutConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("connect_ms"))
                connect_ms = j["connect_ms"];
            if (j.contains("login_ms"))
                login_ms = j["login_ms"];
            if (j.contains("command_ms"))
                command_ms = j["command_ms"];
        }

        nlohmann::json TimeoutConfig::to_json() const
        {
            return nlohmann::json{
                {"connect_ms", connect_ms},
                {"login_ms", login_ms},
                {"command_ms", command_ms}};
        }

        // StorageConfig implementation
        void StorageConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("backend"))
                backend = j["backend"].get<std::string>();
            if (j.contains("path"))
                path = j["path"].get<std::string>();
        }

        nlohmann::json StorageConfig::to_json() const
        {
            return nlohmann::json{
                {"backend", backend},
                {"path", path}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"].get<std::string>();
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"].get<std::string>();
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{
                {"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // GatewayConfig implementation
        std::unique_ptr<GatewayConfig> GatewayConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<GatewayConfig> GatewayConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("Configuration must be a JSON object");
            }

            auto config = std::make_unique<GatewayConfig>();

            if (j.contains("methods"))
            {
                if (!j["methods"].is_array())
                {
                    throw std::invalid_argument("methods must be an array");
                }
                config->methods = j["methods"].get<std::vector<std::string>>();
            }

            // Load sub-configurations
            if (j.contains("timeouts"))
            {
                config->timeouts.from_json(j["timeouts"]);
            }
            if (j.contains("storage"))
            {
                config->storage.from_json(j["storage"]);
            }
            if (j.contains("logging"))
            {
                config->logging.from_json(j["logging"]);
            }
            if (j.contains("router") && j["router"].is_object())
            {
                ConnectionConfig router;
                router.from_json(j["router"]);
                config->router = router;
            }

            return config;
        }

        std::unique_ptr<GatewayConfig> GatewayConfig::create_default()
        {
            return std::make_unique<GatewayConfig>();
        }

        nlohmann::json GatewayConfig::to_json() const
        {
            nlohmann::json j{
                {"methods", methods},
                {"timeouts", timeouts.to_json()},
                {"storage", storage.to_json()},
                {"logging", logging.to_json()}};
            if (router)
            {
                j["router"] = router->to_json();
            }
            return j;
        }

        void GatewayConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        bool GatewayConfig::validate() const
        {
            // Validate methods
            if (methods.empty())
            {
                std::cerr << "Configuration validation error: methods cannot be empty" << std::endl;
                return false;
            }
            for (const auto &method : methods)
            {
                if (!parse_transport_kind(method))
                {
                    std::cerr << "Configuration validation error: unknown method '" << method << "'" << std::endl;
                    return false;
                }
            }

            // Validate timeouts
            if (timeouts.connect_ms <= 0 || timeouts.login_ms <= 0)
            {
                std::cerr << "Configuration validation error: timeouts.connect_ms and timeouts.login_ms must be positive" << std::endl;
                return false;
            }
            if (timeouts.command_ms < 0)
            {
                std::cerr << "Configuration validation error: timeouts.command_ms cannot be negative" << std::endl;
                return false;
            }

            // Validate storage
            if (storage.backend != "sqlite" && storage.backend != "json")
            {
                std::cerr << "Configuration validation error: storage.backend must be 'sqlite' or 'json'" << std::endl;
                return false;
            }
            if (storage.path.empty())
            {
                std::cerr << "Configuration validation error: storage.path cannot be empty" << std::endl;
                return false;
            }

            // Validate router
            std::string problem;
            if (router && !router->validate(&problem))
            {
                std::cerr << "Configuration validation error: router " << problem << std::endl;
                return false;
            }

            return true;
        }

        std::vector<TransportKind> GatewayConfig::method_priority() const
        {
            std::vector<TransportKind> priority;
            for (const auto &method : methods)
            {
                auto kind = parse_transport_kind(method);
                if (!kind)
                {
                    throw std::invalid_argument("Unknown access method: " + method);
                }
                priority.push_back(*kind);
            }
            return priority;
        }

        SessionOptions GatewayConfig::session_options() const
        {
            SessionOptions options;
            options.connect_timeout = std::chrono::milliseconds(timeouts.connect_ms);
            options.login_timeout = std::chrono::milliseconds(timeouts.login_ms);
            options.command_timeout = std::chrono::milliseconds(timeouts.command_ms);
            return options;
        }

    } // namespace core
} // namespace rosgate
