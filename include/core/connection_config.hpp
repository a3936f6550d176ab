#ifndef ROSGATE_CORE_CONNECTION_CONFIG_HPP
#define ROSGATE_CORE_CONNECTION_CONFIG_HPP

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/transport_interface.hpp"

namespace rosgate
{
    namespace core
    {

        static constexpr uint16_t DEFAULT_API_PORT = 8728;
        static constexpr uint16_t DEFAULT_API_SSL_PORT = 8729;
        static constexpr uint16_t DEFAULT_REST_PORT = 80;
        static constexpr uint16_t DEFAULT_REST_SSL_PORT = 443;

        /**
         * Router address and credentials.
         * A port of 0 selects the default for the method and the secure flag.
         */
        struct ConnectionConfig
        {
            std::string host;
            std::string username;
            std::string password;
            uint16_t port = 0;
            bool secure = false;
            uint16_t rest_port = 0;

            uint16_t api_port() const;

            /**
             * The tunnel listens one above the API port
             */
            uint16_t websocket_port() const;

            uint16_t effective_rest_port() const;

            Endpoint endpoint_for(TransportKind kind) const;

            /**
             * "host:port" identity of the router
             */
            std::string key() const;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;

            /**
             * @param error receives the first problem found, if any
             */
            bool validate(std::string *error = nullptr) const;

            bool operator==(const ConnectionConfig &other) const;
            bool operator!=(const ConnectionConfig &other) const { return !(*this == other); }
        };

    } // namespace core
} // namespace rosgate

#endif // ROSGATE_CORE_CONNECTION_CONFIG_HPP
