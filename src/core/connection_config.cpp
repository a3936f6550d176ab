#include "core/connection_config.hpp"

namespace rosgate
{
    namespace core
    {

        uint16_t ConnectionConfig::api_port() const
        {
            if (port != 0)
            {
                return port;
            }
            return secure ? DEFAULT_API_SSL_PORT : DEFAULT_API_PORT;
        }

        uint16_t ConnectionConfig::websocket_port() const
        {
            return static_cast<uint16_t>(api_port() + 1);
        }

        uint16_t ConnectionConfig::effective_rest_port() const
        {
            if (rest_port != 0)
            {
                return rest_port;
            }
            return secure ? DEFAULT_REST_SSL_PORT : DEFAULT_REST_PORT;
        }

        Endpoint ConnectionConfig::endpoint_for(TransportKind kind) const
        {
            Endpoint endpoint;
            endpoint.host = host;
            endpoint.secure = secure;
            switch (kind)
            {
            case TransportKind::Api:
                endpoint.port = api_port();
                break;
            case TransportKind::WebSocket:
                endpoint.port = websocket_port();
                break;
            case TransportKind::Rest:
                endpoint.port = effective_rest_port();
                break;
            }
            return endpoint;
        }

        std::string ConnectionConfig::key() const
        {
            return host + ":" + std::to_string(api_port());
        }

        void ConnectionConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("host"))
                host = j["host"];
            if (j.contains("username"))
                username = j["username"];
            if (j.contains("password"))
                password = j["password"];
            if (j.contains("port"))
                port = j["port"];
            if (j.contains("secure"))
                secure = j["secure"];
            if (j.contains("rest_port"))
                rest_port = j["rest_port"];
        }

        nlohmann::json ConnectionConfig::to_json() const
        {
            return nlohmann::json{
                {"host", host},
                {"username", username},
                {"password", password},
                {"port", port},
                {"secure", secure},
                {"rest_port", rest_port}};
        }

        bool ConnectionConfig::validate(std::string *error) const
        {
            std::string problem;
            if (host.empty())
            {
                problem = "host cannot be empty";
            }
            else if (username.empty())
            {
                problem = "username cannot be empty";
            }
            else if (port == 65535)
            {
                problem = "port leaves no room for the WebSocket tunnel (port + 1)";
            }

            if (problem.empty())
            {
                return true;
            }
            if (error)
            {
                *error = problem;
            }
            return false;
        }

        bool ConnectionConfig::operator==(const ConnectionConfig &other) const
        {
            return host == other.host && username == other.username && password == other.password &&
                   port == other.port && secure == other.secure && rest_port == other.rest_port;
        }

    } // namespace core
} // namespace rosgate
