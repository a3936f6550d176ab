#include "transports/transport_factory.hpp"
#include "transports/api_transport.hpp"
#include "transports/websocket_transport.hpp"
#include "transports/rest_transport.hpp"

#include "oatpp/core/base/Environment.hpp"

#include <mutex>
#include <stdexcept>

namespace rosgate
{
    namespace transports
    {

        void ensure_network_environment()
        {
            static std::once_flag once;
            std::call_once(once, []()
                           { oatpp::base::Environment::init(); });
        }

        std::unique_ptr<core::TransportInterface> DefaultTransportFactory::create(core::TransportKind kind)
        {
            switch (kind)
            {
            case core::TransportKind::Api:
                return std::make_unique<ApiTransport>();
            case core::TransportKind::WebSocket:
                return std::make_unique<WebSocketTransport>();
            case core::TransportKind::Rest:
                return std::make_unique<RestTransport>(request_timeout_);
            }
            throw std::invalid_argument("Unknown transport kind");
        }

    } // namespace transports
} // namespace rosgate
