#ifndef ROSGATE_TRANSPORTS_TRANSPORT_FACTORY_HPP
#define ROSGATE_TRANSPORTS_TRANSPORT_FACTORY_HPP

#include "core/transport_interface.hpp"
#include <chrono>
#include <memory>

namespace rosgate
{
    namespace transports
    {

        /**
         * Initialise the oatpp environment once per process
         */
        void ensure_network_environment();

        /**
         * Builds the real transports: binary API, WebSocket tunnel and REST
         */
        class DefaultTransportFactory : public core::TransportFactory
        {
        public:
            /**
             * @param request_timeout bound on one REST round trip; zero waits indefinitely
             */
            explicit DefaultTransportFactory(std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000))
                : request_timeout_(request_timeout) {}

            std::unique_ptr<core::TransportInterface> create(core::TransportKind kind) override;

        private:
            std::chrono::milliseconds request_timeout_;
        };

    } // namespace transports
} // namespace rosgate

#endif // ROSGATE_TRANSPORTS_TRANSPORT_FACTORY_HPP
