#ifndef ROSGATE_TRANSPORTS_CONNECTION_PROVIDER_HPP
#define ROSGATE_TRANSPORTS_CONNECTION_PROVIDER_HPP

#include "core/transport_interface.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "oatpp/network/ConnectionProvider.hpp"
#include "oatpp/network/tcp/Connection.hpp"

namespace rosgate
{
    namespace transports
    {

        /**
         * oatpp TCP client provider whose live connections can be aborted from
         * another thread. TLS providers are layered on top of it.
         */
        class InterruptibleConnectionProvider : public oatpp::network::ClientConnectionProvider
        {
        public:
            explicit InterruptibleConnectionProvider(const oatpp::network::Address &address);

            oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream> get() override;
            oatpp::async::CoroutineStarterForResult<const oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream> &> getAsync() override;
            void stop() override;

            /**
             * Shut down every connection still alive; blocked reads and writes on them return
             */
            void interrupt();

        private:
            std::shared_ptr<oatpp::network::ClientConnectionProvider> tcp_;
            std::mutex mutex_;
            std::vector<std::weak_ptr<oatpp::network::tcp::Connection>> connections_;
        };

        /**
         * Plain or TLS provider for the endpoint, built over the interruptible TCP layer
         */
        std::shared_ptr<oatpp::network::ClientConnectionProvider> make_client_provider(
            const core::Endpoint &endpoint,
            const std::shared_ptr<InterruptibleConnectionProvider> &tcp);

        /**
         * Interrupts the provider's connections unless destroyed before the timeout.
         * A zero timeout never fires.
         */
        class ConnectionDeadline
        {
        public:
            ConnectionDeadline(std::shared_ptr<InterruptibleConnectionProvider> provider,
                               std::chrono::milliseconds timeout);
            ~ConnectionDeadline();

            ConnectionDeadline(const ConnectionDeadline &) = delete;
            ConnectionDeadline &operator=(const ConnectionDeadline &) = delete;

            bool expired() const;

        private:
            void watch(std::chrono::steady_clock::time_point deadline);

            std::shared_ptr<InterruptibleConnectionProvider> provider_;
            mutable std::mutex mutex_;
            std::condition_variable cv_;
            bool dismissed_ = false;
            bool expired_ = false;
            std::thread thread_;
        };

    } // namespace transports
} // namespace rosgate

#endif // ROSGATE_TRANSPORTS_CONNECTION_PROVIDER_HPP
