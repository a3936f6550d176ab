#ifndef ROSGATE_TRANSPORTS_REST_TRANSPORT_HPP
#define ROSGATE_TRANSPORTS_REST_TRANSPORT_HPP

#include "core/transport_interface.hpp"
#include "transports/connection_provider.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "oatpp/network/ConnectionProvider.hpp"
#include "oatpp/web/client/HttpRequestExecutor.hpp"

namespace rosgate
{
    namespace transports
    {

        /**
         * RouterOS v7 REST API transport (http[s]://host/rest/...)
         * Stateless: every send() is one HTTP round trip and its replies are
         * delivered before send() returns. /login only records the credentials
         * used for Basic authentication and checks them. A request that gets no
         * response within its timeout fails with CommandTimeout.
         */
        class RestTransport : public core::BaseTransport
        {
        public:
            static constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{30000};

            explicit RestTransport(std::chrono::milliseconds request_timeout = DEFAULT_REQUEST_TIMEOUT);
            ~RestTransport();

            // TransportInterface implementation
            void open(const core::Endpoint &endpoint, std::chrono::milliseconds timeout) override;
            void send(const protocol::Command &command) override;
            void close() override;
            core::TransportKind get_type() const override { return core::TransportKind::Rest; }
            bool is_stateless() const override { return true; }

        private:
            std::vector<protocol::Reply> perform(const protocol::Command &command);

            std::shared_ptr<InterruptibleConnectionProvider> tcp_;
            std::shared_ptr<oatpp::network::ClientConnectionProvider> provider_;
            std::shared_ptr<oatpp::web::client::HttpRequestExecutor> executor_;
            std::chrono::milliseconds request_timeout_;
            std::chrono::milliseconds login_timeout_{10000};

            std::mutex request_mutex_;
            std::mutex provider_mutex_;
            std::string authorization_;
            std::string host_header_;
        };

    } // namespace transports
} // namespace rosgate

#endif // ROSGATE_TRANSPORTS_REST_TRANSPORT_HPP
