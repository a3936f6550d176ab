#ifndef ROSGATE_TRANSPORTS_WEBSOCKET_TRANSPORT_HPP
#define ROSGATE_TRANSPORTS_WEBSOCKET_TRANSPORT_HPP

#include "core/transport_interface.hpp"
#include "transports/connection_provider.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include "oatpp/network/ConnectionProvider.hpp"
#include "oatpp-websocket/WebSocket.hpp"

namespace rosgate
{
    namespace transports
    {

        /**
         * WebSocket tunnel transport (ws://host:port+1, one JSON object per message)
         */
        class WebSocketTransport : public core::BaseTransport
        {
        public:
            static constexpr const char *TUNNEL_PATH = "/";

            WebSocketTransport();
            ~WebSocketTransport();

            // TransportInterface implementation
            void open(const core::Endpoint &endpoint, std::chrono::milliseconds timeout) override;
            void send(const protocol::Command &command) override;
            void close() override;
            core::TransportKind get_type() const override { return core::TransportKind::WebSocket; }

        private:
            class Listener;

            void listen_messages();
            void handle_message(const std::string &text);
            void connection_lost(const std::string &reason);
            void release_connection();

            std::shared_ptr<InterruptibleConnectionProvider> tcp_;
            std::shared_ptr<oatpp::network::ClientConnectionProvider> provider_;
            oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream> connection_;
            std::shared_ptr<oatpp::websocket::WebSocket> socket_;
            std::mutex write_mutex_;

            // Threading
            std::atomic<bool> running_{false};
            std::unique_ptr<std::thread> listen_thread_;
        };

    } // namespace transports
} // namespace rosgate

#endif // ROSGATE_TRANSPORTS_WEBSOCKET_TRANSPORT_HPP
