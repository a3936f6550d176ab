#ifndef ROSGATE_TRANSPORTS_API_TRANSPORT_HPP
#define ROSGATE_TRANSPORTS_API_TRANSPORT_HPP

#include "core/transport_interface.hpp"
#include "protocol/api_codec.hpp"
#include "transports/tcp_socket.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace rosgate
{
    namespace transports
    {

        /**
         * RouterOS binary API transport (TCP 8728, TLS 8729)
         * Reads sentences on a dedicated thread and pushes decoded replies in order.
         */
        class ApiTransport : public core::BaseTransport
        {
        public:
            ApiTransport();
            ~ApiTransport();

            // TransportInterface implementation
            void open(const core::Endpoint &endpoint, std::chrono::milliseconds timeout) override;
            void send(const protocol::Command &command) override;
            void close() override;
            core::TransportKind get_type() const override { return core::TransportKind::Api; }

        private:
            void receive_sentences();
            void handle_sentence(const protocol::Sentence &sentence);
            void connection_lost(const std::string &reason);

            TcpSocket socket_;
            protocol::SentenceDecoder decoder_;
            std::mutex write_mutex_;

            // Threading
            std::atomic<bool> running_{false};
            std::unique_ptr<std::thread> receive_thread_;
        };

    } // namespace transports
} // namespace rosgate

#endif // ROSGATE_TRANSPORTS_API_TRANSPORT_HPP
