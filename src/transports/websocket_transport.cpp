#include "transports/websocket_transport.hpp"
#include "transports/tcp_socket.hpp"
#include "transports/transport_factory.hpp"
#include "protocol/tunnel_codec.hpp"
#include "core/errors.hpp"

#include "oatpp-websocket/Connector.hpp"

namespace rosgate
{
    namespace transports
    {

        /**
         * Reassembles frames into messages and hands them to the transport
         */
        class WebSocketTransport::Listener : public oatpp::websocket::WebSocket::Listener
        {
        public:
            explicit Listener(WebSocketTransport &owner) : owner_(owner) {}

            void onPing(const WebSocket &socket, const oatpp::String &message) override
            {
                std::lock_guard<std::mutex> lock(owner_.write_mutex_);
                if (!socket.sendPong(message))
                {
                    owner_.logger_->warning("Failed to answer ping");
                }
            }

            void onPong(const WebSocket &, const oatpp::String &) override
            {
            }

            void onClose(const WebSocket &, v_uint16 code, const oatpp::String &message) override
            {
                owner_.logger_->info("Close frame received",
                                     core::LogContext().add("code", code).add("message", message ? std::string(message->c_str()) : std::string()));
            }

            void readMessage(const WebSocket &, v_uint8, p_char8 data, oatpp::v_io_size size) override
            {
                if (size > 0)
                {
                    buffer_.append(reinterpret_cast<const char *>(data), static_cast<size_t>(size));
                    return;
                }
                // size == 0 marks the end of the message
                std::string text;
                text.swap(buffer_);
                owner_.handle_message(text);
            }

        private:
            WebSocketTransport &owner_;
            std::string buffer_;
        };

        WebSocketTransport::WebSocketTransport()
            : BaseTransport("WebSocketTransport")
        {
            ensure_network_environment();
        }

        WebSocketTransport::~WebSocketTransport()
        {
            close();
        }

        void WebSocketTransport::open(const core::Endpoint &endpoint, std::chrono::milliseconds timeout)
        {
            if (running_)
            {
                close();
            }

            // Reachability first so unreachable hosts keep their ConnectTimeout/ConnectRefused codes
            const auto started = std::chrono::steady_clock::now();
            TcpSocket::check_reachable(endpoint.host, endpoint.port, timeout);
            auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            auto remaining = timeout > spent ? timeout - spent : std::chrono::milliseconds(1);

            tcp_ = std::make_shared<InterruptibleConnectionProvider>(oatpp::network::Address(endpoint.host, endpoint.port));
            provider_ = make_client_provider(endpoint, tcp_);

            try
            {
                // A server that accepts but never answers the upgrade is cut off at the deadline
                ConnectionDeadline deadline(tcp_, remaining);
                try
                {
                    auto connector = oatpp::websocket::Connector::createShared(provider_);
                    connection_ = connector->connect(TUNNEL_PATH);
                    socket_ = oatpp::websocket::WebSocket::createShared(connection_, true /* mask outgoing frames */);
                }
                catch (const std::exception &e)
                {
                    if (deadline.expired())
                    {
                        throw core::RouterOsError(core::ErrorCode::ConnectTimeout,
                                                  "WebSocket upgrade on " + endpoint.to_string() + " timed out after " +
                                                      std::to_string(timeout.count()) + " ms");
                    }
                    throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                              "WebSocket upgrade failed on " + endpoint.to_string() + ": " + e.what());
                }
                if (deadline.expired())
                {
                    throw core::RouterOsError(core::ErrorCode::ConnectTimeout,
                                              "WebSocket upgrade on " + endpoint.to_string() + " timed out");
                }
            }
            catch (const core::RouterOsError &)
            {
                release_connection();
                throw;
            }

            socket_->setListener(std::make_shared<Listener>(*this));

            running_ = true;
            mark_open(endpoint);

            listen_thread_ = std::make_unique<std::thread>(&WebSocketTransport::listen_messages, this);
        }

        void WebSocketTransport::send(const protocol::Command &command)
        {
            require_open();

            std::string message = protocol::tunnel::encode_command(command);

            logger_->debug("Sending command",
                           core::LogContext().add("command", command.name).add("tag", command.tag));

            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!socket_ || !socket_->sendOneFrameText(message))
            {
                throw core::RouterOsError(core::ErrorCode::Closed, "WebSocket send failed");
            }
        }

        void WebSocketTransport::close()
        {
            bool was_open = mark_closed();
            running_ = false;

            {
                std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
                if (!lock.owns_lock())
                {
                    // A send is stalled on a router that stopped reading; cut it loose
                    if (tcp_)
                    {
                        tcp_->interrupt();
                    }
                    lock.lock();
                }
                if (socket_)
                {
                    socket_->stopListening();
                    if (was_open && !socket_->sendClose())
                    {
                        logger_->debug("Close frame not delivered");
                    }
                }
                if (connection_.object && connection_.invalidator)
                {
                    connection_.invalidator->invalidate(connection_.object);
                }
            }

            if (listen_thread_ && listen_thread_->joinable())
            {
                if (listen_thread_->get_id() == std::this_thread::get_id())
                {
                    listen_thread_->detach();
                }
                else
                {
                    listen_thread_->join();
                    release_connection();
                }
            }
            else
            {
                release_connection();
            }
            listen_thread_.reset();

            if (was_open)
            {
                logger_->info("Transport closed", core::LogContext().add("endpoint", endpoint().to_string()));
            }
        }

        void WebSocketTransport::listen_messages()
        {
            std::string reason = "WebSocket closed by router";
            auto socket = socket_;
            try
            {
                socket->listen();
            }
            catch (const std::exception &e)
            {
                reason = std::string("WebSocket read failed: ") + e.what();
            }

            if (running_)
            {
                connection_lost(reason);
            }
        }

        void WebSocketTransport::handle_message(const std::string &text)
        {
            std::vector<protocol::Reply> replies;
            try
            {
                replies = protocol::tunnel::decode_message(text);
            }
            catch (const core::RouterOsError &e)
            {
                logger_->warning("Dropping malformed tunnel message", core::LogContext().add("error", e.what()));
                return;
            }

            for (const auto &reply : replies)
            {
                if (!running_)
                {
                    return;
                }
                deliver(reply);
            }
        }

        void WebSocketTransport::connection_lost(const std::string &reason)
        {
            if (!running_.exchange(false))
            {
                return;
            }
            mark_closed();

            logger_->warning("Connection lost", core::LogContext().add("reason", reason));
            notify_closed(reason);
        }

        void WebSocketTransport::release_connection()
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            socket_.reset();
            connection_ = oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream>();
            if (provider_)
            {
                provider_->stop();
                provider_.reset();
            }
            tcp_.reset();
        }

    } // namespace transports
} // namespace rosgate
