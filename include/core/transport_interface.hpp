#ifndef ROSGATE_CORE_TRANSPORT_INTERFACE_HPP
#define ROSGATE_CORE_TRANSPORT_INTERFACE_HPP

#include <string>
#include <memory>
#include <functional>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include "core/logger.hpp"
#include "protocol/reply.hpp"

namespace rosgate
{
    namespace core
    {

        /**
         * Transport method enumeration
         */
        enum class TransportKind
        {
            Api,
            WebSocket,
            Rest
        };

        /**
         * Display name ("RouterOS API", "WebSocket API", "HTTP REST API")
         */
        const char *transport_kind_name(TransportKind kind);

        /**
         * Short identifier used in configuration files ("api", "websocket", "rest")
         */
        const char *transport_kind_id(TransportKind kind);

        /**
         * Accepts either the identifier or the display name, case-sensitive
         */
        std::optional<TransportKind> parse_transport_kind(const std::string &text);

        /**
         * Network address of one transport method
         */
        struct Endpoint
        {
            std::string host;
            uint16_t port = 0;
            bool secure = false;

            std::string to_string() const;
        };

        /**
         * Abstract transport interface
         * One bidirectional channel to one router. Replies are pushed to the
         * registered message handler in the order the router produced them.
         */
        class TransportInterface
        {
        public:
            using MessageHandler = std::function<void(const protocol::Reply &)>;
            using CloseHandler = std::function<void(const std::string &reason)>;

            virtual ~TransportInterface() = default;

            /**
             * Establish the channel
             * @throws RouterOsError ConnectTimeout, ConnectRefused or ProtocolError
             */
            virtual void open(const Endpoint &endpoint, std::chrono::milliseconds timeout) = 0;

            /**
             * Send one tagged command
             * @throws RouterOsError NotOpen before open(), Closed after close()
             */
            virtual void send(const protocol::Command &command) = 0;

            /**
             * Close the channel; idempotent
             */
            virtual void close() = 0;

            virtual bool is_open() const = 0;

            virtual TransportKind get_type() const = 0;

            virtual std::string get_connection_info() const = 0;

            /**
             * Stateless transports answer each send() synchronously,
             * delivering the replies before send() returns
             */
            virtual bool is_stateless() const { return false; }

            void set_message_handler(MessageHandler handler);
            void set_close_handler(CloseHandler handler);

        protected:
            TransportInterface() = default;

            void deliver(const protocol::Reply &reply);

            /**
             * Report loss of the channel that was not requested through close()
             */
            void notify_closed(const std::string &reason);

        private:
            std::mutex handler_mutex_;
            MessageHandler message_handler_;
            CloseHandler close_handler_;
        };

        /**
         * Base transport implementation with the open/closed lifecycle
         */
        class BaseTransport : public TransportInterface
        {
        public:
            explicit BaseTransport(const std::string &logger_name);
            virtual ~BaseTransport() = default;

            bool is_open() const override { return open_; }
            std::string get_connection_info() const override;

        protected:
            /**
             * Throw NotOpen or Closed unless the channel is usable
             */
            void require_open() const;

            void mark_open(const Endpoint &endpoint);

            /**
             * @return true for the call that actually moved the transport to closed
             */
            bool mark_closed();

            Endpoint endpoint() const;

            std::shared_ptr<Logger> logger_;

        private:
            std::atomic<bool> open_{false};
            std::atomic<bool> closed_{false};
            mutable std::mutex endpoint_mutex_;
            Endpoint endpoint_;
        };

        /**
         * Creates transports by kind; the connection manager consults it in priority order
         */
        class TransportFactory
        {
        public:
            virtual ~TransportFactory() = default;
            virtual std::unique_ptr<TransportInterface> create(TransportKind kind) = 0;
        };

    } // namespace core
} // namespace rosgate

#endif // ROSGATE_CORE_TRANSPORT_INTERFACE_HPP
