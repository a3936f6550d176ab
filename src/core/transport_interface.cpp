#include "core/transport_interface.hpp"
#include "core/errors.hpp"

namespace rosgate
{
    namespace core
    {

        const char *transport_kind_name(TransportKind kind)
        {
            switch (kind)
            {
            case TransportKind::Api:
                return "RouterOS API";
            case TransportKind::WebSocket:
                return "WebSocket API";
            case TransportKind::Rest:
                return "HTTP REST API";
            }
            return "Unknown";
        }

        const char *transport_kind_id(TransportKind kind)
        {
            switch (kind)
            {
            case TransportKind::Api:
                return "api";
            case TransportKind::WebSocket:
                return "websocket";
            case TransportKind::Rest:
                return "rest";
            }
            return "unknown";
        }

        std::optional<TransportKind> parse_transport_kind(const std::string &text)
        {
            for (auto kind : {TransportKind::Api, TransportKind::WebSocket, TransportKind::Rest})
            {
                if (text == transport_kind_id(kind) || text == transport_kind_name(kind))
                {
                    return kind;
                }
            }
            return std::nullopt;
        }

        std::string Endpoint::to_string() const
        {
            return host + ":" + std::to_string(port) + (secure ? " (tls)" : "");
        }

        // TransportInterface implementation
        void TransportInterface::set_message_handler(MessageHandler handler)
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            message_handler_ = std::move(handler);
        }

        void TransportInterface::set_close_handler(CloseHandler handler)
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            close_handler_ = std::move(handler);
        }

        void TransportInterface::deliver(const protocol::Reply &reply)
        {
            MessageHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = message_handler_;
            }
            if (handler)
            {
                handler(reply);
            }
        }

        void TransportInterface::notify_closed(const std::string &reason)
        {
            CloseHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = close_handler_;
            }
            if (handler)
            {
                handler(reason);
            }
        }

        // BaseTransport implementation
        BaseTransport::BaseTransport(const std::string &logger_name)
            : logger_(core::get_logger(logger_name))
        {
        }

        std::string BaseTransport::get_connection_info() const
        {
            return std::string(transport_kind_name(get_type())) + " " + endpoint().to_string();
        }

        void BaseTransport::require_open() const
        {
            if (closed_)
            {
                throw RouterOsError(ErrorCode::Closed, "Transport is closed");
            }
            if (!open_)
            {
                throw RouterOsError(ErrorCode::NotOpen, "Transport is not open");
            }
        }

        void BaseTransport::mark_open(const Endpoint &endpoint)
        {
            {
                std::lock_guard<std::mutex> lock(endpoint_mutex_);
                endpoint_ = endpoint;
            }
            closed_ = false;
            open_ = true;

            logger_->info("Transport open",
                          LogContext().add("method", transport_kind_name(get_type())).add("endpoint", endpoint.to_string()));
        }

        bool BaseTransport::mark_closed()
        {
            closed_ = true;
            return open_.exchange(false);
        }

        Endpoint BaseTransport::endpoint() const
        {
            std::lock_guard<std::mutex> lock(endpoint_mutex_);
            return endpoint_;
        }

    } // namespace core
} // namespace rosgate
