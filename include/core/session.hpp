#ifndef ROSGATE_CORE_SESSION_HPP
#define ROSGATE_CORE_SESSION_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "core/connection_config.hpp"
#include "core/logger.hpp"
#include "core/transport_interface.hpp"
#include "protocol/resources.hpp"
#include "services/command_dispatcher.hpp"

namespace rosgate
{
    namespace core
    {

        enum class SessionState
        {
            Unauthenticated,
            Authenticating,
            Authenticated,
            Failed
        };

        const char *to_string(SessionState state);

        /**
         * Session timing
         */
        struct SessionOptions
        {
            std::chrono::milliseconds connect_timeout{10000};
            std::chrono::milliseconds login_timeout{10000};
            std::chrono::milliseconds command_timeout{30000};
        };

        /**
         * One authenticated conversation with a router over one transport.
         * Commands are refused until the login handshake has succeeded.
         */
        class Session
        {
        public:
            Session(std::unique_ptr<TransportInterface> transport, SessionOptions options = SessionOptions{});
            ~Session();

            Session(const Session &) = delete;
            Session &operator=(const Session &) = delete;

            /**
             * Open the transport and log in
             * @throws RouterOsError ConnectTimeout, ConnectRefused, AuthFailed or ProtocolError
             */
            void connect(const ConnectionConfig &config);

            /**
             * Close the transport and reject pending commands with SessionClosed; idempotent
             */
            void disconnect();

            bool is_authenticated() const { return state_ == SessionState::Authenticated; }
            SessionState state() const { return state_; }
            TransportKind kind() const { return transport_->get_type(); }
            std::string connection_info() const { return transport_->get_connection_info(); }

            /**
             * Raw command; the typed operations below are built on it
             */
            std::future<services::CommandResult> execute(const std::string &command,
                                                         const protocol::Attributes &args = {});

            // Typed operations
            std::future<protocol::SystemResource> system_resource();
            std::future<std::vector<protocol::NetworkInterface>> interfaces();
            std::future<std::vector<protocol::HotspotActive>> hotspot_active();
            std::future<std::vector<protocol::HotspotUser>> hotspot_users();

            /**
             * @return future holding the new item id reported by the router (may be empty)
             */
            std::future<std::string> add_hotspot_user(const std::string &name,
                                                      const std::string &password,
                                                      const std::string &profile = "default");
            std::future<void> remove_hotspot_user(const std::string &id);
            std::future<void> disconnect_active_user(const std::string &id);

            services::DispatcherStatisticsSnapshot get_statistics() const;

        private:
            void login(const ConnectionConfig &config);
            /**
             * Wait for a /login reply and translate dispatcher errors into handshake errors.
             * after_reply is set once the router has answered an earlier login step.
             */
            services::CommandResult await_login(std::future<services::CommandResult> &future, bool after_reply);
            void handle_transport_closed(services::CommandDispatcher *dispatcher, const std::string &reason);

            template <typename T>
            std::future<T> run(const std::string &command, const protocol::Attributes &args,
                               std::function<T(services::CommandResult &)> convert);
            std::future<void> run_void(const std::string &command, const protocol::Attributes &args);

            std::unique_ptr<TransportInterface> transport_;
            std::unique_ptr<services::CommandDispatcher> dispatcher_;
            std::atomic<SessionState> state_{SessionState::Unauthenticated};
            SessionOptions options_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace rosgate

#endif // ROSGATE_CORE_SESSION_HPP
