#ifndef ROSGATE_CORE_CONNECTION_MANAGER_HPP
#define ROSGATE_CORE_CONNECTION_MANAGER_HPP

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/connection_config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/session.hpp"
#include "core/transport_interface.hpp"
#include "protocol/resources.hpp"
#include "storage/config_store.hpp"

namespace rosgate
{
    namespace core
    {

        /**
         * Why one access method could not be used
         */
        struct MethodFailure
        {
            TransportKind method;
            ErrorCode code;
            std::string message;

            nlohmann::json to_json() const;
        };

        /**
         * Raised when no access method could be used; carries one entry per attempt
         */
        class NoMethodAvailableError : public RouterOsError
        {
        public:
            explicit NoMethodAvailableError(std::vector<MethodFailure> failures);

            const std::vector<MethodFailure> &failures() const { return failures_; }

        private:
            static std::string summarize(const std::vector<MethodFailure> &failures);

            std::vector<MethodFailure> failures_;
        };

        /**
         * Outcome of ConnectionManager::connect
         */
        struct ConnectResult
        {
            bool success = false;
            std::optional<TransportKind> method;
            std::optional<protocol::SystemResource> system_info;
            std::optional<ErrorCode> error_code;
            std::string error;
            std::vector<MethodFailure> attempts;

            nlohmann::json to_json() const;

            /**
             * @throws NoMethodAvailableError or RouterOsError when the connect failed
             */
            void throw_if_failed() const;
        };

        /**
         * Snapshot of the manager: live session, method, cached system info and the
         * last connect error
         */
        struct ConnectionStatus
        {
            bool connected = false;
            std::optional<TransportKind> method;
            std::optional<protocol::SystemResource> system_info;
            std::optional<ErrorCode> last_error_code;
            std::string last_error;

            nlohmann::json to_json() const;
        };

        /**
         * Picks an access method for a router and owns the single active Session.
         * Typed operations are routed to that session.
         */
        class ConnectionManager
        {
        public:
            ConnectionManager(std::shared_ptr<TransportFactory> factory,
                              SessionOptions options = SessionOptions{},
                              std::vector<TransportKind> priority = default_priority());
            ~ConnectionManager();

            ConnectionManager(const ConnectionManager &) = delete;
            ConnectionManager &operator=(const ConnectionManager &) = delete;

            /** Api, WebSocket, Rest */
            static std::vector<TransportKind> default_priority();

            void set_method_priority(std::vector<TransportKind> priority);
            std::vector<TransportKind> method_priority() const;

            /**
             * Attach a store; successful connects are saved to it
             */
            void set_config_store(std::shared_ptr<storage::ConfigStore> store);

            /**
             * Try each method in priority order until one authenticates and answers
             * the system resource check. AuthFailed stops the search.
             */
            ConnectResult connect(const ConnectionConfig &config);
            ConnectResult connect(const std::string &host, const std::string &username,
                                  const std::string &password, uint16_t port = 0, bool secure = false);
            std::future<ConnectResult> connect_async(const ConnectionConfig &config);

            /**
             * Connect again with the stored configuration, or the last one used
             */
            ConnectResult reconnect();

            void disconnect();

            bool is_connected() const;
            ConnectionStatus get_status() const;
            std::optional<TransportKind> current_method() const;
            std::string current_method_name() const;
            std::optional<ConnectionConfig> config() const;

            /**
             * @throws std::logic_error without a store or a configuration
             */
            void save_config();
            std::optional<ConnectionConfig> load_config();

            std::future<services::CommandResult> execute(const std::string &command,
                                                         const protocol::Attributes &args = {});
            std::future<protocol::SystemResource> system_resource();
            std::future<std::vector<protocol::NetworkInterface>> interfaces();
            std::future<std::vector<protocol::HotspotActive>> hotspot_active();
            std::future<std::vector<protocol::HotspotUser>> hotspot_users();
            std::future<std::string> add_hotspot_user(const std::string &name,
                                                      const std::string &password,
                                                      const std::string &profile = "default");
            std::future<void> remove_hotspot_user(const std::string &id);
            std::future<void> disconnect_active_user(const std::string &id);

            services::DispatcherStatisticsSnapshot get_statistics() const;

        private:
            ConnectResult try_methods(const ConnectionConfig &config);
            void record(const ConnectResult &result);
            std::shared_ptr<Session> active_session() const;
            std::shared_ptr<Session> detach_session();
            std::shared_ptr<storage::ConfigStore> store() const;

            std::shared_ptr<TransportFactory> factory_;
            SessionOptions options_;
            std::shared_ptr<Logger> logger_;

            // Serializes connect, reconnect and disconnect
            std::mutex connect_mutex_;

            mutable std::mutex mutex_;
            std::vector<TransportKind> priority_;
            std::shared_ptr<Session> session_;
            std::optional<TransportKind> current_method_;
            std::optional<ConnectionConfig> config_;
            std::optional<protocol::SystemResource> system_info_;
            std::optional<ErrorCode> last_error_code_;
            std::string last_error_;
            std::shared_ptr<storage::ConfigStore> store_;
        };

    } // namespace core
} // namespace rosgate

#endif // ROSGATE_CORE_CONNECTION_MANAGER_HPP
