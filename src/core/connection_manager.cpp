#include "core/connection_manager.hpp"
#include <sstream>
#include <stdexcept>

namespace rosgate
{
    namespace core
    {

        // MethodFailure implementation
        nlohmann::json MethodFailure::to_json() const
        {
            return nlohmann::json{
                {"method", transport_kind_id(method)},
                {"code", to_string(code)},
                {"remediation", remediation_step(code)},
                {"message", message}};
        }

        // NoMethodAvailableError implementation
        NoMethodAvailableError::NoMethodAvailableError(std::vector<MethodFailure> failures)
            : RouterOsError(ErrorCode::NoMethodAvailable, summarize(failures)), failures_(std::move(failures))
        {
        }

        std::string NoMethodAvailableError::summarize(const std::vector<MethodFailure> &failures)
        {
            std::ostringstream oss;
            oss << "No access method available";
            for (size_t i = 0; i < failures.size(); ++i)
            {
                oss << (i == 0 ? ": " : "; ")
                    << transport_kind_name(failures[i].method) << " " << to_string(failures[i].code)
                    << " (" << failures[i].message << ")";
            }
            return oss.str();
        }

        // ConnectResult implementation
        nlohmann::json ConnectResult::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            if (success)
            {
                j["method"] = transport_kind_id(*method);
                j["method_name"] = transport_kind_name(*method);
                if (system_info)
                {
                    j["system_info"] = system_info->to_json();
                }
            }
            else
            {
                j["error"] = error;
                j["code"] = error_code ? nlohmann::json(to_string(*error_code)) : nlohmann::json(nullptr);
                if (error_code)
                {
                    j["remediation"] = remediation_step(*error_code);
                }
            }

            nlohmann::json attempts_json = nlohmann::json::array();
            for (const auto &attempt : attempts)
            {
                attempts_json.push_back(attempt.to_json());
            }
            j["attempts"] = attempts_json;
            return j;
        }

        void ConnectResult::throw_if_failed() const
        {
            if (success)
            {
                return;
            }
            if (error_code == ErrorCode::NoMethodAvailable)
            {
                throw NoMethodAvailableError(attempts);
            }
            if (error_code)
            {
                throw RouterOsError(*error_code, error);
            }
            throw std::invalid_argument(error);
        }

        // ConnectionStatus implementation
        nlohmann::json ConnectionStatus::to_json() const
        {
            nlohmann::json j;
            j["connected"] = connected;
            j["method"] = method ? nlohmann::json(transport_kind_id(*method)) : nlohmann::json(nullptr);
            j["system_info"] = system_info ? system_info->to_json() : nlohmann::json(nullptr);
            j["last_error"] = last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(last_error);
            if (last_error_code)
            {
                j["last_error_code"] = to_string(*last_error_code);
                j["remediation"] = remediation_step(*last_error_code);
            }
            return j;
        }

        // ConnectionManager implementation
        ConnectionManager::ConnectionManager(std::shared_ptr<TransportFactory> factory,
                                             SessionOptions options,
                                             std::vector<TransportKind> priority)
            : factory_(std::move(factory)), options_(options), logger_(get_logger("ConnectionManager")),
              priority_(std::move(priority))
        {
            if (!factory_)
            {
                throw std::invalid_argument("ConnectionManager requires a transport factory");
            }
            if (priority_.empty())
            {
                priority_ = default_priority();
            }
        }

        ConnectionManager::~ConnectionManager()
        {
            auto session = detach_session();
            if (session)
            {
                session->disconnect();
            }
        }

        std::vector<TransportKind> ConnectionManager::default_priority()
        {
            return {TransportKind::Api, TransportKind::WebSocket, TransportKind::Rest};
        }

        void ConnectionManager::set_method_priority(std::vector<TransportKind> priority)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            priority_ = priority.empty() ? default_priority() : std::move(priority);
        }

        std::vector<TransportKind> ConnectionManager::method_priority() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return priority_;
        }

        void ConnectionManager::set_config_store(std::shared_ptr<storage::ConfigStore> store)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            store_ = std::move(store);
        }

        ConnectResult ConnectionManager::connect(const std::string &host, const std::string &username,
                                                 const std::string &password, uint16_t port, bool secure)
        {
            ConnectionConfig config;
            config.host = host;
            config.username = username;
            config.password = password;
            config.port = port;
            config.secure = secure;
            return connect(config);
        }

        ConnectResult ConnectionManager::connect(const ConnectionConfig &config)
        {
            std::lock_guard<std::mutex> connect_lock(connect_mutex_);
            ConnectResult result = try_methods(config);
            record(result);
            return result;
        }

        void ConnectionManager::record(const ConnectResult &result)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (result.success)
            {
                system_info_ = result.system_info;
                last_error_code_.reset();
                last_error_.clear();
            }
            else
            {
                system_info_.reset();
                last_error_code_ = result.error_code;
                last_error_ = result.error;
            }
        }

        ConnectResult ConnectionManager::try_methods(const ConnectionConfig &config)
        {
            ConnectResult result;

            std::string problem;
            if (!config.validate(&problem))
            {
                result.error = "Invalid connection configuration: " + problem;
                logger_->error("Refusing to connect", LogContext().add("error", problem));
                return result;
            }

            // Only one session at a time; the old one goes before any new attempt
            auto previous = detach_session();
            if (previous)
            {
                previous->disconnect();
            }

            const std::vector<TransportKind> priority = method_priority();
            logger_->info("Connecting to router",
                          LogContext().add("router", config.key()).add("methods", priority.size()));

            for (TransportKind kind : priority)
            {
                std::shared_ptr<Session> session;
                try
                {
                    session = std::make_shared<Session>(factory_->create(kind), options_);
                    session->connect(config);
                }
                catch (const RouterOsError &e)
                {
                    result.attempts.push_back(MethodFailure{kind, e.code(), e.what()});
                    if (e.code() == ErrorCode::AuthFailed)
                    {
                        // Every method shares the same credentials
                        result.error_code = ErrorCode::AuthFailed;
                        result.error = e.what();
                        logger_->error("Authentication failed",
                                       LogContext().add("method", transport_kind_name(kind)).add("error", e.what()));
                        return result;
                    }
                    logger_->warning("Method unavailable",
                                     LogContext()
                                         .add("method", transport_kind_name(kind))
                                         .add("code", to_string(e.code()))
                                         .add("error", e.what()));
                    continue;
                }
                catch (const std::exception &e)
                {
                    result.attempts.push_back(MethodFailure{kind, ErrorCode::ProtocolError, e.what()});
                    logger_->warning("Method unavailable",
                                     LogContext().add("method", transport_kind_name(kind)).add("error", e.what()));
                    continue;
                }

                protocol::SystemResource info;
                try
                {
                    info = session->system_resource().get();
                }
                catch (const RouterOsError &e)
                {
                    result.attempts.push_back(
                        MethodFailure{kind, e.code(), std::string("System resource check failed: ") + e.what()});
                    logger_->warning("System resource check failed",
                                     LogContext().add("method", transport_kind_name(kind)).add("error", e.what()));
                    session->disconnect();
                    continue;
                }

                std::shared_ptr<storage::ConfigStore> config_store;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    session_ = session;
                    current_method_ = kind;
                    config_ = config;
                    config_store = store_;
                }

                result.success = true;
                result.method = kind;
                result.system_info = info;

                logger_->info("Connected",
                              LogContext()
                                  .add("router", config.key())
                                  .add("method", transport_kind_name(kind))
                                  .add("identity", info.identity)
                                  .add("version", info.version));

                if (config_store)
                {
                    try
                    {
                        config_store->save(config);
                    }
                    catch (const std::exception &e)
                    {
                        logger_->error("Failed to save connection", LogContext().add("error", e.what()));
                    }
                }
                return result;
            }

            result.error_code = ErrorCode::NoMethodAvailable;
            result.error = NoMethodAvailableError(result.attempts).what();
            logger_->error("No access method available", LogContext().add("router", config.key()));
            return result;
        }

        std::future<ConnectResult> ConnectionManager::connect_async(const ConnectionConfig &config)
        {
            return std::async(std::launch::async, [this, config]()
                              { return connect(config); });
        }

        ConnectResult ConnectionManager::reconnect()
        {
            std::optional<ConnectionConfig> config;
            if (store())
            {
                config = load_config();
            }
            if (!config)
            {
                config = this->config();
            }

            if (!config)
            {
                ConnectResult result;
                result.error = "No saved connection";
                logger_->warning("Nothing to reconnect to");
                return result;
            }
            return connect(*config);
        }

        void ConnectionManager::disconnect()
        {
            std::lock_guard<std::mutex> connect_lock(connect_mutex_);
            auto session = detach_session();
            if (session)
            {
                session->disconnect();
                logger_->info("Disconnected from router");
            }
        }

        bool ConnectionManager::is_connected() const
        {
            auto session = active_session();
            return session && session->is_authenticated();
        }

        ConnectionStatus ConnectionManager::get_status() const
        {
            ConnectionStatus status;
            status.connected = is_connected();

            std::lock_guard<std::mutex> lock(mutex_);
            status.method = current_method_;
            status.system_info = system_info_;
            status.last_error_code = last_error_code_;
            status.last_error = last_error_;
            return status;
        }

        std::optional<TransportKind> ConnectionManager::current_method() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return current_method_;
        }

        std::string ConnectionManager::current_method_name() const
        {
            auto method = current_method();
            return method ? transport_kind_name(*method) : "none";
        }

        std::optional<ConnectionConfig> ConnectionManager::config() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return config_;
        }

        void ConnectionManager::save_config()
        {
            auto config_store = store();
            auto current = config();
            if (!config_store)
            {
                throw std::logic_error("No config store attached");
            }
            if (!current)
            {
                throw std::logic_error("No connection configuration to save");
            }
            config_store->save(*current);
        }

        std::optional<ConnectionConfig> ConnectionManager::load_config()
        {
            auto config_store = store();
            if (!config_store)
            {
                return std::nullopt;
            }

            auto loaded = config_store->load();
            if (loaded)
            {
                logger_->debug("Loaded saved connection", LogContext().add("router", loaded->key()));
            }
            return loaded;
        }

        std::future<services::CommandResult> ConnectionManager::execute(const std::string &command,
                                                                        const protocol::Attributes &args)
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<services::CommandResult>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->execute(command, args);
        }

        std::future<protocol::SystemResource> ConnectionManager::system_resource()
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<protocol::SystemResource>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->system_resource();
        }

        std::future<std::vector<protocol::NetworkInterface>> ConnectionManager::interfaces()
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<std::vector<protocol::NetworkInterface>>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->interfaces();
        }

        std::future<std::vector<protocol::HotspotActive>> ConnectionManager::hotspot_active()
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<std::vector<protocol::HotspotActive>>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->hotspot_active();
        }

        std::future<std::vector<protocol::HotspotUser>> ConnectionManager::hotspot_users()
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<std::vector<protocol::HotspotUser>>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->hotspot_users();
        }

        std::future<std::string> ConnectionManager::add_hotspot_user(const std::string &name,
                                                                     const std::string &password,
                                                                     const std::string &profile)
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<std::string>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->add_hotspot_user(name, password, profile);
        }

        std::future<void> ConnectionManager::remove_hotspot_user(const std::string &id)
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<void>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->remove_hotspot_user(id);
        }

        std::future<void> ConnectionManager::disconnect_active_user(const std::string &id)
        {
            auto session = active_session();
            if (!session)
            {
                return failed_future<void>(ErrorCode::NotAuthenticated, "Not connected");
            }
            return session->disconnect_active_user(id);
        }

        services::DispatcherStatisticsSnapshot ConnectionManager::get_statistics() const
        {
            auto session = active_session();
            return session ? session->get_statistics() : services::DispatcherStatisticsSnapshot{};
        }

        std::shared_ptr<Session> ConnectionManager::active_session() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return session_;
        }

        std::shared_ptr<Session> ConnectionManager::detach_session()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_method_.reset();
            system_info_.reset();
            return std::move(session_);
        }

        std::shared_ptr<storage::ConfigStore> ConnectionManager::store() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return store_;
        }

    } // namespace core
} // namespace rosgate
