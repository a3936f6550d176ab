#include "core/session.hpp"
#include "core/errors.hpp"
#include "protocol/login.hpp"

namespace rosgate
{
    namespace core
    {

        namespace
        {
            std::string first_value(const services::CommandResult &result, const std::string &key)
            {
                if (result.data.empty())
                {
                    return "";
                }
                auto it = result.data.front().find(key);
                return it != result.data.front().end() ? it->second : std::string();
            }
        } // namespace

        const char *to_string(SessionState state)
        {
            switch (state)
            {
            case SessionState::Unauthenticated:
                return "unauthenticated";
            case SessionState::Authenticating:
                return "authenticating";
            case SessionState::Authenticated:
                return "authenticated";
            case SessionState::Failed:
                return "failed";
            }
            return "unknown";
        }

        Session::Session(std::unique_ptr<TransportInterface> transport, SessionOptions options)
            : transport_(std::move(transport)), options_(options), logger_(get_logger("Session"))
        {
            if (!transport_)
            {
                throw std::invalid_argument("Session requires a transport");
            }
        }

        Session::~Session()
        {
            disconnect();
        }

        void Session::connect(const ConnectionConfig &config)
        {
            if (dispatcher_)
            {
                // Reconnecting: retire the previous conversation first
                transport_->close();
                dispatcher_->fail_all("Session reconnecting");
            }

            state_ = SessionState::Authenticating;
            const Endpoint endpoint = config.endpoint_for(transport_->get_type());

            logger_->info("Connecting",
                          LogContext()
                              .add("method", transport_kind_name(transport_->get_type()))
                              .add("endpoint", endpoint.to_string())
                              .add("user", config.username)
                              .secret("password", config.password));

            dispatcher_ = std::make_unique<services::CommandDispatcher>(*transport_);
            services::CommandDispatcher *dispatcher = dispatcher_.get();
            transport_->set_message_handler([dispatcher](const protocol::Reply &reply)
                                            { dispatcher->on_reply(reply); });
            transport_->set_close_handler([this, dispatcher](const std::string &reason)
                                          { handle_transport_closed(dispatcher, reason); });

            try
            {
                transport_->open(endpoint, options_.connect_timeout);
                login(config);
            }
            catch (const RouterOsError &e)
            {
                state_ = SessionState::Failed;
                transport_->close();
                dispatcher_->fail_all(std::string("Connect failed: ") + e.what());

                logger_->warning("Connect failed",
                                 LogContext()
                                     .add("method", transport_kind_name(transport_->get_type()))
                                     .add("code", to_string(e.code()))
                                     .add("error", e.what()));
                throw;
            }

            state_ = SessionState::Authenticated;
            logger_->info("Authenticated",
                          LogContext().add("method", transport_kind_name(transport_->get_type())).add("endpoint", endpoint.to_string()));
        }

        void Session::disconnect()
        {
            SessionState previous = state_.exchange(SessionState::Unauthenticated);

            transport_->close();
            if (dispatcher_)
            {
                dispatcher_->fail_all("Session disconnected");
            }

            if (previous == SessionState::Authenticated)
            {
                logger_->info("Disconnected", LogContext().add("method", transport_kind_name(transport_->get_type())));
            }
        }

        std::future<services::CommandResult> Session::execute(const std::string &command,
                                                              const protocol::Attributes &args)
        {
            if (!is_authenticated())
            {
                return failed_future<services::CommandResult>(ErrorCode::NotAuthenticated,
                                                              "Session is not authenticated");
            }
            return dispatcher_->submit(command, args, options_.command_timeout);
        }

        std::future<protocol::SystemResource> Session::system_resource()
        {
            if (!is_authenticated())
            {
                return failed_future<protocol::SystemResource>(ErrorCode::NotAuthenticated,
                                                               "Session is not authenticated");
            }

            auto promise = std::make_shared<std::promise<protocol::SystemResource>>();
            auto future = promise->get_future();
            services::CommandDispatcher *dispatcher = dispatcher_.get();
            auto timeout = options_.command_timeout;

            dispatcher->submit("/system/resource/print", {}, timeout,
                               [promise, dispatcher, timeout](services::CommandResult result, std::exception_ptr error)
                               {
                                   if (error)
                                   {
                                       promise->set_exception(error);
                                       return;
                                   }
                                   if (result.data.empty())
                                   {
                                       promise->set_exception(std::make_exception_ptr(
                                           RouterOsError(ErrorCode::ProtocolError, "Empty /system/resource reply")));
                                       return;
                                   }

                                   auto resource = protocol::SystemResource::from_attributes(result.data.front());

                                   // Identity is optional; the board name stands in when it cannot be read
                                   dispatcher->submit("/system/identity/print", {}, timeout,
                                                      [promise, resource](services::CommandResult identity, std::exception_ptr identity_error) mutable
                                                      {
                                                          if (!identity_error)
                                                          {
                                                              std::string name = first_value(identity, "name");
                                                              if (!name.empty())
                                                              {
                                                                  resource.identity = name;
                                                              }
                                                          }
                                                          promise->set_value(resource);
                                                      });
                               });

            return future;
        }

        std::future<std::vector<protocol::NetworkInterface>> Session::interfaces()
        {
            return run<std::vector<protocol::NetworkInterface>>(
                "/interface/print", {}, [](services::CommandResult &result)
                { return protocol::records_from<protocol::NetworkInterface>(result.data); });
        }

        std::future<std::vector<protocol::HotspotActive>> Session::hotspot_active()
        {
            return run<std::vector<protocol::HotspotActive>>(
                "/ip/hotspot/active/print", {}, [](services::CommandResult &result)
                { return protocol::records_from<protocol::HotspotActive>(result.data); });
        }

        std::future<std::vector<protocol::HotspotUser>> Session::hotspot_users()
        {
            return run<std::vector<protocol::HotspotUser>>(
                "/ip/hotspot/user/print", {}, [](services::CommandResult &result)
                { return protocol::records_from<protocol::HotspotUser>(result.data); });
        }

        std::future<std::string> Session::add_hotspot_user(const std::string &name,
                                                           const std::string &password,
                                                           const std::string &profile)
        {
            protocol::Attributes args{
                {"name", name},
                {"password", password},
                {"profile", profile.empty() ? "default" : profile}};

            return run<std::string>("/ip/hotspot/user/add", args, [](services::CommandResult &result)
                                    {
                                        auto ret = result.done.find("ret");
                                        return ret != result.done.end() ? ret->second : std::string(); });
        }

        std::future<void> Session::remove_hotspot_user(const std::string &id)
        {
            return run_void("/ip/hotspot/user/remove", {{"numbers", id}});
        }

        std::future<void> Session::disconnect_active_user(const std::string &id)
        {
            return run_void("/ip/hotspot/active/remove", {{"numbers", id}});
        }

        services::DispatcherStatisticsSnapshot Session::get_statistics() const
        {
            return dispatcher_ ? dispatcher_->get_statistics() : services::DispatcherStatisticsSnapshot{};
        }

        void Session::login(const ConnectionConfig &config)
        {
            auto first = dispatcher_->submit("/login",
                                             {{"name", config.username}, {"password", config.password}},
                                             options_.login_timeout);
            services::CommandResult result = await_login(first, false);

            auto challenge = result.done.find("ret");
            if (transport_->is_stateless() || challenge == result.done.end() || challenge->second.empty())
            {
                return;
            }

            // Pre-6.43 routers answer with a challenge instead of logging in
            std::string response;
            try
            {
                response = protocol::legacy_login_response(config.password, challenge->second);
            }
            catch (const std::invalid_argument &e)
            {
                throw RouterOsError(ErrorCode::ProtocolError, std::string("Malformed login challenge: ") + e.what());
            }

            logger_->debug("Answering legacy login challenge");
            auto second = dispatcher_->submit("/login",
                                              {{"name", config.username}, {"response", response}},
                                              options_.login_timeout);
            await_login(second, true);
        }

        services::CommandResult Session::await_login(std::future<services::CommandResult> &future, bool after_reply)
        {
            try
            {
                return future.get();
            }
            catch (const CommandError &e)
            {
                // Stateless logins fail for reasons other than credentials (missing API, server errors)
                if (transport_->is_stateless() && e.category() != protocol::TRAP_CATEGORY_AUTHENTICATION)
                {
                    throw RouterOsError(ErrorCode::ProtocolError, std::string("Login request failed: ") + e.what());
                }
                throw RouterOsError(ErrorCode::AuthFailed, e.what());
            }
            catch (const RouterOsError &e)
            {
                switch (e.code())
                {
                case ErrorCode::CommandFailed:
                    throw RouterOsError(ErrorCode::AuthFailed, e.what());
                case ErrorCode::CommandTimeout:
                    if (after_reply)
                    {
                        throw RouterOsError(ErrorCode::ProtocolError, "No reply to login challenge response within " +
                                                                          std::to_string(options_.login_timeout.count()) + " ms");
                    }
                    throw RouterOsError(ErrorCode::ConnectTimeout, "No reply to login within " +
                                                                       std::to_string(options_.login_timeout.count()) + " ms");
                case ErrorCode::SessionClosed:
                case ErrorCode::Closed:
                    throw RouterOsError(ErrorCode::ProtocolError, std::string("Connection lost during login: ") + e.what());
                default:
                    throw;
                }
            }
        }

        void Session::handle_transport_closed(services::CommandDispatcher *dispatcher, const std::string &reason)
        {
            SessionState expected = SessionState::Authenticated;
            if (state_.compare_exchange_strong(expected, SessionState::Unauthenticated))
            {
                logger_->warning("Session lost", LogContext().add("reason", reason));
            }
            dispatcher->fail_all("Connection lost: " + reason);
        }

        template <typename T>
        std::future<T> Session::run(const std::string &command, const protocol::Attributes &args,
                                    std::function<T(services::CommandResult &)> convert)
        {
            if (!is_authenticated())
            {
                return failed_future<T>(ErrorCode::NotAuthenticated, "Session is not authenticated");
            }

            auto promise = std::make_shared<std::promise<T>>();
            auto future = promise->get_future();

            dispatcher_->submit(command, args, options_.command_timeout,
                                [promise, convert](services::CommandResult result, std::exception_ptr error)
                                {
                                    if (error)
                                    {
                                        promise->set_exception(error);
                                        return;
                                    }
                                    try
                                    {
                                        promise->set_value(convert(result));
                                    }
                                    catch (const std::exception &)
                                    {
                                        promise->set_exception(std::current_exception());
                                    }
                                });

            return future;
        }

        std::future<void> Session::run_void(const std::string &command, const protocol::Attributes &args)
        {
            if (!is_authenticated())
            {
                return failed_future<void>(ErrorCode::NotAuthenticated, "Session is not authenticated");
            }

            auto promise = std::make_shared<std::promise<void>>();
            auto future = promise->get_future();

            dispatcher_->submit(command, args, options_.command_timeout,
                                [promise](services::CommandResult, std::exception_ptr error)
                                {
                                    if (error)
                                    {
                                        promise->set_exception(error);
                                    }
                                    else
                                    {
                                        promise->set_value();
                                    }
                                });

            return future;
        }

    } // namespace core
} // namespace rosgate
