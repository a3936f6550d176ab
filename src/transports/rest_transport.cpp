#include "transports/rest_transport.hpp"
#include "transports/tcp_socket.hpp"
#include "transports/transport_factory.hpp"
#include "protocol/rest_mapping.hpp"
#include "core/errors.hpp"

#include "oatpp/web/protocol/http/outgoing/BufferBody.hpp"

namespace rosgate
{
    namespace transports
    {

        RestTransport::RestTransport(std::chrono::milliseconds request_timeout)
            : BaseTransport("RestTransport"), request_timeout_(request_timeout)
        {
            ensure_network_environment();
        }

        RestTransport::~RestTransport()
        {
            close();
        }

        void RestTransport::open(const core::Endpoint &endpoint, std::chrono::milliseconds timeout)
        {
            TcpSocket::check_reachable(endpoint.host, endpoint.port, timeout);

            auto tcp = std::make_shared<InterruptibleConnectionProvider>(oatpp::network::Address(endpoint.host, endpoint.port));
            {
                std::lock_guard<std::mutex> lock(request_mutex_);
                provider_ = make_client_provider(endpoint, tcp);
                executor_ = oatpp::web::client::HttpRequestExecutor::createShared(provider_);
                login_timeout_ = timeout;

                bool default_port = endpoint.port == (endpoint.secure ? 443 : 80);
                host_header_ = default_port ? endpoint.host : endpoint.host + ":" + std::to_string(endpoint.port);

                std::lock_guard<std::mutex> guard(provider_mutex_);
                tcp_ = tcp;
            }

            mark_open(endpoint);
        }

        void RestTransport::send(const protocol::Command &command)
        {
            require_open();

            std::vector<protocol::Reply> replies;
            {
                std::lock_guard<std::mutex> lock(request_mutex_);
                replies = perform(command);
            }

            // Delivered outside the lock so completions may issue further commands
            for (const auto &reply : replies)
            {
                deliver(reply);
            }
        }

        std::vector<protocol::Reply> RestTransport::perform(const protocol::Command &command)
        {
            if (!executor_)
            {
                throw core::RouterOsError(core::ErrorCode::Closed, "Transport is closed");
            }

            if (command.name == "/login")
            {
                auto name = command.args.find("name");
                auto password = command.args.find("password");
                authorization_ = protocol::rest::basic_authorization(
                    name != command.args.end() ? name->second : std::string(),
                    password != command.args.end() ? password->second : std::string());
            }

            protocol::rest::RestRequest request;
            try
            {
                request = protocol::rest::map_command(command);
            }
            catch (const std::invalid_argument &e)
            {
                protocol::Reply trap;
                trap.tag = command.tag;
                trap.kind = protocol::ReplyKind::Trap;
                trap.message = e.what();
                return {trap};
            }

            oatpp::web::client::RequestExecutor::Headers headers;
            headers.put("Host", oatpp::String(host_header_));
            headers.put("Content-Type", "application/json");
            headers.put("Accept", "application/json");
            if (!authorization_.empty())
            {
                headers.put("Authorization", oatpp::String(authorization_));
            }

            std::shared_ptr<oatpp::web::protocol::http::outgoing::Body> body;
            if (request.body)
            {
                body = oatpp::web::protocol::http::outgoing::BufferBody::createShared(
                    oatpp::String(request.body->dump()), "application/json");
            }

            logger_->debug("HTTP request",
                           core::LogContext().add("method", request.method).add("path", request.path).add("tag", command.tag));

            // The login round trip is bounded like the connect; the rest by the request timeout
            ConnectionDeadline deadline(tcp_, command.name == "/login" ? login_timeout_ : request_timeout_);

            int status = 0;
            std::string response_body;
            try
            {
                auto response = executor_->execute(request.method, request.path, headers, body, nullptr);
                status = response->getStatusCode();
                oatpp::String text = response->readBodyToString();
                if (text)
                {
                    response_body.assign(text->data(), text->size());
                }
            }
            catch (const std::exception &e)
            {
                if (deadline.expired())
                {
                    throw core::RouterOsError(core::ErrorCode::CommandTimeout,
                                              "No HTTP response to " + request.method + " " + request.path + " in time");
                }
                throw core::RouterOsError(core::ErrorCode::ConnectRefused,
                                          "HTTP request " + request.method + " " + request.path + " failed: " + e.what());
            }

            logger_->debug("HTTP response",
                           core::LogContext().add("status", status).add("bytes", response_body.size()));

            return protocol::rest::replies_from_response(command.tag, request.method, status, response_body);
        }

        void RestTransport::close()
        {
            bool was_open = mark_closed();

            // Release a request still waiting on the router before taking the lock
            std::shared_ptr<InterruptibleConnectionProvider> tcp;
            {
                std::lock_guard<std::mutex> guard(provider_mutex_);
                tcp = tcp_;
            }
            if (tcp)
            {
                tcp->interrupt();
            }

            std::lock_guard<std::mutex> lock(request_mutex_);
            executor_.reset();
            if (provider_)
            {
                provider_->stop();
                provider_.reset();
            }
            {
                std::lock_guard<std::mutex> guard(provider_mutex_);
                tcp_.reset();
            }
            authorization_.clear();

            if (was_open)
            {
                logger_->info("Transport closed", core::LogContext().add("endpoint", endpoint().to_string()));
            }
        }

    } // namespace transports
} // namespace rosgate
