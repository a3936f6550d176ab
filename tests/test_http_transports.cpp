#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "core/session.hpp"
#include "transports/rest_transport.hpp"
#include "transports/websocket_transport.hpp"

using namespace rosgate;

namespace
{
    struct HttpRequest
    {
        std::string method;
        std::string path;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    struct HttpResponse
    {
        int status = 200;
        std::string body;
    };

    /**
     * HTTP/1.1 server on 127.0.0.1 answering one request per connection.
     * A handler returning nothing leaves the client waiting.
     */
    class FakeHttpServer
    {
    public:
        using Handler = std::function<std::optional<HttpResponse>(const HttpRequest &)>;

        explicit FakeHttpServer(Handler handler) : handler_(std::move(handler))
        {
            listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            REQUIRE(listen_fd_ >= 0);
            int reuse = 1;
            ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

            sockaddr_in address{};
            address.sin_family = AF_INET;
            address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            address.sin_port = 0;
            REQUIRE(::bind(listen_fd_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) == 0);
            REQUIRE(::listen(listen_fd_, 8) == 0);

            socklen_t length = sizeof(address);
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&address), &length);
            port_ = ntohs(address.sin_port);

            thread_ = std::thread(&FakeHttpServer::serve, this);
        }

        ~FakeHttpServer()
        {
            ::shutdown(listen_fd_, SHUT_RDWR);
            if (thread_.joinable())
            {
                thread_.join();
            }
            ::close(listen_fd_);

            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : held_)
            {
                ::shutdown(fd, SHUT_RDWR);
                ::close(fd);
            }
        }

        uint16_t port() const { return port_; }

        std::vector<HttpRequest> requests()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

    private:
        void serve()
        {
            while (true)
            {
                int fd = ::accept(listen_fd_, nullptr, nullptr);
                if (fd < 0)
                {
                    return;
                }

                std::optional<HttpRequest> request = read_request(fd);
                if (!request)
                {
                    // Reachability checks connect and hang up
                    ::close(fd);
                    continue;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(*request);
                }

                auto response = handler_(*request);
                if (!response)
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    held_.push_back(fd);
                    continue;
                }

                std::string text = "HTTP/1.1 " + std::to_string(response->status) + " Status\r\n"
                                   "Content-Type: application/json\r\n"
                                   "Content-Length: " + std::to_string(response->body.size()) + "\r\n"
                                   "Connection: close\r\n\r\n" + response->body;
                ::send(fd, text.data(), text.size(), MSG_NOSIGNAL);
                ::shutdown(fd, SHUT_WR);
                ::close(fd);
            }
        }

        static std::optional<HttpRequest> read_request(int fd)
        {
            std::string data;
            char buffer[1024];
            size_t header_end = std::string::npos;
            while (header_end == std::string::npos)
            {
                ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
                if (n <= 0)
                {
                    return std::nullopt;
                }
                data.append(buffer, static_cast<size_t>(n));
                header_end = data.find("\r\n\r\n");
            }

            HttpRequest request;
            std::string head = data.substr(0, header_end);
            size_t line_end = head.find("\r\n");
            std::string request_line = head.substr(0, line_end);
            size_t first_space = request_line.find(' ');
            size_t second_space = request_line.find(' ', first_space + 1);
            request.method = request_line.substr(0, first_space);
            request.path = request_line.substr(first_space + 1, second_space - first_space - 1);

            size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
            while (pos < head.size())
            {
                size_t next = head.find("\r\n", pos);
                if (next == std::string::npos)
                {
                    next = head.size();
                }
                std::string line = head.substr(pos, next - pos);
                size_t colon = line.find(':');
                if (colon != std::string::npos)
                {
                    std::string key = line.substr(0, colon);
                    std::transform(key.begin(), key.end(), key.begin(),
                                   [](unsigned char c)
                                   { return static_cast<char>(std::tolower(c)); });
                    std::string value = line.substr(colon + 1);
                    value.erase(0, value.find_first_not_of(' '));
                    request.headers[key] = value;
                }
                pos = next + 2;
            }

            request.body = data.substr(header_end + 4);
            auto length = request.headers.find("content-length");
            size_t expected = length != request.headers.end() ? std::stoul(length->second) : 0;
            while (request.body.size() < expected)
            {
                ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
                if (n <= 0)
                {
                    break;
                }
                request.body.append(buffer, static_cast<size_t>(n));
            }
            return request;
        }

        Handler handler_;
        int listen_fd_ = -1;
        uint16_t port_ = 0;
        std::mutex mutex_;
        std::vector<HttpRequest> requests_;
        std::vector<int> held_;
        std::thread thread_;
    };

    // admin:secret
    const std::string ADMIN_AUTHORIZATION = "Basic YWRtaW46c2VjcmV0";

    std::optional<HttpResponse> rest_router(const HttpRequest &request)
    {
        auto authorization = request.headers.find("authorization");
        if (authorization == request.headers.end() || authorization->second != ADMIN_AUTHORIZATION)
        {
            return HttpResponse{401, R"({"error":401,"message":"Unauthorized"})"};
        }
        if (request.method == "GET" && request.path == "/rest/system/resource")
        {
            return HttpResponse{200, R"({"version":"7.14.3 (stable)","board-name":"CCR2004","uptime":"3d4h"})"};
        }
        if (request.method == "GET" && request.path == "/rest/interface")
        {
            return HttpResponse{200, R"([{".id":"*1","name":"ether1","rx-byte":"6000000000"},)"
                                     R"({".id":"*2","name":"bridge","running":"true"}])"};
        }
        if (request.method == "PUT" && request.path == "/rest/ip/hotspot/user")
        {
            return HttpResponse{201, R"({".id":"*7","name":"guest7"})"};
        }
        if (request.path == "/rest/system/silent")
        {
            return std::nullopt;
        }
        return HttpResponse{404, R"({"error":404,"message":"Not Found"})"};
    }

    core::ConnectionConfig loopback_config(uint16_t port, const std::string &password = "secret")
    {
        core::ConnectionConfig config;
        config.host = "127.0.0.1";
        config.port = port;
        config.username = "admin";
        config.password = password;
        return config;
    }

    core::Endpoint loopback(uint16_t port)
    {
        core::Endpoint endpoint;
        endpoint.host = "127.0.0.1";
        endpoint.port = port;
        return endpoint;
    }

    core::SessionOptions quick_options()
    {
        core::SessionOptions options;
        options.connect_timeout = std::chrono::milliseconds(2000);
        options.login_timeout = std::chrono::milliseconds(2000);
        options.command_timeout = std::chrono::milliseconds(2000);
        return options;
    }

    std::optional<core::ErrorCode> send_error(transports::RestTransport &transport, const std::string &name)
    {
        protocol::Command command;
        command.tag = 1;
        command.name = name;
        try
        {
            transport.send(command);
        }
        catch (const core::RouterOsError &e)
        {
            return e.code();
        }
        return std::nullopt;
    }
} // namespace

TEST_CASE("Session runs end to end over the REST transport", "[transport][rest][session]")
{
    FakeHttpServer server(rest_router);

    core::Session session(std::make_unique<transports::RestTransport>(), quick_options());
    session.connect(loopback_config(server.port()));
    REQUIRE(session.is_authenticated());

    auto interfaces = session.interfaces().get();
    REQUIRE(interfaces.size() == 2);
    CHECK(interfaces[0].rx_bytes == 6000000000ull);
    CHECK(session.system_resource().get().board_name == "CCR2004");
    CHECK(session.add_hotspot_user("guest7", "pw").get() == "*7");

    try
    {
        session.execute("/system/missing/print").get();
        FAIL("expected CommandFailed");
    }
    catch (const core::RouterOsError &e)
    {
        CHECK(e.code() == core::ErrorCode::CommandFailed);
    }

    auto requests = server.requests();
    REQUIRE_FALSE(requests.empty());
    CHECK(requests[0].path == "/rest/system/resource");
    for (const auto &request : requests)
    {
        CHECK(request.headers.at("authorization") == ADMIN_AUTHORIZATION);
    }
    auto put = std::find_if(requests.begin(), requests.end(), [](const HttpRequest &r)
                            { return r.method == "PUT"; });
    REQUIRE(put != requests.end());
    CHECK(nlohmann::json::parse(put->body)["name"] == "guest7");
}

TEST_CASE("Wrong REST credentials are AuthFailed", "[transport][rest][session]")
{
    FakeHttpServer server(rest_router);

    core::Session session(std::make_unique<transports::RestTransport>(), quick_options());
    try
    {
        session.connect(loopback_config(server.port(), "wrong"));
        FAIL("expected AuthFailed");
    }
    catch (const core::RouterOsError &e)
    {
        CHECK(e.code() == core::ErrorCode::AuthFailed);
    }
    CHECK_FALSE(session.is_authenticated());
}

TEST_CASE("A web server without the REST API is not a credential failure", "[transport][rest][session]")
{
    FakeHttpServer server([](const HttpRequest &)
                          { return HttpResponse{404, "<html>Not Found</html>"}; });

    core::Session session(std::make_unique<transports::RestTransport>(), quick_options());
    try
    {
        session.connect(loopback_config(server.port()));
        FAIL("expected ProtocolError");
    }
    catch (const core::RouterOsError &e)
    {
        CHECK(e.code() == core::ErrorCode::ProtocolError);
    }
}

TEST_CASE("A REST request with no response times out", "[transport][rest]")
{
    FakeHttpServer server(rest_router);
    transports::RestTransport transport(std::chrono::milliseconds(300));
    transport.open(loopback(server.port()), std::chrono::milliseconds(2000));

    protocol::Command login;
    login.tag = 1;
    login.name = "/login";
    login.args = {{"name", "admin"}, {"password", "secret"}};
    transport.send(login);

    const auto started = std::chrono::steady_clock::now();
    CHECK(send_error(transport, "/system/silent") == core::ErrorCode::CommandTimeout);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

    // The transport stays usable for the next request
    protocol::Command print;
    print.tag = 3;
    print.name = "/interface/print";
    std::vector<protocol::Reply> replies;
    transport.set_message_handler([&replies](const protocol::Reply &reply)
                                  { replies.push_back(reply); });
    transport.send(print);
    REQUIRE(replies.size() == 3);
    CHECK(replies.back().kind == protocol::ReplyKind::Done);
}

TEST_CASE("Closing releases a REST request still waiting on the router", "[transport][rest]")
{
    FakeHttpServer server(rest_router);
    transports::RestTransport transport(std::chrono::milliseconds(20000));
    transport.open(loopback(server.port()), std::chrono::milliseconds(2000));

    auto pending = std::async(std::launch::async, [&transport]()
                              { return send_error(transport, "/system/silent"); });

    for (int i = 0; i < 100 && server.requests().empty(); ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(server.requests().size() == 1);

    const auto started = std::chrono::steady_clock::now();
    transport.close();
    REQUIRE(pending.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto code = pending.get();
    REQUIRE(code);
    CHECK(*code != core::ErrorCode::CommandTimeout);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    CHECK_FALSE(transport.is_open());
}

TEST_CASE("A WebSocket upgrade that is never answered is ConnectTimeout", "[transport][websocket]")
{
    FakeHttpServer server([](const HttpRequest &) -> std::optional<HttpResponse>
                          { return std::nullopt; });
    transports::WebSocketTransport transport;

    const auto started = std::chrono::steady_clock::now();
    try
    {
        transport.open(loopback(server.port()), std::chrono::milliseconds(300));
        FAIL("expected ConnectTimeout");
    }
    catch (const core::RouterOsError &e)
    {
        CHECK(e.code() == core::ErrorCode::ConnectTimeout);
    }
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    CHECK_FALSE(transport.is_open());

    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].headers.at("upgrade") == "websocket");
}

TEST_CASE("A refused WebSocket upgrade is a protocol error", "[transport][websocket]")
{
    FakeHttpServer server([](const HttpRequest &)
                          { return HttpResponse{404, R"({"error":404})"}; });
    transports::WebSocketTransport transport;

    try
    {
        transport.open(loopback(server.port()), std::chrono::milliseconds(2000));
        FAIL("expected ProtocolError");
    }
    catch (const core::RouterOsError &e)
    {
        CHECK(e.code() == core::ErrorCode::ProtocolError);
    }
    CHECK_FALSE(transport.is_open());
}
