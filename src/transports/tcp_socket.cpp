#include "transports/tcp_socket.hpp"
#include "core/errors.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>

namespace rosgate
{
    namespace transports
    {

        namespace
        {
            constexpr int WRITE_TIMEOUT_MS = 10000;

            using Clock = std::chrono::steady_clock;

            int remaining_ms(Clock::time_point deadline)
            {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
                return left > 0 ? static_cast<int>(left) : 0;
            }

            // >0 ready, 0 timeout, <0 error
            int poll_fd(int fd, short events, int timeout_ms)
            {
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = events;
                int rc;
                do
                {
                    rc = ::poll(&pfd, 1, timeout_ms);
                } while (rc < 0 && errno == EINTR);
                return rc;
            }

            std::string ssl_error_text()
            {
                unsigned long code = ERR_get_error();
                if (code == 0)
                {
                    return "unknown TLS error";
                }
                char buffer[256];
                ERR_error_string_n(code, buffer, sizeof(buffer));
                return buffer;
            }

            bool is_numeric_host(const std::string &host)
            {
                in6_addr address{};
                return inet_pton(AF_INET, host.c_str(), &address) == 1 ||
                       inet_pton(AF_INET6, host.c_str(), &address) == 1;
            }
        } // namespace

        TcpSocket::~TcpSocket()
        {
            close();
        }

        void TcpSocket::connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout)
        {
            close();

            const std::string target = host + ":" + std::to_string(port);
            const auto deadline = Clock::now() + timeout;

            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo *result = nullptr;
            int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
            if (rc != 0)
            {
                throw core::RouterOsError(core::ErrorCode::ConnectRefused,
                                          "Cannot resolve " + host + ": " + gai_strerror(rc));
            }

            bool timed_out = false;
            std::string last_error = "no usable address";

            for (addrinfo *ai = result; ai != nullptr && fd_ < 0; ai = ai->ai_next)
            {
                int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
                if (fd < 0)
                {
                    last_error = strerror(errno);
                    continue;
                }

                int flags = fcntl(fd, F_GETFL, 0);
                fcntl(fd, F_SETFL, flags | O_NONBLOCK);

                if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
                {
                    fd_ = fd;
                    break;
                }
                if (errno != EINPROGRESS)
                {
                    last_error = strerror(errno);
                    ::close(fd);
                    continue;
                }

                int ready = poll_fd(fd, POLLOUT, remaining_ms(deadline));
                if (ready == 0)
                {
                    timed_out = true;
                    ::close(fd);
                    break;
                }
                if (ready < 0)
                {
                    last_error = strerror(errno);
                    ::close(fd);
                    continue;
                }

                int error = 0;
                socklen_t length = sizeof(error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) < 0)
                {
                    error = errno;
                }
                if (error != 0)
                {
                    last_error = strerror(error);
                    ::close(fd);
                    continue;
                }

                fd_ = fd;
            }

            freeaddrinfo(result);

            if (fd_ >= 0)
            {
                int one = 1;
                setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
                return;
            }

            if (timed_out)
            {
                throw core::RouterOsError(core::ErrorCode::ConnectTimeout,
                                          "Connection to " + target + " timed out after " +
                                              std::to_string(timeout.count()) + " ms");
            }
            throw core::RouterOsError(core::ErrorCode::ConnectRefused,
                                      "Connection to " + target + " failed: " + last_error);
        }

        void TcpSocket::start_tls(const std::string &server_name, std::chrono::milliseconds timeout)
        {
            if (fd_ < 0)
            {
                throw core::RouterOsError(core::ErrorCode::NotOpen, "TLS requested on an unconnected socket");
            }

            const auto deadline = Clock::now() + timeout;

            ssl_ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ssl_ctx_)
            {
                throw core::RouterOsError(core::ErrorCode::ProtocolError, "SSL_CTX_new failed: " + ssl_error_text());
            }
            SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
            SSL_CTX_set_mode(ssl_ctx_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
            if (SSL_CTX_set_cipher_list(ssl_ctx_, "ALL:ADH:@SECLEVEL=0") != 1)
            {
                throw core::RouterOsError(core::ErrorCode::ProtocolError, "Cipher setup failed: " + ssl_error_text());
            }

            ssl_ = SSL_new(ssl_ctx_);
            if (!ssl_ || SSL_set_fd(ssl_, fd_) != 1)
            {
                throw core::RouterOsError(core::ErrorCode::ProtocolError, "SSL_new failed: " + ssl_error_text());
            }
            if (!server_name.empty() && !is_numeric_host(server_name))
            {
                SSL_set_tlsext_host_name(ssl_, server_name.c_str());
            }

            while (true)
            {
                int rc = SSL_connect(ssl_);
                if (rc == 1)
                {
                    return;
                }

                int error = SSL_get_error(ssl_, rc);
                short events = 0;
                if (error == SSL_ERROR_WANT_READ)
                {
                    events = POLLIN;
                }
                else if (error == SSL_ERROR_WANT_WRITE)
                {
                    events = POLLOUT;
                }
                else
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                              "TLS handshake failed: " + ssl_error_text());
                }

                int ready = poll_fd(fd_, events, remaining_ms(deadline));
                if (ready == 0)
                {
                    throw core::RouterOsError(core::ErrorCode::ConnectTimeout, "TLS handshake timed out");
                }
                if (ready < 0)
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                              std::string("TLS handshake failed: ") + strerror(errno));
                }
            }
        }

        void TcpSocket::write_all(const uint8_t *data, size_t length)
        {
            size_t sent = 0;
            while (sent < length)
            {
                ssize_t written = 0;
                bool wait_for_read = false;
                int fd = -1;

                {
                    // fd_ and ssl_ are only used under io_mutex_; close() may run on another thread
                    std::lock_guard<std::mutex> lock(io_mutex_);
                    if (fd_ < 0)
                    {
                        throw core::RouterOsError(core::ErrorCode::Closed, "Socket is closed");
                    }
                    fd = fd_;

                    if (ssl_)
                    {
                        int rc = SSL_write(ssl_, data + sent, static_cast<int>(length - sent));
                        if (rc > 0)
                        {
                            written = rc;
                        }
                        else
                        {
                            int error = SSL_get_error(ssl_, rc);
                            if (error == SSL_ERROR_WANT_READ)
                            {
                                wait_for_read = true;
                            }
                            else if (error != SSL_ERROR_WANT_WRITE)
                            {
                                written = -1;
                            }
                        }
                    }
                    else
                    {
                        written = ::send(fd_, data + sent, length - sent, MSG_NOSIGNAL);
                        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
                        {
                            written = 0;
                        }
                    }
                }

                if (written < 0)
                {
                    throw core::RouterOsError(core::ErrorCode::Closed,
                                              std::string("Connection lost while writing: ") + strerror(errno));
                }
                if (written == 0)
                {
                    if (!wait_fd(fd, !wait_for_read, WRITE_TIMEOUT_MS))
                    {
                        throw core::RouterOsError(core::ErrorCode::Closed, "Write stalled; peer not reading");
                    }
                    continue;
                }
                sent += static_cast<size_t>(written);
            }
        }

        ssize_t TcpSocket::read_some(uint8_t *buffer, size_t capacity, int timeout_ms)
        {
            int fd = -1;
            bool pending = false;
            {
                std::lock_guard<std::mutex> lock(io_mutex_);
                if (fd_ < 0)
                {
                    return -1;
                }
                fd = fd_;
                pending = ssl_ && SSL_pending(ssl_) > 0;
            }

            if (!pending && !wait_fd(fd, false, timeout_ms))
            {
                return 0;
            }

            std::lock_guard<std::mutex> lock(io_mutex_);
            if (fd_ < 0)
            {
                return -1;
            }

            if (ssl_)
            {
                int rc = SSL_read(ssl_, buffer, static_cast<int>(capacity));
                if (rc > 0)
                {
                    return rc;
                }
                int error = SSL_get_error(ssl_, rc);
                if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE)
                {
                    return 0;
                }
                return -1;
            }

            ssize_t received = ::recv(fd_, buffer, capacity, 0);
            if (received > 0)
            {
                return received;
            }
            if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
            {
                return 0;
            }
            return -1;
        }

        void TcpSocket::shutdown()
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (fd_ >= 0)
            {
                ::shutdown(fd_, SHUT_RDWR);
            }
        }

        void TcpSocket::close()
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (ssl_)
            {
                // Best effort close_notify; the peer may already be gone
                SSL_shutdown(ssl_);
                SSL_free(ssl_);
                ssl_ = nullptr;
            }
            if (ssl_ctx_)
            {
                SSL_CTX_free(ssl_ctx_);
                ssl_ctx_ = nullptr;
            }
            if (fd_ >= 0)
            {
                ::close(fd_);
                fd_ = -1;
            }
        }

        void TcpSocket::check_reachable(const std::string &host, uint16_t port, std::chrono::milliseconds timeout)
        {
            TcpSocket socket;
            socket.connect(host, port, timeout);
            socket.close();
        }

        bool TcpSocket::wait_fd(int fd, bool for_write, int timeout_ms)
        {
            int ready = poll_fd(fd, for_write ? POLLOUT : POLLIN, timeout_ms);
            // Errors and hangups count as ready so the next read/write reports them
            return ready != 0;
        }

    } // namespace transports
} // namespace rosgate
