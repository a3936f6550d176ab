#ifndef ROSGATE_TRANSPORTS_TCP_SOCKET_HPP
#define ROSGATE_TRANSPORTS_TCP_SOCKET_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <sys/types.h>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace rosgate
{
    namespace transports
    {

        /**
         * Non-blocking TCP stream with optional TLS (OpenSSL).
         * One reader thread and any number of writers may use it concurrently.
         */
        class TcpSocket
        {
        public:
            TcpSocket() = default;
            ~TcpSocket();

            TcpSocket(const TcpSocket &) = delete;
            TcpSocket &operator=(const TcpSocket &) = delete;

            /**
             * Resolve and connect within the timeout
             * @throws RouterOsError ConnectTimeout or ConnectRefused
             */
            void connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout);

            /**
             * TLS client handshake over the connected stream. Certificates are not
             * verified; RouterOS api-ssl without a certificate only offers anonymous DH.
             * @throws RouterOsError ProtocolError, or ConnectTimeout when the deadline passes
             */
            void start_tls(const std::string &server_name, std::chrono::milliseconds timeout);

            /**
             * @throws RouterOsError(Closed) when the peer is gone
             */
            void write_all(const uint8_t *data, size_t length);

            /**
             * @return bytes read, 0 when nothing arrived within timeout_ms, -1 on EOF or error
             */
            ssize_t read_some(uint8_t *buffer, size_t capacity, int timeout_ms);

            /**
             * Wake a blocked reader without releasing the descriptor
             */
            void shutdown();

            void close();

            /**
             * Connect and immediately close; separates unreachable hosts from protocol failures
             * @throws RouterOsError ConnectTimeout or ConnectRefused
             */
            static void check_reachable(const std::string &host, uint16_t port, std::chrono::milliseconds timeout);

        private:
            static bool wait_fd(int fd, bool for_write, int timeout_ms);

            int fd_ = -1;
            SSL_CTX *ssl_ctx_ = nullptr;
            SSL *ssl_ = nullptr;
            std::mutex io_mutex_;
        };

    } // namespace transports
} // namespace rosgate

#endif // ROSGATE_TRANSPORTS_TCP_SOCKET_HPP
