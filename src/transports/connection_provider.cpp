#include "transports/connection_provider.hpp"

#include "oatpp/network/tcp/client/ConnectionProvider.hpp"
#include "oatpp-openssl/client/ConnectionProvider.hpp"
#include "oatpp-openssl/Config.hpp"

#include <algorithm>
#include <sys/socket.h>

namespace rosgate
{
    namespace transports
    {

        // InterruptibleConnectionProvider implementation
        InterruptibleConnectionProvider::InterruptibleConnectionProvider(const oatpp::network::Address &address)
            : tcp_(oatpp::network::tcp::client::ConnectionProvider::createShared(address))
        {
        }

        oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream> InterruptibleConnectionProvider::get()
        {
            auto handle = tcp_->get();

            auto connection = std::dynamic_pointer_cast<oatpp::network::tcp::Connection>(handle.object);
            if (connection)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                                  [](const std::weak_ptr<oatpp::network::tcp::Connection> &c)
                                                  { return c.expired(); }),
                                   connections_.end());
                connections_.push_back(connection);
            }
            return handle;
        }

        oatpp::async::CoroutineStarterForResult<const oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream> &>
        InterruptibleConnectionProvider::getAsync()
        {
            return tcp_->getAsync();
        }

        void InterruptibleConnectionProvider::stop()
        {
            interrupt();
            tcp_->stop();
        }

        void InterruptibleConnectionProvider::interrupt()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &weak : connections_)
            {
                // Holding the connection keeps its descriptor from being closed and reused meanwhile
                if (auto connection = weak.lock())
                {
                    ::shutdown(connection->getHandle(), SHUT_RDWR);
                }
            }
            connections_.clear();
        }

        std::shared_ptr<oatpp::network::ClientConnectionProvider> make_client_provider(
            const core::Endpoint &endpoint,
            const std::shared_ptr<InterruptibleConnectionProvider> &tcp)
        {
            if (!endpoint.secure)
            {
                return tcp;
            }
            auto config = oatpp::openssl::Config::createDefaultClientConfigShared();
            return oatpp::openssl::client::ConnectionProvider::createShared(config, tcp);
        }

        // ConnectionDeadline implementation
        ConnectionDeadline::ConnectionDeadline(std::shared_ptr<InterruptibleConnectionProvider> provider,
                                               std::chrono::milliseconds timeout)
            : provider_(std::move(provider))
        {
            if (timeout.count() > 0)
            {
                thread_ = std::thread(&ConnectionDeadline::watch, this, std::chrono::steady_clock::now() + timeout);
            }
        }

        ConnectionDeadline::~ConnectionDeadline()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                dismissed_ = true;
            }
            cv_.notify_all();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        bool ConnectionDeadline::expired() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return expired_;
        }

        void ConnectionDeadline::watch(std::chrono::steady_clock::time_point deadline)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, deadline, [this]
                               { return dismissed_; }))
            {
                return;
            }
            expired_ = true;
            lock.unlock();

            provider_->interrupt();
        }

    } // namespace transports
} // namespace rosgate
