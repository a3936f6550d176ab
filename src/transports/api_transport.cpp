#include "transports/api_transport.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

namespace rosgate
{
    namespace transports
    {

        namespace
        {
            constexpr int RECEIVE_POLL_MS = 200;
            constexpr size_t RECEIVE_BUFFER_SIZE = 4096;
        } // namespace

        ApiTransport::ApiTransport()
            : BaseTransport("ApiTransport")
        {
        }

        ApiTransport::~ApiTransport()
        {
            close();
        }

        void ApiTransport::open(const core::Endpoint &endpoint, std::chrono::milliseconds timeout)
        {
            if (running_)
            {
                close();
            }

            const auto started = std::chrono::steady_clock::now();
            socket_.connect(endpoint.host, endpoint.port, timeout);

            if (endpoint.secure)
            {
                auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
                try
                {
                    socket_.start_tls(endpoint.host, timeout > spent ? timeout - spent : std::chrono::milliseconds(0));
                }
                catch (const core::RouterOsError &)
                {
                    socket_.close();
                    throw;
                }
            }

            decoder_.reset();
            running_ = true;
            mark_open(endpoint);

            // Start receive thread
            receive_thread_ = std::make_unique<std::thread>(&ApiTransport::receive_sentences, this);
        }

        void ApiTransport::send(const protocol::Command &command)
        {
            require_open();

            auto bytes = protocol::api::encode_sentence(protocol::api::command_to_sentence(command));

            logger_->debug("Sending command",
                           core::LogContext().add("command", command.name).add("tag", command.tag).add("bytes", bytes.size()));

            std::lock_guard<std::mutex> lock(write_mutex_);
            socket_.write_all(bytes.data(), bytes.size());
        }

        void ApiTransport::close()
        {
            bool was_open = mark_closed();
            running_ = false;
            socket_.shutdown();

            if (receive_thread_ && receive_thread_->joinable())
            {
                if (receive_thread_->get_id() == std::this_thread::get_id())
                {
                    // Closed from a reply handler; the loop exits on its next check
                    receive_thread_->detach();
                }
                else
                {
                    receive_thread_->join();
                }
            }
            receive_thread_.reset();

            {
                // Writers were woken by shutdown(); wait for them to leave before freeing the socket
                std::lock_guard<std::mutex> lock(write_mutex_);
                socket_.close();
            }

            if (was_open)
            {
                logger_->info("Transport closed", core::LogContext().add("endpoint", endpoint().to_string()));
            }
        }

        void ApiTransport::receive_sentences()
        {
            uint8_t buffer[RECEIVE_BUFFER_SIZE];

            while (running_)
            {
                ssize_t received = socket_.read_some(buffer, sizeof(buffer), RECEIVE_POLL_MS);
                if (received == 0)
                {
                    continue;
                }
                if (received < 0)
                {
                    if (running_)
                    {
                        connection_lost("Connection closed by router");
                    }
                    return;
                }

                std::vector<protocol::Sentence> sentences;
                try
                {
                    sentences = decoder_.feed(buffer, static_cast<size_t>(received));
                }
                catch (const core::RouterOsError &e)
                {
                    logger_->error("Undecodable data from router", core::LogContext().add("error", e.what()));
                    connection_lost(std::string("Protocol error: ") + e.what());
                    return;
                }

                for (const auto &sentence : sentences)
                {
                    if (!running_)
                    {
                        return;
                    }
                    handle_sentence(sentence);
                }
            }
        }

        void ApiTransport::handle_sentence(const protocol::Sentence &sentence)
        {
            std::optional<protocol::Reply> reply;
            try
            {
                reply = protocol::api::reply_from_sentence(sentence);
            }
            catch (const core::RouterOsError &e)
            {
                logger_->warning("Dropping malformed reply", core::LogContext().add("error", e.what()));
                return;
            }

            if (reply)
            {
                deliver(*reply);
            }
        }

        void ApiTransport::connection_lost(const std::string &reason)
        {
            if (!running_.exchange(false))
            {
                return;
            }
            mark_closed();
            socket_.shutdown();

            logger_->warning("Connection lost", core::LogContext().add("reason", reason));
            notify_closed(reason);
        }

    } // namespace transports
} // namespace rosgate
