#include "services/command_dispatcher.hpp"
#include "core/logger.hpp"

namespace rosgate
{
    namespace services
    {

        // DispatcherStatisticsSnapshot implementation
        std::map<std::string, uint64_t> DispatcherStatisticsSnapshot::to_map() const
        {
            return {
                {"submitted", submitted},
                {"completed", completed},
                {"failed", failed},
                {"timed_out", timed_out},
                {"discarded_replies", discarded_replies}};
        }

        // DispatcherStatistics implementation
        DispatcherStatisticsSnapshot DispatcherStatistics::snapshot() const
        {
            DispatcherStatisticsSnapshot snapshot;
            snapshot.submitted = submitted.load();
            snapshot.completed = completed.load();
            snapshot.failed = failed.load();
            snapshot.timed_out = timed_out.load();
            snapshot.discarded_replies = discarded_replies.load();
            return snapshot;
        }

        // CommandDispatcher implementation
        CommandDispatcher::CommandDispatcher(core::TransportInterface &transport)
            : transport_(transport), logger_(core::get_logger("CommandDispatcher"))
        {
            timer_thread_ = std::thread(&CommandDispatcher::timer_loop, this);
        }

        CommandDispatcher::~CommandDispatcher()
        {
            fail_all("Dispatcher shut down");
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopping_ = true;
            }
            timer_cv_.notify_all();
            if (timer_thread_.joinable())
            {
                timer_thread_.join();
            }
        }

        uint32_t CommandDispatcher::submit(const std::string &command,
                                           const protocol::Attributes &args,
                                           std::chrono::milliseconds timeout,
                                           Completion completion)
        {
            protocol::Command outbound;
            outbound.name = command;
            outbound.args = args;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (closed_)
                {
                    PendingCommand rejected;
                    rejected.name = command;
                    rejected.completion = std::move(completion);
                    std::string reason = closed_reason_;
                    lock.unlock();
                    finish(rejected, CommandResult{},
                           std::make_exception_ptr(core::RouterOsError(core::ErrorCode::SessionClosed, reason)));
                    return 0;
                }

                if (++last_tag_ == 0)
                {
                    last_tag_ = 1;
                }
                outbound.tag = last_tag_;

                PendingCommand pending;
                pending.tag = outbound.tag;
                pending.name = command;
                pending.issued = std::chrono::steady_clock::now();
                pending.deadline = timeout.count() > 0 ? pending.issued + timeout
                                                       : std::chrono::steady_clock::time_point::max();
                pending.completion = std::move(completion);
                pending_.emplace(outbound.tag, std::move(pending));
            }
            timer_cv_.notify_all();
            stats_.submitted++;

            logger_->debug("Command submitted",
                           core::LogContext().add("command", command).add("tag", outbound.tag));

            // Stateless transports deliver the replies inside send(), so no lock is held here
            std::exception_ptr send_error;
            try
            {
                transport_.send(outbound);
            }
            catch (const core::RouterOsError &)
            {
                send_error = std::current_exception();
            }
            catch (const std::exception &e)
            {
                send_error = std::make_exception_ptr(core::RouterOsError(core::ErrorCode::ProtocolError, e.what()));
            }

            if (send_error)
            {
                PendingCommand failed;
                bool retired = false;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto it = pending_.find(outbound.tag);
                    if (it != pending_.end())
                    {
                        failed = std::move(it->second);
                        pending_.erase(it);
                        retired = true;
                    }
                }
                if (retired)
                {
                    stats_.failed++;
                    finish(failed, CommandResult{}, send_error);
                }
            }

            return outbound.tag;
        }

        std::future<CommandResult> CommandDispatcher::submit(const std::string &command,
                                                             const protocol::Attributes &args,
                                                             std::chrono::milliseconds timeout)
        {
            auto promise = std::make_shared<std::promise<CommandResult>>();
            auto future = promise->get_future();

            submit(command, args, timeout, [promise](CommandResult result, std::exception_ptr error)
                   {
                       if (error)
                       {
                           promise->set_exception(error);
                       }
                       else
                       {
                           promise->set_value(std::move(result));
                       } });

            return future;
        }

        void CommandDispatcher::on_reply(const protocol::Reply &reply)
        {
            if (!reply.tag)
            {
                stats_.discarded_replies++;
                logger_->warning("Untagged reply discarded",
                                 core::LogContext().add("kind", protocol::to_string(reply.kind)).add("message", reply.message));
                return;
            }

            PendingCommand retired;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = pending_.find(*reply.tag);
                if (it == pending_.end())
                {
                    stats_.discarded_replies++;
                    logger_->debug("Reply for unknown tag discarded",
                                   core::LogContext().add("tag", *reply.tag).add("kind", protocol::to_string(reply.kind)));
                    return;
                }

                if (reply.kind == protocol::ReplyKind::Data)
                {
                    it->second.data.push_back(reply.attributes);
                    return;
                }

                retired = std::move(it->second);
                pending_.erase(it);
            }

            if (reply.kind == protocol::ReplyKind::Done)
            {
                stats_.completed++;
                CommandResult result;
                result.data = std::move(retired.data);
                result.done = reply.attributes;
                finish(retired, std::move(result), nullptr);
                return;
            }

            stats_.failed++;
            std::string message = reply.message.empty() ? "Command failed" : reply.message;
            auto category = reply.attributes.find("category");
            finish(retired, CommandResult{},
                   std::make_exception_ptr(core::CommandError(
                       message, category != reply.attributes.end() ? category->second : std::string())));
        }

        void CommandDispatcher::fail_all(const std::string &reason)
        {
            std::map<uint32_t, PendingCommand> aborted;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!closed_)
                {
                    closed_ = true;
                    closed_reason_ = reason;
                }
                aborted.swap(pending_);
            }
            timer_cv_.notify_all();

            if (!aborted.empty())
            {
                logger_->info("Rejecting pending commands",
                              core::LogContext().add("count", aborted.size()).add("reason", reason));
            }

            for (auto &[tag, command] : aborted)
            {
                stats_.failed++;
                finish(command, CommandResult{},
                       std::make_exception_ptr(core::RouterOsError(core::ErrorCode::SessionClosed, reason)));
            }
        }

        size_t CommandDispatcher::pending_count() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return pending_.size();
        }

        bool CommandDispatcher::is_pending(uint32_t tag) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return pending_.count(tag) != 0;
        }

        uint32_t CommandDispatcher::last_tag() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return last_tag_;
        }

        bool CommandDispatcher::is_closed() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        void CommandDispatcher::timer_loop()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!stopping_)
            {
                auto next_deadline = std::chrono::steady_clock::time_point::max();
                for (const auto &[tag, command] : pending_)
                {
                    if (command.deadline < next_deadline)
                    {
                        next_deadline = command.deadline;
                    }
                }

                if (next_deadline == std::chrono::steady_clock::time_point::max())
                {
                    timer_cv_.wait(lock);
                    continue;
                }
                timer_cv_.wait_until(lock, next_deadline);

                auto now = std::chrono::steady_clock::now();
                std::vector<PendingCommand> expired;
                for (auto it = pending_.begin(); it != pending_.end();)
                {
                    if (it->second.deadline <= now)
                    {
                        expired.push_back(std::move(it->second));
                        it = pending_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }

                if (expired.empty())
                {
                    continue;
                }

                lock.unlock();
                for (auto &command : expired)
                {
                    stats_.timed_out++;
                    logger_->warning("Command timed out",
                                     core::LogContext().add("command", command.name).add("tag", command.tag));
                    finish(command, CommandResult{},
                           std::make_exception_ptr(core::RouterOsError(core::ErrorCode::CommandTimeout,
                                                                       "No reply to " + command.name + " before its deadline")));
                }
                lock.lock();
            }
        }

        void CommandDispatcher::finish(PendingCommand &command, CommandResult result, std::exception_ptr error)
        {
            if (!command.completion)
            {
                return;
            }
            try
            {
                command.completion(std::move(result), error);
            }
            catch (const std::exception &e)
            {
                logger_->error("Command completion threw",
                               core::LogContext().add("command", command.name).add("tag", command.tag).add("error", e.what()));
            }
        }

    } // namespace services
} // namespace rosgate
