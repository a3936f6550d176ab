#ifndef ROSGATE_SERVICES_COMMAND_DISPATCHER_HPP
#define ROSGATE_SERVICES_COMMAND_DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/errors.hpp"
#include "core/transport_interface.hpp"
#include "protocol/reply.hpp"

namespace rosgate
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {

        /**
         * Outcome of a completed command: every data record plus the attributes
         * of the terminating done reply (e.g. "ret" for add)
         */
        struct CommandResult
        {
            std::vector<protocol::Attributes> data;
            protocol::Attributes done;
        };

        /**
         * Exactly one of result/error is meaningful: error is null on success
         */
        using Completion = std::function<void(CommandResult result, std::exception_ptr error)>;

        /**
         * Dispatcher statistics snapshot (non-atomic copies)
         */
        struct DispatcherStatisticsSnapshot
        {
            uint64_t submitted = 0;
            uint64_t completed = 0;
            uint64_t failed = 0;
            uint64_t timed_out = 0;
            uint64_t discarded_replies = 0;

            std::map<std::string, uint64_t> to_map() const;
        };

        /**
         * Dispatcher statistics (atomic for thread safety)
         */
        struct DispatcherStatistics
        {
            std::atomic<uint64_t> submitted{0};
            std::atomic<uint64_t> completed{0};
            std::atomic<uint64_t> failed{0};
            std::atomic<uint64_t> timed_out{0};
            std::atomic<uint64_t> discarded_replies{0};

            DispatcherStatisticsSnapshot snapshot() const;
        };

        /**
         * Tags commands, correlates replies back to them and enforces per-command deadlines.
         *
         * Every tag is retired exactly once: by its terminal reply, its timeout, or
         * fail_all(). Replies for retired or unknown tags are dropped and counted.
         * Completions always run outside the internal lock.
         */
        class CommandDispatcher
        {
        public:
            explicit CommandDispatcher(core::TransportInterface &transport);
            ~CommandDispatcher();

            CommandDispatcher(const CommandDispatcher &) = delete;
            CommandDispatcher &operator=(const CommandDispatcher &) = delete;

            /**
             * Issue a command; the completion runs once with the result or the error.
             * A timeout of zero disables the deadline.
             * @return the tag, or 0 when the dispatcher is already closed
             */
            uint32_t submit(const std::string &command,
                            const protocol::Attributes &args,
                            std::chrono::milliseconds timeout,
                            Completion completion);

            std::future<CommandResult> submit(const std::string &command,
                                              const protocol::Attributes &args,
                                              std::chrono::milliseconds timeout);

            /**
             * Transport message handler entry point
             */
            void on_reply(const protocol::Reply &reply);

            /**
             * Reject every pending command with SessionClosed; later submits fail the same way
             */
            void fail_all(const std::string &reason);

            size_t pending_count() const;
            bool is_pending(uint32_t tag) const;
            uint32_t last_tag() const;
            bool is_closed() const;

            DispatcherStatisticsSnapshot get_statistics() const { return stats_.snapshot(); }

        private:
            struct PendingCommand
            {
                uint32_t tag = 0;
                std::string name;
                std::chrono::steady_clock::time_point issued;
                std::chrono::steady_clock::time_point deadline;
                Completion completion;
                std::vector<protocol::Attributes> data;
            };

            void timer_loop();
            void finish(PendingCommand &command, CommandResult result, std::exception_ptr error);

            core::TransportInterface &transport_;

            mutable std::mutex mutex_;
            std::condition_variable timer_cv_;
            std::map<uint32_t, PendingCommand> pending_;
            uint32_t last_tag_ = 0;
            bool closed_ = false;
            std::string closed_reason_;
            bool stopping_ = false;
            std::thread timer_thread_;

            DispatcherStatistics stats_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace rosgate

#endif // ROSGATE_SERVICES_COMMAND_DISPATCHER_HPP
