#ifndef ROSGATE_CORE_ERRORS_HPP
#define ROSGATE_CORE_ERRORS_HPP

#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

namespace rosgate
{
    namespace core
    {

        /**
         * Failure taxonomy shared by transports, dispatcher, session and manager
         */
        enum class ErrorCode
        {
            ConnectTimeout,
            ConnectRefused,
            AuthFailed,
            ProtocolError,
            CommandTimeout,
            CommandFailed,
            NotAuthenticated,
            SessionClosed,
            NoMethodAvailable,
            NotOpen,
            Closed
        };

        const char *to_string(ErrorCode code);

        /**
         * Which remediation a failure calls for: "reachability", "authentication",
         * "protocol", "command" or "session"
         */
        const char *remediation_step(ErrorCode code);

        /**
         * Exception carrying an ErrorCode; the router's own message text is kept in what()
         */
        class RouterOsError : public std::runtime_error
        {
        public:
            RouterOsError(ErrorCode code, const std::string &message)
                : std::runtime_error(message), code_(code) {}

            ErrorCode code() const { return code_; }

        private:
            ErrorCode code_;
        };

        /**
         * A command the router rejected (CommandFailed); category() is the trap's
         * category attribute, empty when the router sent none
         */
        class CommandError : public RouterOsError
        {
        public:
            CommandError(const std::string &message, std::string category)
                : RouterOsError(ErrorCode::CommandFailed, message), category_(std::move(category)) {}

            const std::string &category() const { return category_; }

        private:
            std::string category_;
        };

        /**
         * Future that is already failed with the given error
         */
        template <typename T>
        std::future<T> failed_future(ErrorCode code, const std::string &message)
        {
            std::promise<T> promise;
            promise.set_exception(std::make_exception_ptr(RouterOsError(code, message)));
            return promise.get_future();
        }

    } // namespace core
} // namespace rosgate

#endif // ROSGATE_CORE_ERRORS_HPP
