#include "core/errors.hpp"

namespace rosgate
{
    namespace core
    {

        const char *to_string(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::ConnectTimeout:
                return "ConnectTimeout";
            case ErrorCode::ConnectRefused:
                return "ConnectRefused";
            case ErrorCode::AuthFailed:
                return "AuthFailed";
            case ErrorCode::ProtocolError:
                return "ProtocolError";
            case ErrorCode::CommandTimeout:
                return "CommandTimeout";
            case ErrorCode::CommandFailed:
                return "CommandFailed";
            case ErrorCode::NotAuthenticated:
                return "NotAuthenticated";
            case ErrorCode::SessionClosed:
                return "SessionClosed";
            case ErrorCode::NoMethodAvailable:
                return "NoMethodAvailable";
            case ErrorCode::NotOpen:
                return "NotOpen";
            case ErrorCode::Closed:
                return "Closed";
            }
            return "Unknown";
        }

        const char *remediation_step(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::ConnectTimeout:
            case ErrorCode::ConnectRefused:
            case ErrorCode::NoMethodAvailable:
                return "reachability";
            case ErrorCode::AuthFailed:
                return "authentication";
            case ErrorCode::ProtocolError:
                return "protocol";
            case ErrorCode::CommandTimeout:
            case ErrorCode::CommandFailed:
                return "command";
            case ErrorCode::NotAuthenticated:
            case ErrorCode::SessionClosed:
            case ErrorCode::NotOpen:
            case ErrorCode::Closed:
                return "session";
            }
            return "unknown";
        }

    } // namespace core
} // namespace rosgate
