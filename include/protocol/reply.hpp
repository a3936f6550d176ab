#ifndef ROSGATE_PROTOCOL_REPLY_HPP
#define ROSGATE_PROTOCOL_REPLY_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace rosgate
{
    namespace protocol
    {
        /**
         * RouterOS attribute list (key -> value, always textual on the wire)
         */
        using Attributes = std::map<std::string, std::string>;

        enum class ReplyKind
        {
            Data,
            Done,
            Trap,
            Fatal
        };

        inline const char *to_string(ReplyKind kind)
        {
            switch (kind)
            {
            case ReplyKind::Data:
                return "data";
            case ReplyKind::Done:
                return "done";
            case ReplyKind::Trap:
                return "trap";
            case ReplyKind::Fatal:
                return "fatal";
            }
            return "unknown";
        }

        // Trap categories added by the HTTP mapping
        constexpr const char *TRAP_CATEGORY_AUTHENTICATION = "authentication";
        constexpr const char *TRAP_CATEGORY_HTTP = "http";

        /**
         * Outbound command: a RouterOS menu path plus arguments, correlated by tag
         */
        struct Command
        {
            uint32_t tag = 0;
            std::string name;
            Attributes args;
        };

        /**
         * One inbound reply. Data replies may repeat; done/trap/fatal are terminal.
         */
        struct Reply
        {
            std::optional<uint32_t> tag;
            ReplyKind kind = ReplyKind::Done;
            Attributes attributes;
            std::string message;

            bool is_terminal() const { return kind != ReplyKind::Data; }
        };

    } // namespace protocol
} // namespace rosgate

#endif // ROSGATE_PROTOCOL_REPLY_HPP
