#ifndef ROSGATE_PROTOCOL_TUNNEL_CODEC_HPP
#define ROSGATE_PROTOCOL_TUNNEL_CODEC_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/reply.hpp"

namespace rosgate
{
    namespace protocol
    {
        /**
         * JSON messages exchanged with the WebSocket tunnel.
         *
         * Outbound: {"command": "/path", "tag": "tagN", "<arg>": "<value>", ...}
         * Inbound:  {"type": "data|done|trap|fatal", "tag": "tagN", "data": ..., "message": ...}
         */
        namespace tunnel
        {
            std::string format_tag(uint32_t tag);

            /**
             * Accepts "tagN" or a bare number
             */
            std::optional<uint32_t> parse_tag(const std::string &text);

            nlohmann::json command_to_json(const Command &command);
            std::string encode_command(const Command &command);

            /**
             * Flatten a JSON object into RouterOS attributes; non-string scalars are stringified
             */
            Attributes attributes_from_json(const nlohmann::json &object);

            /**
             * Decode one inbound message. A "done" carrying data expands into one
             * data reply per record followed by the done reply.
             * @throws RouterOsError(ProtocolError) on malformed JSON or an unknown type
             */
            std::vector<Reply> decode_message(const std::string &text);

        } // namespace tunnel
    } // namespace protocol
} // namespace rosgate

#endif // ROSGATE_PROTOCOL_TUNNEL_CODEC_HPP
