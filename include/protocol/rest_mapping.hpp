#ifndef ROSGATE_PROTOCOL_REST_MAPPING_HPP
#define ROSGATE_PROTOCOL_REST_MAPPING_HPP

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
         * Translation between RouterOS commands and the v7 REST API (/rest/...)
         */
        namespace rest
        {
            static constexpr const char *REST_PREFIX = "/rest";
            static constexpr const char *LOGIN_CHECK_PATH = "/rest/system/resource";

            struct RestRequest
            {
                std::string method;
                std::string path;
                std::optional<nlohmann::json> body;
            };

            /**
             * Percent-encode everything outside the RFC 3986 unreserved set; '*' is kept
             * because RouterOS item ids start with it
             */
            std::string url_encode(const std::string &text);

            /**
             * print -> GET, add -> PUT, remove -> DELETE, set -> PATCH, other verbs -> POST.
             * /login becomes a credential check against /rest/system/resource.
             * @throws std::invalid_argument for a command that is not an absolute path
             */
            RestRequest map_command(const Command &command);

            /**
             * Convert an HTTP response into the replies a streaming router would have sent.
             * 2xx yields data replies then done; 4xx/5xx yield a trap carrying the router's detail.
             * @throws RouterOsError(ProtocolError) when a successful response body is not JSON
             */
            std::vector<Reply> replies_from_response(uint32_t tag, const std::string &method,
                                                     int status, const std::string &body);

            /**
             * "Basic " + base64(user:password)
             */
            std::string basic_authorization(const std::string &username, const std::string &password);

        } // namespace rest
    } // namespace protocol
} // namespace rosgate

#endif // ROSGATE_PROTOCOL_REST_MAPPING_HPP
