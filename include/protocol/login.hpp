#ifndef ROSGATE_PROTOCOL_LOGIN_HPP
#define ROSGATE_PROTOCOL_LOGIN_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace rosgate
{
    namespace protocol
    {

        /**
         * Challenge-response for routers older than 6.43, which answer the first
         * /login with =ret=<hex challenge>.
         * @return "00" + hex(md5(0x00 + password + challenge))
         * @throws std::invalid_argument on a malformed challenge
         */
        std::string legacy_login_response(const std::string &password, const std::string &challenge_hex);

        std::vector<uint8_t> hex_decode(const std::string &hex);
        std::string hex_encode(const uint8_t *data, size_t length);

    } // namespace protocol
} // namespace rosgate

#endif // ROSGATE_PROTOCOL_LOGIN_HPP
