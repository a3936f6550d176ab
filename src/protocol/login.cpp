#include "protocol/login.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace rosgate
{
    namespace protocol
    {

        std::vector<uint8_t> hex_decode(const std::string &hex)
        {
            if (hex.size() % 2 != 0)
            {
                throw std::invalid_argument("Hex string has odd length");
            }

            auto nibble = [](char c) -> uint8_t
            {
                if (c >= '0' && c <= '9')
                    return static_cast<uint8_t>(c - '0');
                if (c >= 'a' && c <= 'f')
                    return static_cast<uint8_t>(c - 'a' + 10);
                if (c >= 'A' && c <= 'F')
                    return static_cast<uint8_t>(c - 'A' + 10);
                throw std::invalid_argument(std::string("Invalid hex digit: ") + c);
            };

            std::vector<uint8_t> bytes;
            bytes.reserve(hex.size() / 2);
            for (size_t i = 0; i < hex.size(); i += 2)
            {
                bytes.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
            }
            return bytes;
        }

        std::string hex_encode(const uint8_t *data, size_t length)
        {
            static const char digits[] = "0123456789abcdef";
            std::string out;
            out.reserve(length * 2);
            for (size_t i = 0; i < length; ++i)
            {
                out.push_back(digits[data[i] >> 4]);
                out.push_back(digits[data[i] & 0x0F]);
            }
            return out;
        }

        std::string legacy_login_response(const std::string &password, const std::string &challenge_hex)
        {
            std::vector<uint8_t> challenge = hex_decode(challenge_hex);

            std::vector<uint8_t> input;
            input.reserve(1 + password.size() + challenge.size());
            input.push_back(0x00);
            input.insert(input.end(), password.begin(), password.end());
            input.insert(input.end(), challenge.begin(), challenge.end());

            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int digest_length = 0;
            if (EVP_Digest(input.data(), input.size(), digest, &digest_length, EVP_md5(), nullptr) != 1)
            {
                throw std::runtime_error("Failed to compute MD5 digest");
            }

            return "00" + hex_encode(digest, digest_length);
        }

    } // namespace protocol
} // namespace rosgate
