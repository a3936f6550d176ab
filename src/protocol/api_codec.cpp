#include "protocol/api_codec.hpp"
#include "core/errors.hpp"
#include <cstdlib>

namespace rosgate
{
    namespace protocol
    {
        namespace api
        {

            std::vector<uint8_t> encode_length(size_t length)
            {
                if (length < 0x80)
                {
                    return {static_cast<uint8_t>(length)};
                }
                if (length < 0x4000)
                {
                    uint32_t value = static_cast<uint32_t>(length) | 0x8000;
                    return {static_cast<uint8_t>((value >> 8) & 0xFF),
                            static_cast<uint8_t>(value & 0xFF)};
                }
                if (length < 0x200000)
                {
                    uint32_t value = static_cast<uint32_t>(length) | 0xC00000;
                    return {static_cast<uint8_t>((value >> 16) & 0xFF),
                            static_cast<uint8_t>((value >> 8) & 0xFF),
                            static_cast<uint8_t>(value & 0xFF)};
                }
                if (length < 0x10000000)
                {
                    uint32_t value = static_cast<uint32_t>(length) | 0xE0000000;
                    return {static_cast<uint8_t>((value >> 24) & 0xFF),
                            static_cast<uint8_t>((value >> 16) & 0xFF),
                            static_cast<uint8_t>((value >> 8) & 0xFF),
                            static_cast<uint8_t>(value & 0xFF)};
                }

                uint32_t value = static_cast<uint32_t>(length);
                return {0xF0,
                        static_cast<uint8_t>((value >> 24) & 0xFF),
                        static_cast<uint8_t>((value >> 16) & 0xFF),
                        static_cast<uint8_t>((value >> 8) & 0xFF),
                        static_cast<uint8_t>(value & 0xFF)};
            }

            void append_word(std::vector<uint8_t> &out, const std::string &word)
            {
                auto prefix = encode_length(word.size());
                out.insert(out.end(), prefix.begin(), prefix.end());
                out.insert(out.end(), word.begin(), word.end());
            }

            std::vector<uint8_t> encode_sentence(const Sentence &words)
            {
                std::vector<uint8_t> out;
                for (const auto &word : words)
                {
                    append_word(out, word);
                }
                out.push_back(0x00);
                return out;
            }

            Sentence command_to_sentence(const Command &command)
            {
                Sentence words;
                words.reserve(command.args.size() + 2);
                words.push_back(command.name);
                for (const auto &[key, value] : command.args)
                {
                    words.push_back("=" + key + "=" + value);
                }
                words.push_back(".tag=" + std::to_string(command.tag));
                return words;
            }

            std::optional<Reply> reply_from_sentence(const Sentence &words)
            {
                if (words.empty())
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError, "Empty reply sentence");
                }

                Reply reply;
                const std::string &type = words[0];
                if (type == "!re")
                {
                    reply.kind = ReplyKind::Data;
                }
                else if (type == "!done")
                {
                    reply.kind = ReplyKind::Done;
                }
                else if (type == "!trap")
                {
                    reply.kind = ReplyKind::Trap;
                }
                else if (type == "!fatal")
                {
                    reply.kind = ReplyKind::Fatal;
                }
                else if (type == "!empty")
                {
                    // RouterOS 7.18+ announces an empty listing before !done
                    return std::nullopt;
                }
                else
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                              "Unexpected reply word: " + type);
                }

                for (size_t i = 1; i < words.size(); ++i)
                {
                    const std::string &word = words[i];
                    if (word.rfind(".tag=", 0) == 0)
                    {
                        const std::string digits = word.substr(5);
                        char *end = nullptr;
                        unsigned long value = std::strtoul(digits.c_str(), &end, 10);
                        if (!digits.empty() && end && *end == '\0' && value <= UINT32_MAX)
                        {
                            reply.tag = static_cast<uint32_t>(value);
                        }
                    }
                    else if (!word.empty() && word[0] == '=')
                    {
                        size_t separator = word.find('=', 1);
                        if (separator == std::string::npos)
                        {
                            reply.attributes[word.substr(1)] = "";
                            continue;
                        }
                        std::string key = word.substr(1, separator - 1);
                        std::string value = word.substr(separator + 1);
                        if (key == "message")
                        {
                            reply.message = value;
                        }
                        reply.attributes[key] = value;
                    }
                    else if (reply.kind == ReplyKind::Fatal && reply.message.empty())
                    {
                        // !fatal carries its reason as a bare word
                        reply.message = word;
                    }
                }

                return reply;
            }

        } // namespace api

        std::vector<Sentence> SentenceDecoder::feed(const uint8_t *data, size_t length)
        {
            buffer_.insert(buffer_.end(), data, data + length);

            std::vector<Sentence> sentences;
            size_t offset = 0;

            while (offset < buffer_.size())
            {
                // decode_length works on the buffer front, so shift consumed bytes first
                if (offset > 0)
                {
                    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
                    offset = 0;
                }

                size_t word_length = 0;
                size_t header_size = 0;
                if (!decode_length(word_length, header_size))
                {
                    break;
                }

                if (word_length > api::MAX_WORD_LENGTH)
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                              "Word too large: " + std::to_string(word_length));
                }

                if (buffer_.size() < header_size + word_length)
                {
                    break;
                }

                if (word_length == 0)
                {
                    sentences.push_back(std::move(current_));
                    current_.clear();
                }
                else
                {
                    current_.emplace_back(reinterpret_cast<const char *>(buffer_.data() + header_size), word_length);
                }
                offset = header_size + word_length;
            }

            if (offset > 0)
            {
                buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
            }

            return sentences;
        }

        void SentenceDecoder::reset()
        {
            buffer_.clear();
            current_.clear();
        }

        bool SentenceDecoder::decode_length(size_t &length, size_t &header_size) const
        {
            if (buffer_.empty())
            {
                return false;
            }

            uint8_t first = buffer_[0];
            if ((first & 0x80) == 0x00)
            {
                header_size = 1;
                length = first;
                return true;
            }

            if ((first & 0xC0) == 0x80)
            {
                header_size = 2;
            }
            else if ((first & 0xE0) == 0xC0)
            {
                header_size = 3;
            }
            else if ((first & 0xF0) == 0xE0)
            {
                header_size = 4;
            }
            else if (first == 0xF0)
            {
                header_size = 5;
            }
            else
            {
                throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                          "Reserved control byte in length prefix: " + std::to_string(first));
            }

            if (buffer_.size() < header_size)
            {
                return false;
            }

            switch (header_size)
            {
            case 2:
                length = (static_cast<size_t>(first & 0x3F) << 8) | buffer_[1];
                break;
            case 3:
                length = (static_cast<size_t>(first & 0x1F) << 16) |
                         (static_cast<size_t>(buffer_[1]) << 8) | buffer_[2];
                break;
            case 4:
                length = (static_cast<size_t>(first & 0x0F) << 24) |
                         (static_cast<size_t>(buffer_[1]) << 16) |
                         (static_cast<size_t>(buffer_[2]) << 8) | buffer_[3];
                break;
            default:
                length = (static_cast<size_t>(buffer_[1]) << 24) |
                         (static_cast<size_t>(buffer_[2]) << 16) |
                         (static_cast<size_t>(buffer_[3]) << 8) | buffer_[4];
                break;
            }
            return true;
        }

    } // namespace protocol
} // namespace rosgate
