#ifndef ROSGATE_PROTOCOL_API_CODEC_HPP
#define ROSGATE_PROTOCOL_API_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/reply.hpp"

namespace rosgate
{
    namespace protocol
    {
        using Sentence = std::vector<std::string>;

        /**
         * RouterOS binary API word/sentence codec.
         *
         * A word is a variable-length length prefix followed by that many bytes;
         * a sentence is a run of words closed by a zero-length word.
         */
        namespace api
        {
            // Largest word accepted from the router
            static constexpr size_t MAX_WORD_LENGTH = 16 * 1024 * 1024;

            std::vector<uint8_t> encode_length(size_t length);
            void append_word(std::vector<uint8_t> &out, const std::string &word);
            std::vector<uint8_t> encode_sentence(const Sentence &words);

            /**
             * Command -> ["/path", "=key=value"..., ".tag=N"]
             */
            Sentence command_to_sentence(const Command &command);

            /**
             * Parse a reply sentence. Returns nullopt for sentences that carry no
             * reply semantics (!empty). Throws RouterOsError(ProtocolError) on an
             * unrecognised reply word.
             */
            std::optional<Reply> reply_from_sentence(const Sentence &words);

        } // namespace api

        /**
         * Incremental sentence decoder; bytes may arrive split at any boundary
         */
        class SentenceDecoder
        {
        public:
            /**
             * Consume bytes and return every sentence completed by them, in order.
             * Throws RouterOsError(ProtocolError) on a reserved control byte or an
             * oversized word; the decoder is unusable until reset() afterwards.
             */
            std::vector<Sentence> feed(const uint8_t *data, size_t length);

            size_t buffered() const { return buffer_.size(); }
            void reset();

        private:
            bool decode_length(size_t &length, size_t &header_size) const;

            std::vector<uint8_t> buffer_;
            Sentence current_;
        };

    } // namespace protocol
} // namespace rosgate

#endif // ROSGATE_PROTOCOL_API_CODEC_HPP
