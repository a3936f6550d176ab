#include "protocol/tunnel_codec.hpp"
#include "core/errors.hpp"
#include <cstdlib>

namespace rosgate
{
    namespace protocol
    {
        namespace tunnel
        {

            namespace
            {
                std::string stringify(const nlohmann::json &value)
                {
                    if (value.is_string())
                    {
                        return value.get<std::string>();
                    }
                    if (value.is_null())
                    {
                        return "";
                    }
                    // RouterOS spells booleans "true"/"false", which dump() already does
                    return value.dump();
                }

                void append_records(std::vector<Reply> &replies, const std::optional<uint32_t> &tag,
                                    const nlohmann::json &data)
                {
                    auto append_one = [&](const nlohmann::json &record)
                    {
                        Reply reply;
                        reply.tag = tag;
                        reply.kind = ReplyKind::Data;
                        reply.attributes = attributes_from_json(record);
                        replies.push_back(std::move(reply));
                    };

                    if (data.is_array())
                    {
                        for (const auto &record : data)
                        {
                            append_one(record);
                        }
                    }
                    else if (data.is_object())
                    {
                        append_one(data);
                    }
                    else if (!data.is_null())
                    {
                        throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                                  "Tunnel data must be an object or an array");
                    }
                }
            } // namespace

            std::string format_tag(uint32_t tag)
            {
                return "tag" + std::to_string(tag);
            }

            std::optional<uint32_t> parse_tag(const std::string &text)
            {
                std::string digits = text.rfind("tag", 0) == 0 ? text.substr(3) : text;
                if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
                {
                    return std::nullopt;
                }
                unsigned long long value = std::strtoull(digits.c_str(), nullptr, 10);
                if (value > UINT32_MAX)
                {
                    return std::nullopt;
                }
                return static_cast<uint32_t>(value);
            }

            nlohmann::json command_to_json(const Command &command)
            {
                nlohmann::json j = nlohmann::json::object();
                for (const auto &[key, value] : command.args)
                {
                    j[key] = value;
                }
                // Reserved keys win over arguments of the same name
                j["command"] = command.name;
                j["tag"] = format_tag(command.tag);
                return j;
            }

            std::string encode_command(const Command &command)
            {
                return command_to_json(command).dump();
            }

            Attributes attributes_from_json(const nlohmann::json &object)
            {
                Attributes attributes;
                if (!object.is_object())
                {
                    return attributes;
                }
                for (auto it = object.begin(); it != object.end(); ++it)
                {
                    attributes[it.key()] = stringify(it.value());
                }
                return attributes;
            }

            std::vector<Reply> decode_message(const std::string &text)
            {
                nlohmann::json j;
                try
                {
                    j = nlohmann::json::parse(text);
                }
                catch (const nlohmann::json::parse_error &e)
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                              "Invalid JSON from tunnel: " + std::string(e.what()));
                }

                if (!j.is_object() || !j.contains("type") || !j["type"].is_string())
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError, "Tunnel message without type");
                }

                std::optional<uint32_t> tag;
                if (j.contains("tag"))
                {
                    const auto &raw = j["tag"];
                    if (raw.is_string())
                    {
                        tag = parse_tag(raw.get<std::string>());
                    }
                    else if (raw.is_number_unsigned())
                    {
                        tag = raw.get<uint32_t>();
                    }
                }

                const std::string type = j["type"];
                const nlohmann::json data = j.contains("data") ? j["data"] : nlohmann::json();
                std::string message;
                if (j.contains("message"))
                {
                    message = stringify(j["message"]);
                }

                std::vector<Reply> replies;
                if (type == "data" || type == "re")
                {
                    append_records(replies, tag, data);
                    return replies;
                }

                Reply terminal;
                terminal.tag = tag;
                terminal.message = message;
                if (type == "done")
                {
                    terminal.kind = ReplyKind::Done;
                    if (data.is_object() && data.size() == 1 && data.contains("ret"))
                    {
                        terminal.attributes["ret"] = stringify(data["ret"]);
                    }
                    else
                    {
                        append_records(replies, tag, data);
                    }
                    if (j.contains("ret"))
                    {
                        terminal.attributes["ret"] = stringify(j["ret"]);
                    }
                }
                else if (type == "trap" || type == "fatal")
                {
                    terminal.kind = type == "trap" ? ReplyKind::Trap : ReplyKind::Fatal;
                    terminal.attributes = attributes_from_json(data);
                    if (terminal.message.empty() && terminal.attributes.count("message"))
                    {
                        terminal.message = terminal.attributes["message"];
                    }
                }
                else
                {
                    throw core::RouterOsError(core::ErrorCode::ProtocolError, "Unknown tunnel message type: " + type);
                }

                replies.push_back(std::move(terminal));
                return replies;
            }

        } // namespace tunnel
    } // namespace protocol
} // namespace rosgate
