#include "protocol/rest_mapping.hpp"
#include "protocol/tunnel_codec.hpp"
#include "core/errors.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace rosgate
{
    namespace protocol
    {
        namespace rest
        {

            namespace
            {
                std::string lookup(const Attributes &args, const std::string &key)
                {
                    auto it = args.find(key);
                    return it != args.end() ? it->second : std::string();
                }

                nlohmann::json args_to_body(const Attributes &args, const std::vector<std::string> &skip)
                {
                    nlohmann::json body = nlohmann::json::object();
                    for (const auto &[key, value] : args)
                    {
                        bool skipped = false;
                        for (const auto &name : skip)
                        {
                            if (key == name)
                            {
                                skipped = true;
                                break;
                            }
                        }
                        if (!skipped)
                        {
                            body[key] = value;
                        }
                    }
                    return body;
                }

                std::string error_text(int status, const std::string &body)
                {
                    try
                    {
                        auto j = nlohmann::json::parse(body);
                        if (j.is_object())
                        {
                            if (j.contains("detail") && j["detail"].is_string())
                            {
                                return j["detail"].get<std::string>();
                            }
                            if (j.contains("message") && j["message"].is_string())
                            {
                                return j["message"].get<std::string>();
                            }
                        }
                    }
                    catch (const nlohmann::json::parse_error &)
                    {
                        // Not JSON; fall through to the status line
                    }
                    return "HTTP " + std::to_string(status);
                }
            } // namespace

            std::string url_encode(const std::string &text)
            {
                static const char hex[] = "0123456789ABCDEF";
                std::string out;
                out.reserve(text.size());
                for (unsigned char c : text)
                {
                    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                        c == '-' || c == '_' || c == '.' || c == '~' || c == '*')
                    {
                        out.push_back(static_cast<char>(c));
                    }
                    else
                    {
                        out.push_back('%');
                        out.push_back(hex[c >> 4]);
                        out.push_back(hex[c & 0x0F]);
                    }
                }
                return out;
            }

            RestRequest map_command(const Command &command)
            {
                if (command.name.empty() || command.name[0] != '/')
                {
                    throw std::invalid_argument("RouterOS command must start with '/': " + command.name);
                }

                RestRequest request;
                if (command.name == "/login")
                {
                    request.method = "GET";
                    request.path = LOGIN_CHECK_PATH;
                    return request;
                }

                size_t last_slash = command.name.rfind('/');
                std::string menu = command.name.substr(0, last_slash);
                std::string verb = command.name.substr(last_slash + 1);
                std::string base = std::string(REST_PREFIX) + menu;

                if (verb == "print")
                {
                    request.method = "GET";
                    request.path = base;
                    std::string query;
                    for (const auto &[key, value] : command.args)
                    {
                        query += query.empty() ? "?" : "&";
                        query += url_encode(key) + "=" + url_encode(value);
                    }
                    request.path += query;
                }
                else if (verb == "add")
                {
                    request.method = "PUT";
                    request.path = base;
                    request.body = args_to_body(command.args, {});
                }
                else if (verb == "remove")
                {
                    request.method = "DELETE";
                    request.path = base + "/" + url_encode(lookup(command.args, "numbers"));
                }
                else if (verb == "set")
                {
                    std::string id = lookup(command.args, ".id");
                    if (id.empty())
                    {
                        id = lookup(command.args, "numbers");
                    }
                    request.method = "PATCH";
                    request.path = base + "/" + url_encode(id);
                    request.body = args_to_body(command.args, {".id", "numbers"});
                }
                else
                {
                    request.method = "POST";
                    request.path = base + "/" + verb;
                    request.body = args_to_body(command.args, {});
                }
                return request;
            }

            std::vector<Reply> replies_from_response(uint32_t tag, const std::string &method,
                                                     int status, const std::string &body)
            {
                std::vector<Reply> replies;

                if (status < 200 || status >= 300)
                {
                    Reply trap;
                    trap.tag = tag;
                    trap.kind = ReplyKind::Trap;
                    trap.message = error_text(status, body);
                    trap.attributes["message"] = trap.message;
                    trap.attributes["status"] = std::to_string(status);
                    trap.attributes["category"] = (status == 401 || status == 403) ? TRAP_CATEGORY_AUTHENTICATION
                                                                                   : TRAP_CATEGORY_HTTP;
                    replies.push_back(std::move(trap));
                    return replies;
                }

                Reply done;
                done.tag = tag;
                done.kind = ReplyKind::Done;

                if (body.find_first_not_of(" \t\r\n") != std::string::npos)
                {
                    nlohmann::json j;
                    try
                    {
                        j = nlohmann::json::parse(body);
                    }
                    catch (const nlohmann::json::parse_error &e)
                    {
                        throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                                  "Invalid JSON from REST API: " + std::string(e.what()));
                    }

                    auto push_record = [&](const nlohmann::json &record)
                    {
                        Reply data;
                        data.tag = tag;
                        data.kind = ReplyKind::Data;
                        data.attributes = tunnel::attributes_from_json(record);
                        replies.push_back(std::move(data));
                    };

                    if (j.is_array())
                    {
                        for (const auto &record : j)
                        {
                            push_record(record);
                        }
                    }
                    else if (j.is_object())
                    {
                        if (j.size() == 1 && j.contains("ret"))
                        {
                            done.attributes["ret"] = tunnel::attributes_from_json(j)["ret"];
                        }
                        else
                        {
                            push_record(j);
                            if (method == "PUT" && j.contains(".id") && j[".id"].is_string())
                            {
                                done.attributes["ret"] = j[".id"].get<std::string>();
                            }
                        }
                    }
                    else
                    {
                        throw core::RouterOsError(core::ErrorCode::ProtocolError,
                                                  "Unexpected REST API response body");
                    }
                }

                replies.push_back(std::move(done));
                return replies;
            }

            std::string basic_authorization(const std::string &username, const std::string &password)
            {
                std::string credentials = username + ":" + password;
                std::vector<unsigned char> encoded(4 * ((credentials.size() + 2) / 3) + 1);
                int length = EVP_EncodeBlock(encoded.data(),
                                             reinterpret_cast<const unsigned char *>(credentials.data()),
                                             static_cast<int>(credentials.size()));
                return "Basic " + std::string(reinterpret_cast<const char *>(encoded.data()), static_cast<size_t>(length));
            }

        } // namespace rest
    } // namespace protocol
} // namespace rosgate
