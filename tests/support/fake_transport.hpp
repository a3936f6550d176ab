#ifndef ROSGATE_TESTS_FAKE_TRANSPORT_HPP
#define ROSGATE_TESTS_FAKE_TRANSPORT_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/transport_interface.hpp"
#include "protocol/reply.hpp"

namespace rosgate
{
    namespace testing
    {

        // Reply builders
        inline protocol::Reply data_reply(uint32_t tag, protocol::Attributes attributes)
        {
            protocol::Reply reply;
            reply.tag = tag;
            reply.kind = protocol::ReplyKind::Data;
            reply.attributes = std::move(attributes);
            return reply;
        }

        inline protocol::Reply done_reply(uint32_t tag, protocol::Attributes attributes = {})
        {
            protocol::Reply reply;
            reply.tag = tag;
            reply.kind = protocol::ReplyKind::Done;
            reply.attributes = std::move(attributes);
            return reply;
        }

        inline protocol::Reply trap_reply(uint32_t tag, const std::string &message)
        {
            protocol::Reply reply;
            reply.tag = tag;
            reply.kind = protocol::ReplyKind::Trap;
            reply.message = message;
            reply.attributes["message"] = message;
            return reply;
        }

        /**
         * Answers each command with a list of replies (delivered inside send)
         */
        using Responder = std::function<std::vector<protocol::Reply>(const protocol::Command &)>;

        /**
         * Observable side of a fake link; outlives the transport that owns it
         */
        struct FakeLink
        {
            std::mutex mutex;
            std::vector<protocol::Command> sent;
            int open_calls = 0;
            int close_calls = 0;

            std::vector<protocol::Command> commands()
            {
                std::lock_guard<std::mutex> lock(mutex);
                return sent;
            }
        };

        /**
         * Scriptable in-memory transport
         */
        class FakeTransport : public core::BaseTransport
        {
        public:
            explicit FakeTransport(core::TransportKind kind = core::TransportKind::Api,
                                   std::shared_ptr<FakeLink> link = std::make_shared<FakeLink>())
                : core::BaseTransport("FakeTransport"), kind_(kind), link_(std::move(link))
            {
            }

            ~FakeTransport() override { close(); }

            void open(const core::Endpoint &endpoint, std::chrono::milliseconds) override
            {
                {
                    std::lock_guard<std::mutex> lock(link_->mutex);
                    link_->open_calls++;
                }
                if (open_error)
                {
                    throw core::RouterOsError(*open_error, "fake open failure");
                }
                mark_open(endpoint);
            }

            void send(const protocol::Command &command) override
            {
                require_open();
                {
                    std::lock_guard<std::mutex> lock(link_->mutex);
                    link_->sent.push_back(command);
                }
                if (responder)
                {
                    for (const auto &reply : responder(command))
                    {
                        deliver(reply);
                    }
                }
            }

            void close() override
            {
                if (mark_closed())
                {
                    std::lock_guard<std::mutex> lock(link_->mutex);
                    link_->close_calls++;
                }
            }

            core::TransportKind get_type() const override { return kind_; }
            bool is_stateless() const override { return kind_ == core::TransportKind::Rest; }

            /** Push a reply as if the router sent it */
            void inject(const protocol::Reply &reply) { deliver(reply); }

            /** Simulate loss of the channel */
            void drop(const std::string &reason)
            {
                if (mark_closed())
                {
                    notify_closed(reason);
                }
            }

            const std::shared_ptr<FakeLink> &link() const { return link_; }

            std::optional<core::ErrorCode> open_error;
            Responder responder;

        private:
            core::TransportKind kind_;
            std::shared_ptr<FakeLink> link_;
        };

        /**
         * Minimal router: checks credentials on /login and answers the typed menus
         */
        inline Responder router_responder(const std::string &username, const std::string &password)
        {
            return [username, password](const protocol::Command &command) -> std::vector<protocol::Reply>
            {
                const uint32_t tag = command.tag;
                auto arg = [&command](const std::string &key)
                {
                    auto it = command.args.find(key);
                    return it != command.args.end() ? it->second : std::string();
                };

                if (command.name == "/login")
                {
                    if (arg("name") == username && arg("password") == password)
                    {
                        return {done_reply(tag)};
                    }
                    return {trap_reply(tag, "invalid user name or password (6)")};
                }
                if (command.name == "/system/resource/print")
                {
                    return {data_reply(tag, {{"version", "7.14.3 (stable)"},
                                             {"uptime", "1w2d3h4m5s"},
                                             {"cpu-load", "7"},
                                             {"free-memory", "912261120"},
                                             {"total-memory", "1073741824"},
                                             {"board-name", "hAP ax3"},
                                             {"architecture-name", "arm64"}}),
                            done_reply(tag)};
                }
                if (command.name == "/system/identity/print")
                {
                    return {data_reply(tag, {{"name", "office-gw"}}), done_reply(tag)};
                }
                if (command.name == "/interface/print")
                {
                    return {data_reply(tag, {{".id", "*1"}, {"name", "ether1"}, {"type", "ether"},
                                             {"running", "true"}, {"disabled", "false"},
                                             {"rx-byte", "5000000000"}, {"tx-byte", "42"}}),
                            data_reply(tag, {{".id", "*2"}, {"name", "wlan1"}, {"type", "wlan"},
                                             {"running", "false"}, {"disabled", "true"}}),
                            done_reply(tag)};
                }
                if (command.name == "/ip/hotspot/active/print")
                {
                    return {data_reply(tag, {{".id", "*A"}, {"user", "guest1"}, {"address", "10.5.50.10"},
                                             {"mac-address", "AA:BB:CC:DD:EE:FF"}, {"uptime", "1h2m"},
                                             {"bytes-in", "1024"}, {"bytes-out", "2048"}}),
                            done_reply(tag)};
                }
                if (command.name == "/ip/hotspot/user/print")
                {
                    return {data_reply(tag, {{".id", "*3"}, {"name", "guest1"}, {"profile", "default"}}),
                            done_reply(tag)};
                }
                if (command.name == "/ip/hotspot/user/add")
                {
                    return {done_reply(tag, {{"ret", "*9"}})};
                }
                if (command.name == "/ip/hotspot/user/remove" || command.name == "/ip/hotspot/active/remove")
                {
                    if (arg("numbers") == "*missing")
                    {
                        return {trap_reply(tag, "no such item")};
                    }
                    return {done_reply(tag)};
                }
                return {trap_reply(tag, "no such command")};
            };
        }

        /**
         * Per-method behaviour for FakeTransportFactory
         */
        struct FakeMethod
        {
            std::optional<core::ErrorCode> open_error;
            Responder responder;
        };

        /**
         * Factory producing FakeTransports; unknown kinds are refused on open
         */
        class FakeTransportFactory : public core::TransportFactory
        {
        public:
            std::unique_ptr<core::TransportInterface> create(core::TransportKind kind) override
            {
                auto link = std::make_shared<FakeLink>();
                auto transport = std::make_unique<FakeTransport>(kind, link);

                std::lock_guard<std::mutex> lock(mutex_);
                created_.push_back(kind);
                links_[kind].push_back(link);

                auto it = methods.find(kind);
                if (it == methods.end())
                {
                    transport->open_error = core::ErrorCode::ConnectRefused;
                }
                else
                {
                    transport->open_error = it->second.open_error;
                    transport->responder = it->second.responder;
                }
                return transport;
            }

            std::vector<core::TransportKind> created()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return created_;
            }

            std::vector<std::shared_ptr<FakeLink>> links(core::TransportKind kind)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return links_[kind];
            }

            std::map<core::TransportKind, FakeMethod> methods;

        private:
            std::mutex mutex_;
            std::vector<core::TransportKind> created_;
            std::map<core::TransportKind, std::vector<std::shared_ptr<FakeLink>>> links_;
        };

    } // namespace testing
} // namespace rosgate

#endif // ROSGATE_TESTS_FAKE_TRANSPORT_HPP
