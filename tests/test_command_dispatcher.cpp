#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <thread>

#include "core/errors.hpp"
#include "services/command_dispatcher.hpp"
#include "support/fake_transport.hpp"

using namespace rosgate;
using namespace rosgate::testing;
using services::CommandDispatcher;
using services::CommandResult;

namespace
{
    constexpr std::chrono::milliseconds NO_DEADLINE{0};

    struct DispatcherFixture
    {
        FakeTransport transport;
        CommandDispatcher dispatcher{transport};

        DispatcherFixture()
        {
            transport.set_message_handler([this](const protocol::Reply &reply)
                                          { dispatcher.on_reply(reply); });
            core::Endpoint endpoint;
            endpoint.host = "192.0.2.1";
            endpoint.port = 8728;
            transport.open(endpoint, std::chrono::milliseconds(100));
        }
    };

    core::ErrorCode error_code_of(std::future<CommandResult> &future)
    {
        try
        {
            future.get();
        }
        catch (const core::RouterOsError &e)
        {
            return e.code();
        }
        FAIL("future completed without an error");
        return core::ErrorCode::ProtocolError;
    }
} // namespace

TEST_CASE_METHOD(DispatcherFixture, "Tags are retired exactly once", "[dispatcher]")
{
    std::atomic<int> completions{0};
    uint32_t tag = dispatcher.submit("/interface/print", {}, NO_DEADLINE,
                                     [&completions](CommandResult, std::exception_ptr)
                                     { completions++; });
    REQUIRE(tag != 0);
    CHECK(dispatcher.is_pending(tag));

    transport.inject(done_reply(tag));
    transport.inject(done_reply(tag));
    transport.inject(trap_reply(tag, "late"));

    CHECK(completions == 1);
    CHECK_FALSE(dispatcher.is_pending(tag));
    CHECK(dispatcher.get_statistics().completed == 1);
    CHECK(dispatcher.get_statistics().discarded_replies == 2);
}

TEST_CASE_METHOD(DispatcherFixture, "Replies for unknown tags leave pending commands alone", "[dispatcher]")
{
    auto future = dispatcher.submit("/ip/hotspot/active/print", {}, NO_DEADLINE);
    uint32_t tag = dispatcher.last_tag();

    transport.inject(done_reply(tag + 100));
    transport.inject(data_reply(tag + 100, {{"user", "intruder"}}));

    protocol::Reply untagged;
    untagged.kind = protocol::ReplyKind::Done;
    transport.inject(untagged);

    CHECK(dispatcher.pending_count() == 1);
    CHECK(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout);
    CHECK(dispatcher.get_statistics().discarded_replies == 3);

    transport.inject(done_reply(tag));
    CHECK(future.get().data.empty());
}

TEST_CASE_METHOD(DispatcherFixture, "Interleaved replies complete the right commands", "[dispatcher]")
{
    auto first = dispatcher.submit("/interface/print", {}, NO_DEADLINE);
    uint32_t a = dispatcher.last_tag();
    auto second = dispatcher.submit("/ip/hotspot/user/print", {}, NO_DEADLINE);
    uint32_t b = dispatcher.last_tag();
    REQUIRE(a != b);

    transport.inject(data_reply(b, {{"name", "guest1"}}));
    transport.inject(data_reply(a, {{"name", "ether1"}}));
    transport.inject(data_reply(b, {{"name", "guest2"}}));
    transport.inject(done_reply(b));
    transport.inject(done_reply(a, {{"ret", "x"}}));

    auto users = second.get();
    REQUIRE(users.data.size() == 2);
    CHECK(users.data[0].at("name") == "guest1");
    CHECK(users.data[1].at("name") == "guest2");

    auto interfaces = first.get();
    REQUIRE(interfaces.data.size() == 1);
    CHECK(interfaces.data[0].at("name") == "ether1");
    CHECK(interfaces.done.at("ret") == "x");
}

TEST_CASE_METHOD(DispatcherFixture, "Trap fails the command with the router message", "[dispatcher]")
{
    auto future = dispatcher.submit("/ip/hotspot/user/remove", {{"numbers", "*99"}}, NO_DEADLINE);
    transport.inject(trap_reply(dispatcher.last_tag(), "no such item"));

    try
    {
        future.get();
        FAIL("expected CommandFailed");
    }
    catch (const core::RouterOsError &e)
    {
        CHECK(e.code() == core::ErrorCode::CommandFailed);
        CHECK(std::string(e.what()) == "no such item");
    }
}

TEST_CASE_METHOD(DispatcherFixture, "Closing rejects every pending command", "[dispatcher]")
{
    const int pending = 5;
    std::vector<std::future<CommandResult>> futures;
    for (int i = 0; i < pending; ++i)
    {
        futures.push_back(dispatcher.submit("/interface/print", {}, NO_DEADLINE));
    }
    REQUIRE(dispatcher.pending_count() == pending);

    dispatcher.fail_all("Session disconnected");

    for (auto &future : futures)
    {
        CHECK(error_code_of(future) == core::ErrorCode::SessionClosed);
    }
    CHECK(dispatcher.pending_count() == 0);
    CHECK(dispatcher.is_closed());

    auto after = dispatcher.submit("/interface/print", {}, NO_DEADLINE);
    CHECK(error_code_of(after) == core::ErrorCode::SessionClosed);
    CHECK(transport.link()->commands().size() == static_cast<size_t>(pending));
}

TEST_CASE_METHOD(DispatcherFixture, "A throwing completion after close does not escape submit", "[dispatcher]")
{
    dispatcher.fail_all("Session disconnected");

    bool called = false;
    bool had_error = false;
    uint32_t tag = 0;
    CHECK_NOTHROW(tag = dispatcher.submit("/interface/print", {}, NO_DEADLINE,
                                          [&called, &had_error](CommandResult, std::exception_ptr error)
                                          {
                                              called = true;
                                              had_error = static_cast<bool>(error);
                                              throw std::runtime_error("completion failed");
                                          }));
    CHECK(called);
    CHECK(had_error);
    CHECK(tag == 0);
}

TEST_CASE_METHOD(DispatcherFixture, "Trap category travels with the command error", "[dispatcher]")
{
    auto future = dispatcher.submit("/login", {}, NO_DEADLINE);
    auto trap = trap_reply(dispatcher.last_tag(), "Unauthorized");
    trap.attributes["category"] = protocol::TRAP_CATEGORY_AUTHENTICATION;
    transport.inject(trap);

    try
    {
        future.get();
        FAIL("expected CommandFailed");
    }
    catch (const core::CommandError &e)
    {
        CHECK(e.code() == core::ErrorCode::CommandFailed);
        CHECK(e.category() == "authentication");
    }

    auto plain = dispatcher.submit("/interface/print", {}, NO_DEADLINE);
    transport.inject(trap_reply(dispatcher.last_tag(), "no such command"));
    try
    {
        plain.get();
        FAIL("expected CommandFailed");
    }
    catch (const core::CommandError &e)
    {
        CHECK(e.category().empty());
    }
}

TEST_CASE_METHOD(DispatcherFixture, "A late reply after the timeout is discarded", "[dispatcher]")
{
    auto future = dispatcher.submit("/system/resource/print", {}, std::chrono::milliseconds(50));
    uint32_t tag = dispatcher.last_tag();

    REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    CHECK(error_code_of(future) == core::ErrorCode::CommandTimeout);

    transport.inject(data_reply(tag, {{"version", "7.14"}}));
    transport.inject(done_reply(tag));

    auto stats = dispatcher.get_statistics();
    CHECK(stats.timed_out == 1);
    CHECK(stats.discarded_replies == 2);
    CHECK(stats.completed == 0);
}

TEST_CASE_METHOD(DispatcherFixture, "Synchronous transports complete inside submit", "[dispatcher]")
{
    transport.responder = [](const protocol::Command &command) -> std::vector<protocol::Reply>
    {
        return {data_reply(command.tag, {{"name", "a"}}), done_reply(command.tag)};
    };

    auto future = dispatcher.submit("/interface/print", {}, NO_DEADLINE);
    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    CHECK(future.get().data.size() == 1);
    CHECK(dispatcher.pending_count() == 0);
}

TEST_CASE("Send failures complete the command", "[dispatcher]")
{
    FakeTransport transport;
    CommandDispatcher dispatcher(transport);

    auto future = dispatcher.submit("/interface/print", {}, NO_DEADLINE);
    CHECK(error_code_of(future) == core::ErrorCode::NotOpen);
    CHECK(dispatcher.pending_count() == 0);
    CHECK(dispatcher.get_statistics().failed == 1);
}

TEST_CASE("Tags are unique across concurrent submitters", "[dispatcher]")
{
    FakeTransport transport;
    CommandDispatcher dispatcher(transport);
    core::Endpoint endpoint;
    endpoint.host = "192.0.2.1";
    transport.open(endpoint, std::chrono::milliseconds(100));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&dispatcher]()
                             {
                                 for (int i = 0; i < 50; ++i)
                                 {
                                     dispatcher.submit("/interface/print", {}, NO_DEADLINE,
                                                       [](CommandResult, std::exception_ptr) {});
                                 } });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    auto sent = transport.link()->commands();
    REQUIRE(sent.size() == 200);
    std::set<uint32_t> tags;
    for (const auto &command : sent)
    {
        tags.insert(command.tag);
    }
    CHECK(tags.size() == 200);
    CHECK(dispatcher.pending_count() == 200);
}
