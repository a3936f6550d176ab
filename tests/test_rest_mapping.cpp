#include <catch2/catch.hpp>

#include "core/errors.hpp"
#include "protocol/rest_mapping.hpp"

using namespace rosgate;
using namespace rosgate::protocol;

namespace
{
    Command make_command(const std::string &name, Attributes args = {})
    {
        Command command;
        command.tag = 1;
        command.name = name;
        command.args = std::move(args);
        return command;
    }
} // namespace

TEST_CASE("Commands map onto REST verbs", "[rest]")
{
    SECTION("login checks credentials on the resource menu")
    {
        auto request = rest::map_command(make_command("/login", {{"name", "admin"}}));
        CHECK(request.method == "GET");
        CHECK(request.path == "/rest/system/resource");
        CHECK_FALSE(request.body);
    }

    SECTION("print is a GET with a query")
    {
        auto request = rest::map_command(make_command("/interface/print", {{"type", "ether"}}));
        CHECK(request.method == "GET");
        CHECK(request.path == "/rest/interface?type=ether");
    }

    SECTION("add is a PUT with a body")
    {
        auto request = rest::map_command(make_command("/ip/hotspot/user/add", {{"name", "guest"}, {"profile", "default"}}));
        CHECK(request.method == "PUT");
        CHECK(request.path == "/rest/ip/hotspot/user");
        REQUIRE(request.body);
        CHECK((*request.body)["name"] == "guest");
    }

    SECTION("remove is a DELETE of the item")
    {
        auto request = rest::map_command(make_command("/ip/hotspot/active/remove", {{"numbers", "*1F"}}));
        CHECK(request.method == "DELETE");
        CHECK(request.path == "/rest/ip/hotspot/active/*1F");
    }

    SECTION("set is a PATCH without the id in the body")
    {
        auto request = rest::map_command(make_command("/ip/hotspot/user/set", {{".id", "*3"}, {"disabled", "true"}}));
        CHECK(request.method == "PATCH");
        CHECK(request.path == "/rest/ip/hotspot/user/*3");
        REQUIRE(request.body);
        CHECK_FALSE(request.body->contains(".id"));
        CHECK((*request.body)["disabled"] == "true");
    }

    SECTION("other verbs are POSTs")
    {
        auto request = rest::map_command(make_command("/system/reboot"));
        CHECK(request.method == "POST");
        CHECK(request.path == "/rest/system/reboot");
    }

    SECTION("relative names are rejected")
    {
        CHECK_THROWS_AS(rest::map_command(make_command("interface/print")), std::invalid_argument);
    }
}

TEST_CASE("REST responses become replies", "[rest]")
{
    SECTION("array listing")
    {
        auto replies = rest::replies_from_response(4, "GET", 200, R"([{"name":"a"},{"name":"b"}])");
        REQUIRE(replies.size() == 3);
        CHECK(replies[0].kind == ReplyKind::Data);
        CHECK(replies[1].attributes.at("name") == "b");
        CHECK(replies[2].kind == ReplyKind::Done);
        CHECK(*replies[2].tag == 4);
    }

    SECTION("created item reports its id")
    {
        auto replies = rest::replies_from_response(5, "PUT", 201, R"({".id":"*A","name":"guest"})");
        REQUIRE(replies.size() == 2);
        CHECK(replies[1].attributes.at("ret") == "*A");
    }

    SECTION("empty body is a bare done")
    {
        auto replies = rest::replies_from_response(6, "DELETE", 204, "");
        REQUIRE(replies.size() == 1);
        CHECK(replies[0].kind == ReplyKind::Done);
    }

    SECTION("authentication failure is a categorised trap")
    {
        auto replies = rest::replies_from_response(7, "GET", 401, R"({"error":401,"message":"Unauthorized"})");
        REQUIRE(replies.size() == 1);
        CHECK(replies[0].kind == ReplyKind::Trap);
        CHECK(replies[0].message == "Unauthorized");
        CHECK(replies[0].attributes.at("category") == "authentication");
    }

    SECTION("error detail wins over the status line")
    {
        auto replies = rest::replies_from_response(8, "DELETE", 404, R"({"detail":"no such item","error":404})");
        CHECK(replies[0].message == "no such item");
        CHECK(replies[0].attributes.at("status") == "404");
        CHECK(replies[0].attributes.at("category") == "http");

        auto plain = rest::replies_from_response(9, "GET", 500, "<html>oops</html>");
        CHECK(plain[0].message == "HTTP 500");
        CHECK(plain[0].attributes.at("category") == "http");
    }

    SECTION("success with a non-JSON body is a protocol error")
    {
        CHECK_THROWS_AS(rest::replies_from_response(10, "GET", 200, "<html>"), core::RouterOsError);
    }
}

TEST_CASE("REST helpers", "[rest]")
{
    CHECK(rest::url_encode("a b/c*") == "a%20b%2Fc*");
    CHECK(rest::basic_authorization("admin", "secret") == "Basic YWRtaW46c2VjcmV0");
}
