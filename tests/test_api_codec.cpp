#include <catch2/catch.hpp>

#include "core/errors.hpp"
#include "protocol/api_codec.hpp"

using namespace rosgate;
using namespace rosgate::protocol;

namespace
{
    std::vector<uint8_t> bytes(const std::string &text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
} // namespace

TEST_CASE("Length prefixes use the shortest form", "[codec][api]")
{
    CHECK(api::encode_length(0) == std::vector<uint8_t>{0x00});
    CHECK(api::encode_length(0x7F) == std::vector<uint8_t>{0x7F});
    CHECK(api::encode_length(0x80) == std::vector<uint8_t>{0x80, 0x80});
    CHECK(api::encode_length(0x3FFF) == std::vector<uint8_t>{0xBF, 0xFF});
    CHECK(api::encode_length(0x4000) == std::vector<uint8_t>{0xC0, 0x40, 0x00});
    CHECK(api::encode_length(0x1FFFFF) == std::vector<uint8_t>{0xDF, 0xFF, 0xFF});
    CHECK(api::encode_length(0x200000) == std::vector<uint8_t>{0xE0, 0x20, 0x00, 0x00});
    CHECK(api::encode_length(0x10000000) == std::vector<uint8_t>{0xF0, 0x10, 0x00, 0x00, 0x00});
}

TEST_CASE("Commands become tagged sentences", "[codec][api]")
{
    Command command;
    command.tag = 7;
    command.name = "/ip/hotspot/user/add";
    command.args = {{"name", "guest"}, {"password", "a=b"}};

    Sentence words = api::command_to_sentence(command);
    REQUIRE(words.size() == 4);
    CHECK(words[0] == "/ip/hotspot/user/add");
    CHECK(words[1] == "=name=guest");
    CHECK(words[2] == "=password=a=b");
    CHECK(words[3] == ".tag=7");

    auto encoded = api::encode_sentence({"/login", ".tag=1"});
    std::vector<uint8_t> expected{6};
    auto login = bytes("/login");
    expected.insert(expected.end(), login.begin(), login.end());
    expected.push_back(6);
    auto tag = bytes(".tag=1");
    expected.insert(expected.end(), tag.begin(), tag.end());
    expected.push_back(0);
    CHECK(encoded == expected);
}

TEST_CASE("Reply sentences are classified", "[codec][api]")
{
    SECTION("data with attributes")
    {
        auto reply = api::reply_from_sentence({"!re", "=name=ether1", "=comment=a=b", ".tag=3"});
        REQUIRE(reply);
        CHECK(reply->kind == ReplyKind::Data);
        REQUIRE(reply->tag);
        CHECK(*reply->tag == 3);
        CHECK(reply->attributes.at("name") == "ether1");
        CHECK(reply->attributes.at("comment") == "a=b");
        CHECK_FALSE(reply->is_terminal());
    }

    SECTION("trap carries the router message")
    {
        auto reply = api::reply_from_sentence({"!trap", "=category=2", "=message=no such item", ".tag=4"});
        REQUIRE(reply);
        CHECK(reply->kind == ReplyKind::Trap);
        CHECK(reply->message == "no such item");
        CHECK(reply->is_terminal());
    }

    SECTION("fatal carries a bare reason")
    {
        auto reply = api::reply_from_sentence({"!fatal", "session terminated on request"});
        REQUIRE(reply);
        CHECK(reply->kind == ReplyKind::Fatal);
        CHECK_FALSE(reply->tag);
        CHECK(reply->message == "session terminated on request");
    }

    SECTION("done without a tag")
    {
        auto reply = api::reply_from_sentence({"!done", "=ret=abc"});
        REQUIRE(reply);
        CHECK(reply->kind == ReplyKind::Done);
        CHECK_FALSE(reply->tag);
        CHECK(reply->attributes.at("ret") == "abc");
    }

    SECTION("!empty produces no reply")
    {
        CHECK_FALSE(api::reply_from_sentence({"!empty", ".tag=9"}));
    }

    SECTION("unknown reply word is a protocol error")
    {
        CHECK_THROWS_AS(api::reply_from_sentence({"!bogus"}), core::RouterOsError);
        CHECK_THROWS_AS(api::reply_from_sentence({}), core::RouterOsError);
    }
}

TEST_CASE("SentenceDecoder reassembles split input", "[codec][api]")
{
    Command command;
    command.tag = 12;
    command.name = "!re";
    command.args = {{"comment", std::string(300, 'x')}};
    auto wire = api::encode_sentence(api::command_to_sentence(command));
    auto second = api::encode_sentence({"!done", ".tag=12"});
    wire.insert(wire.end(), second.begin(), second.end());

    SentenceDecoder decoder;
    std::vector<Sentence> sentences;
    for (uint8_t byte : wire)
    {
        auto out = decoder.feed(&byte, 1);
        sentences.insert(sentences.end(), out.begin(), out.end());
    }

    REQUIRE(sentences.size() == 2);
    CHECK(sentences[0][1] == "=comment=" + std::string(300, 'x'));
    CHECK(sentences[0][2] == ".tag=12");
    CHECK(sentences[1] == Sentence{"!done", ".tag=12"});
    CHECK(decoder.buffered() == 0);
}

TEST_CASE("SentenceDecoder holds back incomplete words", "[codec][api]")
{
    SentenceDecoder decoder;
    const uint8_t partial[] = {0x05, '!', 'd', 'o'};
    CHECK(decoder.feed(partial, sizeof(partial)).empty());
    CHECK(decoder.buffered() == sizeof(partial));

    const uint8_t rest[] = {'n', 'e', 0x00};
    auto sentences = decoder.feed(rest, sizeof(rest));
    REQUIRE(sentences.size() == 1);
    CHECK(sentences[0] == Sentence{"!done"});
}

TEST_CASE("SentenceDecoder rejects reserved control bytes", "[codec][api]")
{
    SentenceDecoder decoder;
    const uint8_t control[] = {0xF8, 0x00};
    CHECK_THROWS_AS(decoder.feed(control, sizeof(control)), core::RouterOsError);

    decoder.reset();
    CHECK(decoder.buffered() == 0);
}
