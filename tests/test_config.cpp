#include <catch2/catch.hpp>

#include <fstream>

#include "core/config.hpp"
#include "core/connection_config.hpp"
#include "core/errors.hpp"
#include "support/temp_path.hpp"

using namespace rosgate;
using core::GatewayConfig;
using core::TransportKind;
using rosgate::testing::TempPath;

TEST_CASE("Default gateway configuration is valid", "[config]")
{
    auto config = GatewayConfig::create_default();
    CHECK(config->validate());
    CHECK(config->method_priority() ==
          std::vector<TransportKind>{TransportKind::Api, TransportKind::WebSocket, TransportKind::Rest});
    CHECK(config->session_options().command_timeout == std::chrono::milliseconds(30000));
    CHECK_FALSE(config->router);
}

TEST_CASE("Gateway configuration loads from JSON", "[config]")
{
    auto config = GatewayConfig::from_json(nlohmann::json::parse(R"({
        "methods": ["rest", "api"],
        "timeouts": {"connect_ms": 2000, "command_ms": 0},
        "storage": {"backend": "json", "path": "/var/lib/rosgate/router.json"},
        "logging": {"log_level": "DEBUG", "log_file": null},
        "router": {"host": "192.168.88.1", "username": "admin", "password": "x", "secure": true}
    })"));

    CHECK(config->method_priority() == std::vector<TransportKind>{TransportKind::Rest, TransportKind::Api});
    CHECK(config->timeouts.connect_ms == 2000);
    CHECK(config->timeouts.login_ms == 10000);
    CHECK(config->session_options().command_timeout.count() == 0);
    CHECK(config->storage.backend == "json");
    CHECK(config->logging.log_level == "DEBUG");
    CHECK(config->logging.log_file.empty());
    REQUIRE(config->router);
    CHECK(config->router->api_port() == core::DEFAULT_API_SSL_PORT);
    CHECK(config->validate());
}

TEST_CASE("Gateway configuration survives a save and reload", "[config]")
{
    TempPath path(".json");

    auto config = GatewayConfig::create_default();
    config->storage.path = "custom.db";
    config->logging.log_file = "rosgate.log";
    core::ConnectionConfig router;
    router.host = "10.1.1.1";
    router.username = "ops";
    config->router = router;
    config->save_to_file(path.str());

    auto loaded = GatewayConfig::from_file(path.str());
    CHECK(loaded->storage.path == "custom.db");
    CHECK(loaded->logging.log_file == "rosgate.log");
    REQUIRE(loaded->router);
    CHECK(*loaded->router == router);
}

TEST_CASE("Invalid gateway configurations are rejected", "[config]")
{
    SECTION("missing file")
    {
        CHECK_THROWS_AS(GatewayConfig::from_file("/nonexistent/rosgate.json"), std::runtime_error);
    }

    SECTION("broken JSON")
    {
        TempPath path(".json");
        {
            std::ofstream file(path.str());
            file << "{\"methods\": [";
        }
        CHECK_THROWS_AS(GatewayConfig::from_file(path.str()), std::runtime_error);
    }

    SECTION("unknown method")
    {
        auto config = GatewayConfig::from_json(nlohmann::json{{"methods", {"api", "telnet"}}});
        CHECK_FALSE(config->validate());
        CHECK_THROWS_AS(config->method_priority(), std::invalid_argument);
    }

    SECTION("unknown storage backend")
    {
        auto config = GatewayConfig::create_default();
        config->storage.backend = "redis";
        CHECK_FALSE(config->validate());
    }

    SECTION("router without a host")
    {
        auto config = GatewayConfig::create_default();
        config->router = core::ConnectionConfig{};
        CHECK_FALSE(config->validate());
    }

    SECTION("methods must be a list")
    {
        CHECK_THROWS_AS(GatewayConfig::from_json(nlohmann::json{{"methods", "api"}}), std::invalid_argument);
    }
}

TEST_CASE("Connection configuration defaults follow the secure flag", "[config]")
{
    core::ConnectionConfig config;
    config.host = "192.0.2.1";
    config.username = "admin";

    CHECK(config.endpoint_for(TransportKind::Api).port == 8728);
    CHECK(config.endpoint_for(TransportKind::WebSocket).port == 8729);
    CHECK(config.endpoint_for(TransportKind::Rest).port == 80);

    config.secure = true;
    CHECK(config.endpoint_for(TransportKind::Api).port == 8729);
    CHECK(config.endpoint_for(TransportKind::Rest).port == 443);
    CHECK(config.endpoint_for(TransportKind::Rest).secure);

    config.port = 9000;
    config.rest_port = 8080;
    CHECK(config.websocket_port() == 9001);
    CHECK(config.effective_rest_port() == 8080);
    CHECK(config.key() == "192.0.2.1:9000");

    std::string problem;
    config.port = 65535;
    CHECK_FALSE(config.validate(&problem));
    CHECK_FALSE(problem.empty());
}

TEST_CASE("Every error code has a remediation step", "[errors]")
{
    CHECK(std::string(core::remediation_step(core::ErrorCode::ConnectTimeout)) == "reachability");
    CHECK(std::string(core::remediation_step(core::ErrorCode::AuthFailed)) == "authentication");
    CHECK(std::string(core::remediation_step(core::ErrorCode::ProtocolError)) == "protocol");
    CHECK(std::string(core::remediation_step(core::ErrorCode::CommandFailed)) == "command");
    CHECK(std::string(core::remediation_step(core::ErrorCode::SessionClosed)) == "session");
    CHECK(std::string(core::to_string(core::ErrorCode::NoMethodAvailable)) == "NoMethodAvailable");
}
