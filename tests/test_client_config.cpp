#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include "client_config.h"
#include "network_errors.h"

using Catch::Approx;
using nlohmann::json;

TEST_CASE("Default config is valid") {
    ClientConfig config;
    REQUIRE_NOTHROW(config.Validate());
    REQUIRE(config.tcpPort == NetworkConstants::DEFAULT_TCP_PORT);
    REQUIRE(config.autoReconnect);
}

TEST_CASE("FromJson overrides only the keys present") {
    json root = {
        {"host", "race.example.com"},
        {"tcp_port", 9000},
        {"player_name", "Kimi"},
        {"heartbeat_interval", 2.0},
        {"heartbeat_timeout", 6.0},
        {"auto_reconnect", false},
        {"some_future_key", 1}
    };

    ClientConfig config = ClientConfig::FromJson(root);
    REQUIRE(config.host == "race.example.com");
    REQUIRE(config.tcpPort == 9000);
    REQUIRE(config.udpPort == NetworkConstants::DEFAULT_UDP_PORT);
    REQUIRE(config.playerName == "Kimi");
    REQUIRE(config.heartbeatInterval == Approx(2.0f));
    REQUIRE_FALSE(config.autoReconnect);

    Credentials credentials = config.GetCredentials();
    REQUIRE(credentials.host == "race.example.com");
    REQUIRE(credentials.tcpPort == 9000);
}

TEST_CASE("Config values of the wrong type are rejected") {
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"use_tls", "yes"} }), ConfigError);
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"tcp_port", "7777"} }), ConfigError);
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json::array()), ConfigError);
}

TEST_CASE("Out-of-range config values are rejected") {
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"tcp_port", 70000} }), ConfigError);
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"host", "bad host!"} }), ConfigError);
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"heartbeat_interval", 20.0} }), ConfigError);
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"encrypt_udp", true} }), ConfigError);
    REQUIRE_THROWS_AS(ClientConfig::FromJson(json{ {"max_reconnect_attempts", 0} }), ConfigError);
}

TEST_CASE("Local UDP port may be zero for an ephemeral port") {
    ClientConfig config = ClientConfig::FromJson(json{ {"local_udp_port", 0} });
    REQUIRE(config.localUdpPort == 0);
}

TEST_CASE("Credentials validation names the bad field") {
    Credentials credentials;
    credentials.host = "127.0.0.1";
    credentials.playerName = "";
    REQUIRE_THROWS_AS(credentials.Validate(), ConfigError);

    credentials.playerName = "Lewis";
    REQUIRE_NOTHROW(credentials.Validate());

    credentials.tcpPort = 0;
    REQUIRE_THROWS_AS(credentials.Validate(), ConfigError);
}

TEST_CASE("LoadFromFile reads a config file and reports missing ones") {
    const char* path = "racenet_test_config.json";
    {
        std::ofstream file(path);
        file << R"({"player_name":"FromFile","encrypt_udp":true,"udp_shared_secret":"s3cret"})";
    }

    ClientConfig config = ClientConfig::LoadFromFile(path);
    REQUIRE(config.playerName == "FromFile");
    REQUIRE(config.encryptUdp);
    std::remove(path);

    REQUIRE_THROWS_AS(ClientConfig::LoadFromFile("does_not_exist.json"), ConfigError);
}
