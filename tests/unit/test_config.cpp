/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace beaconfig;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "beaconfig_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.discovery.mode, "advertised");
    EXPECT_EQ(config.discovery.broadcast_port, 45678);
    EXPECT_EQ(config.discovery.magic_phrase, "beacon-fakts");
    EXPECT_TRUE(config.discovery.bind_address.empty());
    EXPECT_FALSE(config.discovery.strict);
    EXPECT_EQ(config.discovery.static_endpoint.base_url, "http://localhost:8000/f/");
    EXPECT_EQ(config.discovery.static_endpoint.name, "Helper");
    EXPECT_EQ(config.probe.well_known_path, ".well-known/fakts");
    EXPECT_EQ(config.grant.demander, "static");
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [discovery]
        mode = "static"
        bind_address = "127.0.0.1"
        broadcast_port = 50000
        magic_phrase = "my-beacon"
        strict = true
        poll_interval_ms = 25

        [discovery.static]
        base_url = "https://config.lan/f/"
        name = "Lab"
        claim_url = "https://config.lan/f/claim/"

        [probe]
        timeout_ms = 1500
        allow_appending_slash = false
        auto_protocols = ["https", "http"]
        well_known_path = "meta.json"

        [http]
        ca_file = "/etc/ssl/lab.pem"
        verify_peer = false

        [grant]
        demander = "device_code"
        scopes = ["read", "write"]
        client_name = "camera-7"
        secure = true
        claim_timeout_ms = 2000

        [grant.device_code]
        poll_interval_ms = 250
        expiration_s = 60

        [telemetry]
        log_dir = "/tmp/beaconfig_logs"
        log_level = "debug"
        max_file_size_mb = 2
        rotate_count = 5
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.discovery.mode, "static");
    EXPECT_EQ(config.discovery.bind_address, "127.0.0.1");
    EXPECT_EQ(config.discovery.broadcast_port, 50000);
    EXPECT_EQ(config.discovery.magic_phrase, "my-beacon");
    EXPECT_TRUE(config.discovery.strict);
    EXPECT_EQ(config.discovery.poll_interval_ms, 25u);
    EXPECT_EQ(config.discovery.static_endpoint.base_url, "https://config.lan/f/");
    EXPECT_EQ(config.discovery.static_endpoint.name, "Lab");
    ASSERT_TRUE(config.discovery.static_endpoint.claim_url.has_value());
    EXPECT_EQ(*config.discovery.static_endpoint.claim_url, "https://config.lan/f/claim/");
    EXPECT_EQ(config.probe.timeout_ms, 1500u);
    EXPECT_FALSE(config.probe.allow_appending_slash);
    EXPECT_EQ(config.probe.auto_protocols, (std::vector<std::string>{"https", "http"}));
    EXPECT_EQ(config.probe.well_known_path, "meta.json");
    EXPECT_EQ(config.http.ca_file, "/etc/ssl/lab.pem");
    EXPECT_FALSE(config.http.verify_peer);
    EXPECT_EQ(config.grant.demander, "device_code");
    EXPECT_EQ(config.grant.scopes, (std::vector<std::string>{"read", "write"}));
    EXPECT_EQ(config.grant.client_name, "camera-7");
    EXPECT_TRUE(config.grant.secure);
    EXPECT_EQ(config.grant.device_code.poll_interval_ms, 250u);
    EXPECT_EQ(config.grant.device_code.expiration_s, 60u);
    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/beaconfig_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.rotate_count, 5u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [grant]
        token = "pre-shared"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->grant.token, "pre-shared");
    // Defaults for everything else
    EXPECT_EQ(result->discovery.broadcast_port, 45678);
    EXPECT_EQ(result->discovery.mode, "advertised");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, PortOutOfRange) {
    auto path = write_toml(R"(
        [discovery]
        broadcast_port = 70000
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, NegativePollIntervalRejected) {
    auto path = write_toml(R"(
        [discovery]
        poll_interval_ms = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_NE(result.error().message.find("discovery.poll_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, OversizedPollIntervalRejected) {
    auto path = write_toml(R"(
        [discovery]
        poll_interval_ms = 4294967295
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, NegativeDurationsAndSizesRejected) {
    const char* cases[] = {
        "[probe]\ntimeout_ms = -5\n",
        "[grant]\nclaim_timeout_ms = -1\n",
        "[grant.device_code]\npoll_interval_ms = -1\n",
        "[grant.device_code]\nexpiration_s = 3000000000\n",
        "[telemetry]\nmax_file_size_mb = -10\n",
        "[telemetry]\nrotate_count = -3\n",
    };
    for (const char* content : cases) {
        auto result = load_config(write_toml(content));
        ASSERT_FALSE(result.has_value()) << content;
        EXPECT_EQ(result.error().code, ErrorCode::Config) << content;
    }
}

TEST_F(ConfigTest, ValidateRejectsLongListenPoll) {
    auto config = default_config();
    config.discovery.poll_interval_ms = 4294967295u;
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, UnknownModesRejected) {
    auto config = default_config();
    config.discovery.mode = "multicast";
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.grant.demander = "password";
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.telemetry.log_level = "verbose";
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, ClaimRequestFromGrant) {
    GrantConfig grant;
    grant.client_name = "sensor";
    grant.scopes = {"read"};
    grant.secure = true;
    grant.token = "secret";

    auto request = claim_request_from(grant);
    EXPECT_EQ(request.client_name, "sensor");
    EXPECT_EQ(request.scopes, std::vector<std::string>{"read"});
    EXPECT_TRUE(request.secure);
}
