/**
 * @file test_endpoint_probe.cpp
 * @brief Unit tests for HttpEndpointProbe url normalisation and parsing.
 * @author Dimitris Kafetzis
 */

#include "discovery/endpoint_probe.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace beaconfig;
using namespace beaconfig::testing;

namespace {

constexpr const char* METADATA = R"({
    "name": "Lab Server",
    "description": "Configuration for the lab",
    "base_url": "http://10.0.0.2:8000/f/",
    "claim_url": "http://10.0.0.2:8000/f/claim/",
    "version": "0.4.1"
})";

}  // namespace

TEST(EndpointProbeTest, FetchesWellKnownDocument) {
    FakeHttpClient http;
    http.on_get("http://10.0.0.2:8000/f/.well-known/fakts", json_response(200, METADATA));

    HttpEndpointProbe probe(http, ProbeConfig{});
    auto endpoint = probe.probe("http://10.0.0.2:8000/f");

    ASSERT_TRUE(endpoint.has_value()) << endpoint.error().describe();
    EXPECT_EQ(endpoint->name, "Lab Server");
    EXPECT_EQ(endpoint->base_url, "http://10.0.0.2:8000/f/");
    ASSERT_TRUE(endpoint->claim_url.has_value());
    EXPECT_EQ(*endpoint->claim_url, "http://10.0.0.2:8000/f/claim/");
    EXPECT_EQ(endpoint->version, std::optional<std::string>{"0.4.1"});
    EXPECT_FALSE(endpoint->retrieve_url.has_value());
}

TEST(EndpointProbeTest, CandidateUrlsAppendSlashAndProtocols) {
    FakeHttpClient http;
    ProbeConfig config;
    config.auto_protocols = {"https", "http"};
    HttpEndpointProbe probe(http, config);

    EXPECT_EQ(probe.candidate_urls("host:8000/f"),
              (std::vector<std::string>{"https://host:8000/f/", "http://host:8000/f/"}));
    EXPECT_EQ(probe.candidate_urls("http://host/f/"),
              (std::vector<std::string>{"http://host/f/"}));

    config.allow_appending_slash = false;
    HttpEndpointProbe no_slash(http, config);
    EXPECT_EQ(no_slash.candidate_urls("http://host/f"),
              (std::vector<std::string>{"http://host/f"}));
}

TEST(EndpointProbeTest, FallsBackToNextProtocol) {
    FakeHttpClient http;
    http.on_get("http://host/f/.well-known/fakts", json_response(200, R"({"name":"Plain"})"));

    ProbeConfig config;
    config.auto_protocols = {"https", "http"};
    HttpEndpointProbe probe(http, config);

    auto endpoint = probe.probe("host/f");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->name, "Plain");
    EXPECT_EQ(endpoint->base_url, "http://host/f/");
    EXPECT_EQ(http.calls().size(), 2u);
}

TEST(EndpointProbeTest, NonSuccessStatusIsHttpStatus) {
    FakeHttpClient http;
    http.on_get("http://host/.well-known/fakts", json_response(404, "not found"));

    HttpEndpointProbe probe(http, ProbeConfig{});
    auto endpoint = probe.probe("http://host/");
    ASSERT_FALSE(endpoint.has_value());
    EXPECT_EQ(endpoint.error().code, ErrorCode::HttpStatus);
    EXPECT_TRUE(is_recoverable_probe_failure(endpoint.error().code));
}

TEST(EndpointProbeTest, TransportFailurePassesThrough) {
    FakeHttpClient http;
    HttpEndpointProbe probe(http, ProbeConfig{});

    auto endpoint = probe.probe("http://nowhere/");
    ASSERT_FALSE(endpoint.has_value());
    EXPECT_EQ(endpoint.error().code, ErrorCode::Transport);
}

TEST(EndpointProbeTest, MalformedMetadataIsPayload) {
    FakeHttpClient http;
    http.on_get("http://a/.well-known/fakts", json_response(200, "<html>"));
    http.on_get("http://b/.well-known/fakts", json_response(200, R"({"name": 7})"));

    HttpEndpointProbe probe(http, ProbeConfig{});

    auto html = probe.probe("http://a/");
    ASSERT_FALSE(html.has_value());
    EXPECT_EQ(html.error().code, ErrorCode::Payload);

    auto bad_name = probe.probe("http://b/");
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_EQ(bad_name.error().code, ErrorCode::Payload);
}

TEST(EndpointProbeTest, CancelledProbeStopsTryingProtocols) {
    FakeHttpClient http;
    ProbeConfig config;
    config.auto_protocols = {"https", "http"};
    HttpEndpointProbe probe(http, config);

    std::stop_source stop_source;
    stop_source.request_stop();

    auto endpoint = probe.probe("host/", stop_source.get_token());
    ASSERT_FALSE(endpoint.has_value());
    EXPECT_EQ(endpoint.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(http.calls().size(), 1u);
}

TEST(EndpointProbeTest, ParseDefaultsNameAndBase) {
    auto endpoint = HttpEndpointProbe::parse_endpoint("{}", "http://host/f/");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->base_url, "http://host/f/");
    EXPECT_EQ(endpoint->name, "Helper");
}
