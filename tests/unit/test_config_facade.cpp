/**
 * @file test_config_facade.cpp
 * @brief Unit tests for ConfigFacade caching, single-flight and group selection.
 * @author Dimitris Kafetzis
 */

#include "facade/client_stack.hpp"
#include "facade/config_facade.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

using namespace beaconfig;
using namespace beaconfig::testing;

namespace {

ConfigMapping claimed_mapping() {
    return ConfigMapping{
        {"groupA", nlohmann::json{{"endpoint", "http://10.0.0.5"}, {"retries", 3}}},
        {"groupB", nlohmann::json{{"nested", {{"inner", {{"flag", true}}}}}}},
        {"version", 7}
    };
}

}  // namespace

class ConfigFacadeTest : public ::testing::Test {
protected:
    std::shared_ptr<CaptureSink::Lines> lines_;
    std::unique_ptr<Logger> logger_ = make_capture_logger(lines_);
    FakeDiscovery discovery_{make_endpoint("http://10.0.0.2:8000/f/"), std::chrono::milliseconds(150)};
    FakeDemander demander_{Token{"tok"}};
    FakeClaimer claimer_{claimed_mapping()};
    ConfigFacade facade_{discovery_, demander_, claimer_, ClaimRequest{}, *logger_};
};

TEST_F(ConfigFacadeTest, FirstResolveRunsOneCycle) {
    auto group = facade_.resolve("groupA");

    ASSERT_TRUE(group.has_value()) << group.error().describe();
    EXPECT_EQ(group->at("retries"), 3);
    EXPECT_EQ(facade_.cycle_count(), 1u);
    EXPECT_EQ(discovery_.calls(), 1);
    EXPECT_EQ(demander_.calls(), 1);
    EXPECT_EQ(claimer_.calls(), 1);
    EXPECT_TRUE(facade_.has_cached("groupA"));
}

TEST_F(ConfigFacadeTest, CachedResolveDoesNoNetworkWork) {
    ASSERT_TRUE(facade_.resolve("groupA").has_value());
    auto again = facade_.resolve("groupA");

    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(facade_.cycle_count(), 1u);
    EXPECT_EQ(discovery_.calls(), 1);
    EXPECT_EQ(claimer_.calls(), 1);
}

TEST_F(ConfigFacadeTest, BypassCacheRunsNewCycle) {
    ASSERT_TRUE(facade_.resolve("groupA").has_value());
    auto fresh = facade_.resolve("groupA", /*bypass_cache=*/true);

    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(facade_.cycle_count(), 2u);
    EXPECT_EQ(discovery_.calls(), 2);
}

TEST_F(ConfigFacadeTest, ConcurrentResolvesShareOneCycle) {
    std::optional<Result<ConfigMapping>> first;
    std::optional<Result<ConfigMapping>> second;

    {
        std::jthread a([&] { first.emplace(facade_.resolve("groupA")); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::jthread b([&] { second.emplace(facade_.resolve("groupA")); });
    }

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(first->has_value());
    ASSERT_TRUE(second->has_value());
    EXPECT_EQ(**first, **second);
    EXPECT_EQ(facade_.cycle_count(), 1u);
    EXPECT_EQ(discovery_.calls(), 1);
}

TEST_F(ConfigFacadeTest, DifferentKeysRunIndependently) {
    ASSERT_TRUE(facade_.resolve("groupA").has_value());
    ASSERT_TRUE(facade_.resolve("groupB").has_value());

    EXPECT_EQ(facade_.cycle_count(), 2u);
    EXPECT_TRUE(facade_.has_cached("groupA"));
    EXPECT_TRUE(facade_.has_cached("groupB"));
}

TEST_F(ConfigFacadeTest, EmptyKeyReturnsWholeMapping) {
    auto all = facade_.resolve("");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(*all, claimed_mapping());
}

TEST_F(ConfigFacadeTest, MissingGroupIsNotCached) {
    auto missing = facade_.resolve("groupZ");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::MissingGroup);
    EXPECT_FALSE(facade_.has_cached("groupZ"));

    auto retry = facade_.resolve("groupZ");
    EXPECT_FALSE(retry.has_value());
    EXPECT_EQ(facade_.cycle_count(), 2u);
}

TEST_F(ConfigFacadeTest, InvalidateForcesNextCycle) {
    ASSERT_TRUE(facade_.resolve("groupA").has_value());
    ASSERT_TRUE(facade_.resolve("groupB").has_value());

    facade_.invalidate("groupA");
    EXPECT_FALSE(facade_.has_cached("groupA"));
    EXPECT_TRUE(facade_.has_cached("groupB"));

    facade_.invalidate_all();
    EXPECT_FALSE(facade_.has_cached("groupB"));

    ASSERT_TRUE(facade_.resolve("groupA").has_value());
    EXPECT_EQ(facade_.cycle_count(), 3u);
}

TEST_F(ConfigFacadeTest, WaiterCanLeaveEarly) {
    std::optional<Result<ConfigMapping>> leader;
    std::optional<Result<ConfigMapping>> waiter;
    std::stop_source waiter_stop;

    {
        std::jthread a([&] { leader.emplace(facade_.resolve("groupA")); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::jthread b([&] { waiter.emplace(facade_.resolve("groupA", false, waiter_stop.get_token())); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        waiter_stop.request_stop();
    }

    ASSERT_TRUE(waiter.has_value());
    ASSERT_FALSE(waiter->has_value());
    EXPECT_EQ(waiter->error().code, ErrorCode::Cancelled);

    ASSERT_TRUE(leader.has_value());
    EXPECT_TRUE(leader->has_value());
    EXPECT_TRUE(facade_.has_cached("groupA"));
}

TEST_F(ConfigFacadeTest, DiscoveryFailurePropagates) {
    FakeDiscovery failing{Error{ErrorCode::Discovery, "No endpoint found after 0 beacon(s)"}};
    ConfigFacade facade(failing, demander_, claimer_, ClaimRequest{}, *logger_);

    auto group = facade.resolve("groupA");
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::Discovery);
    EXPECT_EQ(demander_.calls(), 0);
}

// ═══════════════════════════════════════════════
// Group Selection Tests
// ═══════════════════════════════════════════════

TEST(GroupSelectionTest, DottedPathSelectsNestedGroup) {
    auto inner = ConfigFacade::select_group(claimed_mapping(), "groupB.nested.inner");
    ASSERT_TRUE(inner.has_value()) << inner.error().describe();
    EXPECT_EQ(inner->at("flag"), true);
}

TEST(GroupSelectionTest, ScalarIsNotAGroup) {
    auto version = ConfigFacade::select_group(claimed_mapping(), "version");
    ASSERT_FALSE(version.has_value());
    EXPECT_EQ(version.error().code, ErrorCode::MissingGroup);

    auto deeper = ConfigFacade::select_group(claimed_mapping(), "groupA.endpoint.x");
    ASSERT_FALSE(deeper.has_value());
    EXPECT_EQ(deeper.error().code, ErrorCode::MissingGroup);
}

// ═══════════════════════════════════════════════
// ClientStack Tests
// ═══════════════════════════════════════════════

TEST(ClientStackTest, StaticStackResolvesThroughHttpClaimer) {
    std::shared_ptr<CaptureSink::Lines> lines;
    auto logger = make_capture_logger(lines);

    Config config = default_config();
    config.discovery.mode = "static";
    config.grant.demander = "static";
    config.grant.token = "pre-shared";

    auto http = std::make_unique<FakeHttpClient>();
    http->on_post("http://localhost:8000/f/claim/",
                  json_response(200, R"({"config":{"groupA":{"k":"v"}}})"));

    auto stack = ClientStack::create(config, *logger, std::move(http));
    ASSERT_TRUE(stack.has_value()) << stack.error().describe();
    EXPECT_EQ((*stack)->discovery().name(), "static");
    EXPECT_EQ((*stack)->demander().name(), "static");

    auto group = (*stack)->facade().resolve("groupA");
    ASSERT_TRUE(group.has_value()) << group.error().describe();
    EXPECT_EQ(group->at("k"), "v");
    EXPECT_FALSE(lines->contains("pre-shared"));
}

TEST(ClientStackTest, InvalidConfigRejected) {
    std::shared_ptr<CaptureSink::Lines> lines;
    auto logger = make_capture_logger(lines);

    Config config = default_config();
    config.discovery.mode = "carrier-pigeon";

    auto stack = ClientStack::create(config, *logger, std::make_unique<FakeHttpClient>());
    ASSERT_FALSE(stack.has_value());
    EXPECT_EQ(stack.error().code, ErrorCode::Config);
}
