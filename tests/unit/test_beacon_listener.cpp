/**
 * @file test_beacon_listener.cpp
 * @brief Unit tests for listen sessions: framing policy, dedup and release.
 * @author Dimitris Kafetzis
 */

#include "network/beacon_listener.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stop_token>
#include <thread>

using namespace beaconfig;
using namespace beaconfig::testing;

class BeaconListenerTest : public ::testing::Test {
protected:
    std::shared_ptr<CaptureSink::Lines> lines_;
    std::unique_ptr<Logger> logger_ = make_capture_logger(lines_);
    std::shared_ptr<SocketScript> script_ = std::make_shared<SocketScript>();
    BeaconListener listener_{*logger_, scripted_socket_factory(script_), 10};
    ListenBinding binding_{};
};

TEST_F(BeaconListenerTest, YieldsBeaconsInArrivalOrder) {
    script_->push_beacon("http://a/");
    script_->push_beacon("http://b/");

    auto stream = listener_.listen(binding_);
    ASSERT_TRUE(stream.has_value());

    auto first = stream->next();
    auto second = stream->next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->url, "http://a/");
    EXPECT_EQ(second->url, "http://b/");
    EXPECT_EQ(script_->bind_calls.load(), 1);
}

TEST_F(BeaconListenerTest, BindFailureIsReportedImmediately) {
    script_->bind_error = Error{ErrorCode::Bind, "Address already in use"};

    auto stream = listener_.listen(binding_);
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, ErrorCode::Bind);
    EXPECT_EQ(script_->receive_calls.load(), 0);
}

TEST_F(BeaconListenerTest, DeduplicatesUrlsWithinSession) {
    script_->push_beacon("http://u1/");
    script_->push_beacon("http://u2/");
    script_->push_beacon("http://u1/");
    script_->push_beacon("http://u3/");

    auto stream = listener_.listen_deduplicated(binding_);
    ASSERT_TRUE(stream.has_value());

    std::vector<std::string> urls;
    for (int i = 0; i < 3; ++i) {
        auto beacon = stream->next();
        ASSERT_TRUE(beacon.has_value());
        urls.push_back(beacon->url);
    }
    EXPECT_EQ(urls, (std::vector<std::string>{"http://u1/", "http://u2/", "http://u3/"}));
    EXPECT_EQ(stream->seen_count(), 3u);
}

TEST_F(BeaconListenerTest, LenientModeSkipsMalformedBeacons) {
    script_->push_payload("beacon-fakts{broken");
    script_->push_beacon("http://good/");

    auto stream = listener_.listen(binding_, /*strict=*/false);
    ASSERT_TRUE(stream.has_value());

    auto beacon = stream->next();
    ASSERT_TRUE(beacon.has_value());
    EXPECT_EQ(beacon->url, "http://good/");
    EXPECT_TRUE(lines_->contains("Malformed beacon"));
}

TEST_F(BeaconListenerTest, StrictModeTerminatesOnMalformedBeacon) {
    script_->push_payload("beacon-fakts{broken");
    script_->push_beacon("http://good/");

    auto stream = listener_.listen(binding_, /*strict=*/true);
    ASSERT_TRUE(stream.has_value());

    auto beacon = stream->next();
    ASSERT_FALSE(beacon.has_value());
    EXPECT_EQ(beacon.error().code, ErrorCode::Decode);
    EXPECT_FALSE(stream->is_open());
    EXPECT_EQ(script_->close_calls.load(), 1);

    // Terminated sessions stay terminated
    auto again = stream->next();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::Decode);
}

TEST_F(BeaconListenerTest, FrameErrorsNeverTerminateEvenInStrictMode) {
    script_->push_payload("NOTIFY * HTTP/1.1");
    script_->push_beacon("http://good/");

    auto stream = listener_.listen(binding_, /*strict=*/true);
    ASSERT_TRUE(stream.has_value());

    auto beacon = stream->next();
    ASSERT_TRUE(beacon.has_value());
    EXPECT_EQ(beacon->url, "http://good/");
    EXPECT_TRUE(stream->is_open());
}

TEST_F(BeaconListenerTest, SocketFailureTerminatesWithIo) {
    script_->push_error(Error{ErrorCode::Io, "recvfrom() failed"});

    auto stream = listener_.listen(binding_);
    ASSERT_TRUE(stream.has_value());

    auto beacon = stream->next();
    ASSERT_FALSE(beacon.has_value());
    EXPECT_EQ(beacon.error().code, ErrorCode::Io);
    EXPECT_EQ(script_->close_calls.load(), 1);
}

TEST_F(BeaconListenerTest, StopTokenCancelsBlockedReceiveAndClosesOnce) {
    auto stream = listener_.listen(binding_);
    ASSERT_TRUE(stream.has_value());

    std::stop_source stop_source;
    std::optional<Result<Beacon>> outcome;
    std::jthread waiter([&] {
        outcome.emplace(stream->next(stop_source.get_token()));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop_source.request_stop();
    waiter.join();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, ErrorCode::Cancelled);
    EXPECT_EQ(script_->close_calls.load(), 1);

    // Further cancels and destruction do not close again
    stream->cancel();
    stream->cancel();
    EXPECT_EQ(script_->close_calls.load(), 1);
}

TEST_F(BeaconListenerTest, CancelFromAnotherThreadReleasesSocket) {
    auto stream = listener_.listen(binding_);
    ASSERT_TRUE(stream.has_value());

    std::optional<Result<Beacon>> outcome;
    std::jthread waiter([&] {
        outcome.emplace(stream->next());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stream->cancel();
    EXPECT_EQ(script_->close_calls.load(), 1);
    waiter.join();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, ErrorCode::Cancelled);
    EXPECT_EQ(script_->close_calls.load(), 1);
}

TEST_F(BeaconListenerTest, DestructionReleasesSocket) {
    {
        auto stream = listener_.listen(binding_);
        ASSERT_TRUE(stream.has_value());
        EXPECT_EQ(script_->close_calls.load(), 0);
    }
    EXPECT_EQ(script_->close_calls.load(), 1);
}

TEST_F(BeaconListenerTest, SessionsAreIndependent) {
    script_->push_beacon("http://u1/");
    {
        auto first = listener_.listen_deduplicated(binding_);
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(first->next().has_value());
    }

    script_->push_beacon("http://u1/");
    auto second = listener_.listen_deduplicated(binding_);
    ASSERT_TRUE(second.has_value());
    auto beacon = second->next();
    ASSERT_TRUE(beacon.has_value());
    EXPECT_EQ(beacon->url, "http://u1/");
    EXPECT_EQ(script_->bind_calls.load(), 2);
}
