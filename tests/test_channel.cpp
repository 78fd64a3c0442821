/**
 * Unit tests for the bounded channel and the cancellation token
 *
 * Covers:
 * - FIFO order and bounded receives
 * - Backpressure on a full queue
 * - Disconnection seen from either end
 * - CancellationToken transitions and wake-ups
 */

#include "common/cancellation.h"
#include "common/channel.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace clique::common;

// ============================================================================
// Test Fixtures
// ============================================================================

class ChannelTest : public ::testing::Test {
protected:
    static constexpr std::chrono::milliseconds kShortWait{50};
};

// ============================================================================
// Ordering and receive variants
// ============================================================================

TEST_F(ChannelTest, DeliversInSendOrder) {
    auto channel = make_channel<int>(16);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(channel.first.send(i).is_ok());
    }

    EXPECT_EQ(channel.second.pending(), 10u);
    for (int i = 0; i < 10; ++i) {
        auto value = channel.second.try_recv();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    EXPECT_FALSE(channel.second.try_recv().has_value());
}

TEST_F(ChannelTest, RecvTimeoutWaitsForTheFullDuration) {
    auto channel = make_channel<int>(4);

    auto start = std::chrono::steady_clock::now();
    auto value = channel.second.recv_timeout(kShortWait);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(elapsed, kShortWait);
}

TEST_F(ChannelTest, RecvUntilReportsReadyAndTimeout) {
    auto channel = make_channel<std::string>(4);
    ASSERT_TRUE(channel.first.send("hello").is_ok());

    std::optional<std::string> out;
    auto status = channel.second.recv_until(
        std::chrono::steady_clock::now() + kShortWait, out);
    EXPECT_EQ(status, RecvStatus::READY);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "hello");

    out.reset();
    status = channel.second.recv_until(
        std::chrono::steady_clock::now() + kShortWait, out);
    EXPECT_EQ(status, RecvStatus::TIMEOUT);
    EXPECT_FALSE(out.has_value());
}

TEST_F(ChannelTest, ReceiverWakesUpOnSend) {
    auto channel = make_channel<int>(4);

    std::thread producer([sender = channel.first]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_TRUE(sender.send(42).is_ok());
    });

    auto value = channel.second.recv_timeout(std::chrono::seconds(2));
    producer.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
}

// ============================================================================
// Backpressure
// ============================================================================

TEST_F(ChannelTest, SendBlocksWhileFull) {
    auto channel = make_channel<int>(2);
    ASSERT_TRUE(channel.first.send(1).is_ok());
    ASSERT_TRUE(channel.first.send(2).is_ok());

    std::atomic<bool> third_sent{false};
    std::thread producer([sender = channel.first, &third_sent]() mutable {
        EXPECT_TRUE(sender.send(3).is_ok());
        third_sent.store(true);
    });

    std::this_thread::sleep_for(kShortWait);
    EXPECT_FALSE(third_sent.load());
    EXPECT_EQ(channel.second.pending(), 2u);

    auto first = channel.second.try_recv();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 1);

    producer.join();
    EXPECT_TRUE(third_sent.load());
    EXPECT_EQ(*channel.second.try_recv(), 2);
    EXPECT_EQ(*channel.second.try_recv(), 3);
}

TEST_F(ChannelTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(make_channel<int>(0), std::invalid_argument);
}

// ============================================================================
// Disconnection
// ============================================================================

TEST_F(ChannelTest, ReceiverSeesDisconnectionAfterDrainingQueue) {
    auto channel = make_channel<int>(4);
    ASSERT_TRUE(channel.first.send(7).is_ok());
    {
        auto sender = std::move(channel.first);
    }

    EXPECT_FALSE(channel.second.is_disconnected());
    std::optional<int> out;
    EXPECT_EQ(channel.second.recv_until(
                  std::chrono::steady_clock::now() + kShortWait, out),
              RecvStatus::READY);
    EXPECT_EQ(*out, 7);

    out.reset();
    EXPECT_EQ(channel.second.recv_until(
                  std::chrono::steady_clock::now() + std::chrono::seconds(5),
                  out),
              RecvStatus::DISCONNECTED);
    EXPECT_TRUE(channel.second.is_disconnected());
}

TEST_F(ChannelTest, CopiedSendersKeepChannelOpen) {
    auto channel = make_channel<int>(4);
    Sender<int> copy = channel.first;
    {
        auto original = std::move(channel.first);
    }

    EXPECT_FALSE(channel.second.is_disconnected());
    ASSERT_TRUE(copy.send(1).is_ok());
    EXPECT_EQ(*channel.second.try_recv(), 1);
}

TEST_F(ChannelTest, SendFailsOnceReceiverIsDropped) {
    auto channel = make_channel<int>(4);
    {
        auto receiver = std::move(channel.second);
    }

    EXPECT_TRUE(channel.first.is_closed());
    EXPECT_TRUE(channel.first.send(1).is_err());
}

TEST_F(ChannelTest, DroppingReceiverReleasesBlockedSender) {
    auto channel = make_channel<int>(1);
    ASSERT_TRUE(channel.first.send(1).is_ok());

    std::atomic<bool> failed{false};
    std::thread producer([sender = channel.first, &failed]() mutable {
        failed.store(sender.send(2).is_err());
    });

    std::this_thread::sleep_for(kShortWait);
    {
        auto receiver = std::move(channel.second);
    }
    producer.join();
    EXPECT_TRUE(failed.load());
}

TEST_F(ChannelTest, UnconnectedEndsReportDisconnection) {
    Sender<int> sender;
    Receiver<int> receiver;

    EXPECT_FALSE(sender.is_connected());
    EXPECT_TRUE(sender.send(1).is_err());
    EXPECT_TRUE(receiver.is_disconnected());
    EXPECT_FALSE(receiver.try_recv().has_value());
}

// ============================================================================
// CancellationToken
// ============================================================================

TEST(CancellationTokenTest, CancelIsIdempotent) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());

    EXPECT_TRUE(token.cancel());
    EXPECT_FALSE(token.cancel());
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, WaitForTimesOutWhenNotCancelled) {
    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(30)));
    EXPECT_GE(std::chrono::steady_clock::now() - start,
              std::chrono::milliseconds(30));
}

TEST(CancellationTokenTest, WaitForWakesOnCancel) {
    auto token = std::make_shared<CancellationToken>();
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token->cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token->wait_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();
}
