#include <gtest/gtest.h>
#include "p2pchat/PresenceBroadcaster.hpp"
#include "TestSupport.hpp"
#include <memory>
#include <thread>

using namespace p2pchat;
using namespace p2pchat::testing_support;
using namespace std::chrono_literals;

// -----------------------
// FIXTURE
// -----------------------
class PresenceBroadcasterTest : public ::testing::Test {
protected:
    void runIo() {
        ioThread = std::thread([this] { io.run(); });
    }

    void TearDown() override {
        if (broadcaster) broadcaster->stop();
        if (ioThread.joinable()) ioThread.join();
    }

    void create(std::chrono::milliseconds interval, std::chrono::milliseconds backoff) {
        broadcaster = std::make_unique<PresenceBroadcaster>(io, sender, "alice", target, interval, backoff);
    }

    boost::asio::io_context io;
    RecordingSender sender;
    const Endpoint target{"255.255.255.255", 5000};
    std::unique_ptr<PresenceBroadcaster> broadcaster;
    std::thread ioThread;
};

// -----------------------
// TESTS
// -----------------------
TEST_F(PresenceBroadcasterTest, AnnouncesImmediatelyThenPeriodically) {
    create(50ms, 1000ms);
    broadcaster->start();
    runIo();

    ASSERT_TRUE(waitFor([&] { return sender.count() >= 3; }));
    EXPECT_EQ(broadcaster->failedCount(), 0u);
    EXPECT_EQ(broadcaster->target(), target);

    for (const auto& [msg, to] : sender.all()) {
        EXPECT_EQ(to, target);
        ASSERT_TRUE(std::holds_alternative<PresenceMessage>(msg));
        EXPECT_EQ(std::get<PresenceMessage>(msg).sender, "alice");
        EXPECT_TRUE(std::get<PresenceMessage>(msg).timestamp.has_value());
        EXPECT_FALSE(std::get<PresenceMessage>(msg).probe);
    }
}

TEST_F(PresenceBroadcasterTest, FirstAnnouncementDoesNotWaitForInterval) {
    create(10s, 10s);
    broadcaster->start();
    runIo();

    EXPECT_TRUE(waitFor([&] { return broadcaster->sentCount() == 1; }, 1000ms));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(sender.count(), 1u);
}

TEST_F(PresenceBroadcasterTest, FailedSendRetriesAfterBackoff) {
    sender.setFailing(true);
    create(10s, 20ms);
    broadcaster->start();
    runIo();

    // retries come on the short backoff, not the long interval
    ASSERT_TRUE(waitFor([&] { return broadcaster->failedCount() >= 3; }));
    EXPECT_EQ(broadcaster->sentCount(), 0u);

    sender.setFailing(false);
    ASSERT_TRUE(waitFor([&] { return broadcaster->sentCount() == 1; }));

    const size_t attempts = sender.count();
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(sender.count(), attempts); // back on the 10s interval
}

TEST_F(PresenceBroadcasterTest, StopEndsAnnouncements) {
    create(20ms, 20ms);
    broadcaster->start();
    runIo();

    ASSERT_TRUE(waitFor([&] { return sender.count() >= 2; }));
    broadcaster->stop();
    broadcaster->stop();
    ioThread.join(); // no pending work once the timer is cancelled

    const size_t sent = sender.count();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(sender.count(), sent);
}
