#include <gtest/gtest.h>
#include "p2pchat/ChatNode.hpp"
#include "TestSupport.hpp"
#include <atomic>
#include <string>
#include <thread>

using namespace p2pchat;
using namespace p2pchat::testing_support;
using namespace std::chrono_literals;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static ChatConfig loopbackConfig(const std::string& name) {
    ChatConfig config;
    config.displayName = name;
    config.port = 0;
    config.broadcastAddress = "127.0.0.1";
    config.broadcastPresence = false;
    return config;
}

static Endpoint loopback(const ChatNode& node) {
    return Endpoint{"127.0.0.1", node.localPort()};
}

// -----------------------
// LIFECYCLE
// -----------------------
TEST(ChatNodeTest, StartBindsAndStopIsIdempotent) {
    RecordingListener listener;
    ChatNode node(loopbackConfig("alice"), listener);

    EXPECT_FALSE(node.isRunning());
    node.start();
    EXPECT_TRUE(node.isRunning());
    EXPECT_NE(node.localPort(), 0);
    EXPECT_EQ(node.settings().displayName, "alice");
    EXPECT_EQ(node.settings().port, 0); // configured, not bound

    node.stop();
    EXPECT_FALSE(node.isRunning());
    node.stop();
}

TEST(ChatNodeTest, PortInUseRaisesBindError) {
    // a socket without SO_REUSEADDR holds the port exclusively
    boost::asio::io_context io;
    udp::socket blocker(io, udp::endpoint(boost::asio::ip::address_v4::any(), 0));
    const uint16_t taken = blocker.local_endpoint().port();

    RecordingListener listener;
    ChatConfig config = loopbackConfig("alice");
    config.port = taken;
    ChatNode node(config, listener);

    EXPECT_THROW(node.start(), BindError);
    EXPECT_FALSE(node.isRunning());
}

TEST(ChatNodeTest, SendToInvalidAddressFails) {
    RecordingListener listener;
    ChatNode node(loopbackConfig("alice"), listener);
    node.start();

    EXPECT_FALSE(node.sendTo(presenceFrom("alice"), Endpoint{"not-an-address", 5000}));
    EXPECT_FALSE(node.sendTo(chatFrom("alice", "bob", std::string(5000, 'x')), Endpoint{"127.0.0.1", 5000}));
    node.stop();
    EXPECT_FALSE(node.sendTo(presenceFrom("alice"), Endpoint{"127.0.0.1", 5000}));
}

// Holds every chat callback until released, keeping the dispatch worker busy
class StallingListener : public ChatEventListener {
public:
    void onChatMessage(const Endpoint&, const std::string&, const std::string&, TimePoint) override {
        entered = true;
        while (!released) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};
};

TEST(ChatNodeTest, FullDispatchQueueDropsDatagrams) {
    StallingListener listener;
    ChatConfig config = loopbackConfig("alice");
    config.dispatchWorkers = 1;
    config.maxPendingDatagrams = 1;
    ChatNode node(config, listener);
    node.start();

    boost::asio::io_context io;
    udp::socket raw(io, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    udp::endpoint target(boost::asio::ip::address_v4::loopback(), node.localPort());

    raw.send_to(boost::asio::buffer(encodeMessage(chatFrom("bob", "alice", "first"))), target);
    EXPECT_TRUE(waitFor([&] { return listener.entered.load(); }));

    for (int i = 0; i < 20; ++i) {
        raw.send_to(boost::asio::buffer(encodeMessage(chatFrom("bob", "alice", "burst " + std::to_string(i)))), target);
    }
    EXPECT_TRUE(waitFor([&] { return node.droppedDatagrams() >= 20; }));
    EXPECT_TRUE(node.isRunning());

    listener.released = true;

    // the node still serves datagrams once the worker is free
    const Endpoint rawEndpoint{"127.0.0.1", raw.local_endpoint().port()};
    EXPECT_TRUE(waitFor([&] {
        raw.send_to(boost::asio::buffer(encodeMessage(presenceFrom("carol"))), target);
        auto peer = node.peers().get(rawEndpoint.key());
        return peer && peer->name == "carol";
    }));
    EXPECT_GE(node.droppedDatagrams(), 20u);
    node.stop();
}

// -----------------------
// CONVERSATION OVER LOOPBACK
// -----------------------
TEST(ChatNodeTest, ConnectChatReceiptAndQuit) {
    RecordingListener aliceEvents;
    RecordingListener bobEvents;
    ChatNode alice(loopbackConfig("alice"), aliceEvents);
    ChatNode bob(loopbackConfig("bob"), bobEvents);
    alice.start();
    bob.start();

    // alice connects explicitly; bob learns about her from the presence
    alice.session().connect(loopback(bob), "bob", Clock::now());
    ASSERT_TRUE(waitFor([&] { return bob.peers().contains(loopback(alice).key()); }));
    EXPECT_FALSE(bob.session().isActive());

    // first chat makes bob adopt alice and send a read receipt
    ASSERT_TRUE(alice.session().sendChat("hello bob", Clock::now()));
    ASSERT_TRUE(waitFor([&] { return bobEvents.read([](const auto& l) { return l.chats.size(); }) == 1; }));
    bobEvents.read([&](const auto& l) {
        EXPECT_EQ(l.chats[0].name, "alice");
        EXPECT_EQ(l.chats[0].text, "hello bob");
        EXPECT_EQ(l.chats[0].from, loopback(alice));
        return 0;
    });
    EXPECT_TRUE(waitFor([&] { return bob.session().isPartner(loopback(alice)); }));
    EXPECT_TRUE(waitFor([&] { return aliceEvents.read([](const auto& l) { return l.receipts.size(); }) == 1; }));

    // bob answers
    ASSERT_TRUE(bob.session().sendChat("hi alice", Clock::now()));
    ASSERT_TRUE(waitFor([&] { return aliceEvents.read([](const auto& l) { return l.chats.size(); }) == 1; }));
    ASSERT_TRUE(waitFor([&] { return bobEvents.read([](const auto& l) { return l.receipts.size(); }) == 1; }));

    // alice quits: bob goes idle and forgets her
    EXPECT_TRUE(alice.session().quit(Clock::now()));
    ASSERT_TRUE(waitFor([&] { return !bob.session().isActive(); }));
    EXPECT_TRUE(waitFor([&] { return !bob.peers().contains(loopback(alice).key()); }));
    EXPECT_EQ(bobEvents.read([](const auto& l) { return l.disconnected.size(); }), 1u);

    alice.stop();
    bob.stop();
}

TEST(ChatNodeTest, TypingIndicatorReachesPartner) {
    RecordingListener aliceEvents;
    RecordingListener bobEvents;
    ChatNode alice(loopbackConfig("alice"), aliceEvents);
    ChatNode bob(loopbackConfig("bob"), bobEvents);
    alice.start();
    bob.start();

    alice.session().connect(loopback(bob), "bob", Clock::now());
    EXPECT_TRUE(alice.session().notifyTyping(Clock::now()));

    ASSERT_TRUE(waitFor([&] { return bobEvents.read([](const auto& l) { return l.typing.size(); }) == 1; }));
    EXPECT_EQ(bobEvents.read([](const auto& l) { return l.typing[0]; }), "alice");

    alice.stop();
    bob.stop();
}

TEST(ChatNodeTest, PresenceBroadcastRegistersPeer) {
    RecordingListener aliceEvents;
    RecordingListener bobEvents;
    ChatNode bob(loopbackConfig("bob"), bobEvents);
    bob.start();

    ChatConfig config = loopbackConfig("alice");
    config.broadcastPresence = true;
    config.broadcastPort = bob.localPort();
    config.presenceInterval = 100ms;
    ChatNode alice(config, aliceEvents);
    alice.start();

    ASSERT_TRUE(waitFor([&] { return bob.peers().contains(loopback(alice).key()); }));
    auto peer = bob.peers().get(loopback(alice).key());
    EXPECT_EQ(peer->name, "alice");
    EXPECT_TRUE(peer->isActive(Clock::now()));
    EXPECT_FALSE(bob.session().isActive()); // presence alone opens no chat

    alice.stop();
    bob.stop();
}

TEST(ChatNodeTest, GarbageDatagramsAreDropped) {
    RecordingListener listener;
    ChatNode node(loopbackConfig("alice"), listener);
    node.start();

    boost::asio::io_context io;
    udp::socket raw(io, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    udp::endpoint target(boost::asio::ip::address_v4::loopback(), node.localPort());
    for (int i = 0; i < 50; ++i) {
        raw.send_to(boost::asio::buffer(std::string("junk ") + std::to_string(i)), target);
    }
    raw.send_to(boost::asio::buffer(encodeMessage(presenceFrom("carol"))), target);

    // the node survives and still handles the valid datagram
    ASSERT_TRUE(waitFor([&] { return node.peers().size() == 1; }));
    EXPECT_EQ(node.peers().snapshot()[0].name, "carol");
    EXPECT_TRUE(node.isRunning());
    node.stop();
}
