#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "discovery_loop.h"
#include "memory_store.h"
#include "test_mocks.h"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace meshchat;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class DiscoveryLoopTest : public ::testing::Test {
protected:
    NiceMock<MockTransport> transport;
    NiceMock<MockRelayChannel> channel;
    MemoryStore store;
    DiscoveryConfig config;

    std::mutex mutex;
    nlohmann::json join_response = nlohmann::json::object();
    nlohmann::json poll_response = nlohmann::json::object();
    bool relay_down = false;
    std::vector<std::string> actions;

    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::DEBUG);
        ON_CALL(channel, request(_)).WillByDefault(Invoke([this](const nlohmann::json& request) {
            std::lock_guard<std::mutex> lock(mutex);
            std::string action = request.value("action", "");
            actions.push_back(action);
            if (relay_down) {
                return std::optional<nlohmann::json>();
            }
            if (action == "join") return std::optional<nlohmann::json>(join_response);
            if (action == "poll") return std::optional<nlohmann::json>(poll_response);
            return std::optional<nlohmann::json>(nlohmann::json::object());
        }));
    }

    void set_poll_response(const nlohmann::json& response) {
        std::lock_guard<std::mutex> lock(mutex);
        poll_response = response;
    }

    size_t count_actions(const std::string& action) {
        std::lock_guard<std::mutex> lock(mutex);
        return std::count(actions.begin(), actions.end(), action);
    }
};

TEST_F(DiscoveryLoopTest, DelayTiers) {
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(0, 1, config), 1000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(20, 3, config), 1000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(0, 0, config), 2000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(2, 0, config), 2000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(3, 0, config), 10000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(9, 0, config), 10000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(10, 0, config), 30000u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(50, 0, config), 30000u);
}

TEST_F(DiscoveryLoopTest, DelayTiersFollowConfiguration) {
    DiscoveryConfig custom;
    custom.pending_delay_ms = 50;
    custom.sparse_delay_ms = 100;
    custom.dense_peer_threshold = 5;
    custom.dense_delay_ms = 500;
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(0, 2, custom), 50u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(1, 0, custom), 100u);
    EXPECT_EQ(DiscoveryLoop::compute_delay_ms(5, 0, custom), 500u);
}

TEST_F(DiscoveryLoopTest, PollRecordsPeersAndDispatchesSignals) {
    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config);

    std::vector<DiscoveredPeer> joined;
    ASSERT_TRUE(relay.join(nlohmann::json::object(), joined));

    set_poll_response(nlohmann::json::parse(R"({
        "peers": [{"_id": "peer-b", "metadata": {"publicKey": "KEY-B"}}, {"_id": "peer-c"}],
        "signals": [{"from": "peer-b", "type": "offer", "signal": {"sdp": "v=0 offer"}}]
    })"));

    EXPECT_CALL(transport, accept_offer(_))
        .WillOnce(Return(std::optional<nlohmann::json>(nlohmann::json{{"sdp", "v=0 answer"}})));

    ASSERT_TRUE(loop.poll_once());

    EXPECT_EQ(loop.get_discovered_count(), 2u);
    EXPECT_EQ(orchestrator.get_state("peer-b"), ConnectionState::AWAITING_FINALIZE);
    EXPECT_EQ(count_actions("signal"), 1u);

    auto peer = store.get_peer("peer-b");
    ASSERT_TRUE(peer.has_value());
    EXPECT_FALSE(peer->is_verified);
    EXPECT_EQ(peer->public_key, "KEY-B");
    EXPECT_EQ(peer->transport_type, "relay");

    // Two discovered, none connected
    EXPECT_EQ(loop.next_delay_ms(), config.pending_delay_ms);

    // Peers already seen are not added twice
    set_poll_response(nlohmann::json::parse(R"({"peers": [{"_id": "peer-b"}]})"));
    ASSERT_TRUE(loop.poll_once());
    EXPECT_EQ(loop.get_discovered_count(), 2u);
}

TEST_F(DiscoveryLoopTest, PeersWithMismatchedKeysAreIgnored) {
    NiceMock<MockCryptoProvider> crypto;
    ON_CALL(crypto, fingerprint(_)).WillByDefault(Invoke([](const std::string& key) {
        return "fp" + key + "0000000000000000";
    }));

    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, &crypto, config);

    set_poll_response(nlohmann::json::parse(R"({
        "peers": [
            {"_id": "fpgood0000000000", "metadata": {"publicKey": "good"}},
            {"_id": "impostor", "metadata": {"publicKey": "good"}}
        ]
    })"));

    ASSERT_TRUE(loop.poll_once());
    auto peers = loop.get_discovered_peers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].id, "fpgood0000000000");
    EXPECT_FALSE(store.get_peer("impostor").has_value());
}

TEST_F(DiscoveryLoopTest, RoomMessagesAreDeliveredOnce) {
    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config);

    std::vector<std::string> delivered;
    loop.set_relayed_message_callback([&](const RelayedMessage& message) {
        delivered.push_back(message.content);
    });

    set_poll_response(nlohmann::json::parse(R"({
        "messages": [{"from": "peer-c", "content": "hello room", "timestamp": 10}]
    })"));
    ASSERT_TRUE(loop.poll_once());
    ASSERT_TRUE(loop.poll_once());

    set_poll_response(nlohmann::json::parse(R"({
        "messages": [
            {"from": "peer-c", "content": "hello room", "timestamp": 10},
            {"from": "peer-c", "content": "anyone?", "timestamp": 11}
        ]
    })"));
    ASSERT_TRUE(loop.poll_once());

    EXPECT_EQ(delivered, (std::vector<std::string>{"hello room", "anyone?"}));
}

TEST_F(DiscoveryLoopTest, FailedPollIsReported) {
    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config);

    relay_down = true;
    EXPECT_FALSE(loop.poll_once());
    EXPECT_EQ(loop.get_discovered_count(), 0u);
}

TEST_F(DiscoveryLoopTest, LoopJoinsPollsAndLeaves) {
    config.sparse_delay_ms = 20;
    config.pending_delay_ms = 20;

    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config);

    ASSERT_TRUE(loop.start(nlohmann::json{{"displayName", "Alice"}}));
    EXPECT_TRUE(loop.is_running());
    EXPECT_FALSE(loop.start(nlohmann::json::object()));

    EXPECT_TRUE(wait_for_condition([&]() { return count_actions("poll") >= 3; }, 3000));
    EXPECT_EQ(count_actions("join"), 1u);
    EXPECT_TRUE(relay.is_active());

    loop.stop();
    EXPECT_FALSE(loop.is_running());
    EXPECT_FALSE(relay.is_active());
}

TEST_F(DiscoveryLoopTest, StopDoesNotWaitForFailureDelay) {
    relay_down = true;
    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config);

    ASSERT_TRUE(loop.start(nlohmann::json::object()));
    EXPECT_TRUE(wait_for_condition([&]() { return count_actions("join") >= 2; }, 2000));

    auto started = std::chrono::steady_clock::now();
    loop.stop();
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 5000);
}

TEST_F(DiscoveryLoopTest, ReconnectsKnownContacts) {
    Conversation conversation;
    conversation.id = "peer-b";
    conversation.contact_id = "peer-b";
    store.save_conversation(conversation);

    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config, std::chrono::milliseconds(200));

    std::vector<DiscoveredPeer> joined;
    ASSERT_TRUE(relay.join(nlohmann::json::object(), joined));

    std::atomic<int> offers(0);
    EXPECT_CALL(transport, create_offer("peer-b")).Times(AtLeast(1)).WillRepeatedly(Invoke([&](const std::string&) {
        offers++;
        return std::optional<nlohmann::json>(nlohmann::json{{"sdp", "v=0 offer"}});
    }));
    EXPECT_CALL(transport, create_offer("peer-c")).Times(0);

    set_poll_response(nlohmann::json::parse(R"({"peers": [{"_id": "peer-b"}, {"_id": "peer-c"}]})"));
    ASSERT_TRUE(loop.poll_once());

    EXPECT_TRUE(wait_for_condition([&]() { return offers.load() >= 1; }, 2000));
    loop.stop();
}

TEST_F(DiscoveryLoopTest, ReconnectThreadsDoNotAccumulate) {
    Conversation conversation;
    conversation.id = "peer-b";
    conversation.contact_id = "peer-b";
    store.save_conversation(conversation);

    SignalRelayClient relay(channel, "peer-a");
    ConnectionOrchestrator orchestrator("peer-a", transport, store, &relay);
    DiscoveryLoop loop(relay, orchestrator, store, nullptr, config, std::chrono::milliseconds(20));

    std::vector<DiscoveredPeer> joined;
    ASSERT_TRUE(relay.join(nlohmann::json::object(), joined));

    std::atomic<int> offers(0);
    ON_CALL(transport, create_offer("peer-b")).WillByDefault(Invoke([&](const std::string&) {
        offers++;
        return std::optional<nlohmann::json>(nlohmann::json{{"sdp", "v=0 offer"}});
    }));

    // The contact never answers, so every poll finds it reconnectable again
    set_poll_response(nlohmann::json::parse(R"({"peers": [{"_id": "peer-b"}]})"));
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(loop.poll_once());
        EXPECT_LE(loop.get_active_thread_count(), 2u) << "after poll " << i;
        EXPECT_LE(loop.get_reconnecting_count(), 1u);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_GE(offers.load(), 2);

    EXPECT_TRUE(wait_for_condition([&]() {
        loop.cleanup_finished_threads();
        return loop.get_active_thread_count() == 0;
    }, 2000));
    loop.stop();
}
