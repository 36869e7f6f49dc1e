#pragma once

#include "capabilities.h"
#include "config.h"
#include "connection_orchestrator.h"
#include "signal_relay.h"
#include "threadmanager.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace meshchat {

/**
 * Background poll of the rendezvous channel. Keeps the set of discovered
 * peers current, dispatches relayed signals to the orchestrator and
 * reconnects peers we already have conversations with.
 */
class DiscoveryLoop : public ThreadManager {
public:
    using RelayedMessageCallback = std::function<void(const RelayedMessage& message)>;

    /**
     * @param crypto Used to check discovered ids against published keys, may be null
     */
    DiscoveryLoop(SignalRelayClient& relay, ConnectionOrchestrator& orchestrator, MessageStore& store,
                  CryptoProvider* crypto, const DiscoveryConfig& config,
                  std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000));
    ~DiscoveryLoop();

    /**
     * Join the rendezvous channel and start polling. A failed join is
     * retried by the loop.
     * @param metadata Published to other peers
     */
    bool start(const nlohmann::json& metadata);
    void stop();
    bool is_running() const { return running_.load(); }

    // Run one poll round
    bool poll_once();

    /**
     * Delay before the next poll
     * @param peer_count Connected peers
     * @param pending_connections Discovered peers not yet connected
     */
    static uint32_t compute_delay_ms(size_t peer_count, size_t pending_connections, const DiscoveryConfig& config);

    uint32_t next_delay_ms() const;

    size_t get_discovered_count() const;
    // Reconnect attempts currently in flight
    size_t get_reconnecting_count() const;
    std::vector<DiscoveredPeer> get_discovered_peers() const;

    void set_relayed_message_callback(RelayedMessageCallback callback);

private:
    SignalRelayClient& relay_;
    ConnectionOrchestrator& orchestrator_;
    MessageStore& store_;
    CryptoProvider* crypto_;
    DiscoveryConfig config_;
    std::chrono::milliseconds connect_timeout_;

    std::atomic<bool> running_;
    nlohmann::json metadata_;

    mutable std::mutex discovered_mutex_;
    std::unordered_map<std::string, DiscoveredPeer> discovered_;

    // At most one reconnect thread per contact
    mutable std::mutex reconnect_mutex_;
    std::unordered_set<std::string> reconnecting_;

    // Room messages are returned on every poll; remember what was delivered
    std::mutex room_mutex_;
    std::unordered_set<std::string> delivered_room_messages_;
    std::deque<std::string> delivered_room_order_;
    RelayedMessageCallback relayed_message_callback_;

    void discovery_loop();
    bool join_relay();
    void add_discovered_peers(const std::vector<DiscoveredPeer>& peers);
    bool verify_peer_identity(const DiscoveredPeer& peer) const;
    void persist_discovered_peer(const DiscoveredPeer& peer);
    void maybe_auto_connect(const std::string& peer_id);
    void deliver_room_messages(const std::vector<RelayedMessage>& messages);
};

} // namespace meshchat
