#pragma once

#include "capabilities.h"
#include "errors.h"
#include "signal_relay.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshchat {

// Per-peer handshake state
enum class ConnectionState {
    IDLE,                   // Never attempted
    AWAITING_ANSWER,        // Offer sent (or direct connect started)
    AWAITING_FINALIZE,      // Remote offer accepted, answer returned
    CONNECTED,
    DISCONNECTED
};

const char* connection_state_to_string(ConnectionState state);

// Channel a handshake payload travelled on; replies take the same one
enum class SignalRoute {
    DIRECT,
    RELAYED
};

struct PeerStatus {
    size_t peer_count;
    int average_quality;        // 0..100 over connected peers, 0 when none
    bool is_connected;

    PeerStatus() : peer_count(0), average_quality(0), is_connected(false) {}
};

/**
 * Drives the offer/answer/candidate handshake for every peer and tracks
 * which peers are connected. Handshake payloads carry "peerId" naming the
 * peer that produced them.
 */
class ConnectionOrchestrator {
public:
    using PeerCallback = std::function<void(const std::string& peer_id)>;
    using StatusCallback = std::function<void(const PeerStatus& status)>;

    static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{10000};

    /**
     * @param relay Rendezvous client, may be null for direct-only operation
     */
    ConnectionOrchestrator(const std::string& local_peer_id, TransportAdapter& transport,
                           MessageStore& store, SignalRelayClient* relay);
    ~ConnectionOrchestrator();

    /**
     * Connect to a peer and wait for the handshake to complete.
     * A second call while an attempt is in flight waits on that attempt
     * instead of creating another offer.
     */
    OperationResult connect(const std::string& peer_id,
                            std::chrono::milliseconds timeout = DEFAULT_CONNECT_TIMEOUT);

    /**
     * Accept a remote offer and produce an answer
     * @param offer Offer carrying "peerId" and "sdp"
     * @param via Route the offer arrived on; a relayed offer is answered through the relay
     * @param out_answer Receives the answer for direct exchange, may be null when relayed
     */
    OperationResult accept_offer(const nlohmann::json& offer, SignalRoute via,
                                 nlohmann::json* out_answer = nullptr);

    // Complete a handshake we initiated
    OperationResult finalize(const nlohmann::json& answer);

    bool add_candidate(const std::string& peer_id, const nlohmann::json& candidate);

    // Dispatch a signal picked up from the rendezvous channel
    void handle_signal(const PendingSignal& signal);

    void disconnect(const std::string& peer_id);

    // Transport events
    void handle_peer_connected(const std::string& peer_id);
    void handle_peer_disconnected(const std::string& peer_id);

    /**
     * Abandon every attempt and refuse new ones. Terminal.
     */
    void shutdown();

    bool is_connected(const std::string& peer_id) const;
    ConnectionState get_state(const std::string& peer_id) const;
    std::vector<std::string> get_connected_peers() const;
    size_t get_connected_count() const;
    size_t get_connecting_count() const;
    PeerStatus get_status() const;

    // Subscriptions, scoped to this instance
    uint64_t on_peer_connected(PeerCallback callback);
    uint64_t on_peer_disconnected(PeerCallback callback);
    uint64_t on_status_changed(StatusCallback callback);
    void unsubscribe(uint64_t subscription_id);

private:
    struct PeerEntry {
        ConnectionState state;
        uint64_t attempt_id;
        std::chrono::steady_clock::time_point deadline;
        bool ever_connected;

        PeerEntry() : state(ConnectionState::IDLE), attempt_id(0), ever_connected(false) {}
    };

    std::string local_peer_id_;
    TransportAdapter& transport_;
    MessageStore& store_;
    SignalRelayClient* relay_;

    mutable std::mutex peers_mutex_;
    std::condition_variable peers_cv_;
    std::unordered_map<std::string, PeerEntry> peers_;
    uint64_t next_attempt_id_;
    bool stopped_;

    std::mutex subscribers_mutex_;
    uint64_t next_subscription_id_;
    std::map<uint64_t, PeerCallback> connected_subscribers_;
    std::map<uint64_t, PeerCallback> disconnected_subscribers_;
    std::map<uint64_t, StatusCallback> status_subscribers_;

    static bool is_in_flight(ConnectionState state);
    static bool validate_handshake_payload(const nlohmann::json& payload, std::string& out_peer_id);

    // Requires peers_mutex_ held
    uint64_t begin_attempt_locked(const std::string& peer_id, ConnectionState state,
                                  std::chrono::milliseconds timeout);
    void release_attempt_locked(const std::string& peer_id, uint64_t attempt_id);

    void release_attempt(const std::string& peer_id, uint64_t attempt_id);
    OperationResult wait_for_attempt(const std::string& peer_id, uint64_t attempt_id, bool owner,
                                     std::chrono::steady_clock::time_point deadline);

    void mark_connected(const std::string& peer_id);
    void persist_connected_peer(const std::string& peer_id);
    void persist_disconnected_peer(const std::string& peer_id);

    void notify_peer_connected(const std::string& peer_id);
    void notify_peer_disconnected(const std::string& peer_id);
    void publish_status();
};

} // namespace meshchat
