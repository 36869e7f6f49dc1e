#ifndef MESHCHAT_SIGNAL_RELAY_H
#define MESHCHAT_SIGNAL_RELAY_H

#include "types.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshchat {

/**
 * Request/response transport to the rendezvous service. One call carries
 * one {action, peerId, payload} request and returns the decoded JSON body,
 * or nullopt when the service could not be reached or answered non-2xx.
 */
class RelayChannel {
public:
    virtual ~RelayChannel() = default;

    virtual std::optional<nlohmann::json> request(const nlohmann::json& request) = 0;
};

// Public room message posted through the rendezvous service
struct RelayedMessage {
    std::string from;
    std::string content;
    int64_t timestamp;

    RelayedMessage() : timestamp(0) {}
};

// Result of one poll round
struct PollResult {
    std::vector<PendingSignal> signals;     // In arrival order
    std::vector<RelayedMessage> messages;
    std::vector<DiscoveredPeer> peers;      // Present only when the service reports them
};

/**
 * Client side of the rendezvous protocol. Peers register with join(),
 * exchange handshake payloads with signal() and pick up what is addressed
 * to them with poll().
 */
class SignalRelayClient {
public:
    SignalRelayClient(RelayChannel& channel, const std::string& local_peer_id);

    /**
     * Register with the rendezvous service
     * @param metadata Published to other peers (display name, public key)
     * @param out_peers Peers currently visible, excluding ourselves
     * @return true if the service accepted the registration
     */
    bool join(const nlohmann::json& metadata, std::vector<DiscoveredPeer>& out_peers);

    /**
     * Fetch pending signals and room messages
     * @return true on success; malformed entries are skipped, not fatal
     */
    bool poll(PollResult& out_result);

    // Forward an offer/answer/candidate to a peer
    bool signal(const std::string& peer_id, SignalType type, const nlohmann::json& payload);

    bool post_message(const std::string& content);

    // True after a successful join, until leave()
    bool is_active() const { return active_.load(); }
    void leave();

    const std::string& local_peer_id() const { return local_peer_id_; }

private:
    RelayChannel& channel_;
    std::string local_peer_id_;
    std::atomic<bool> active_;
    std::mutex request_mutex_;              // One request in flight at a time

    std::optional<nlohmann::json> send_request(const std::string& action, const nlohmann::json& payload);
    static bool parse_peer(const nlohmann::json& json, DiscoveredPeer& out_peer);
};

} // namespace meshchat

#endif // MESHCHAT_SIGNAL_RELAY_H
