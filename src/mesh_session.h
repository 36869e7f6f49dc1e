#pragma once

/**
 * @file mesh_session.h
 * @brief Entry point of the delivery core. A MeshSession owns the
 *        orchestrator, pipeline, offline queue and discovery loop of one
 *        local identity and wires them to the embedding application's
 *        transport and store.
 *
 * Typical use:
 *
 *   meshchat::MeshSession session(transport, store, &relay_channel);
 *   session.set_crypto_provider(&crypto);
 *   if (!session.start(config)) {
 *       // session.get_last_error() == MeshError::NotInitialized
 *   }
 *   session.send_message(peer_id, "hello");
 *   session.stop();
 */

#include "capabilities.h"
#include "config.h"
#include "connection_orchestrator.h"
#include "discovery_loop.h"
#include "errors.h"
#include "message_pipeline.h"
#include "offline_queue.h"
#include "signal_relay.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace meshchat {

class MeshSession {
public:
    using MessageCallback = std::function<void(const Message& message)>;
    using PeerCallback = std::function<void(const std::string& peer_id)>;
    using StatusCallback = std::function<void(const PeerStatus& status)>;
    using RelayedMessageCallback = std::function<void(const RelayedMessage& message)>;

    /**
     * @param relay_channel Rendezvous transport, null for direct-only operation
     */
    MeshSession(TransportAdapter& transport, MessageStore& store, RelayChannel* relay_channel = nullptr);
    ~MeshSession();

    // Optional collaborators; must be set before start(), not owned
    void set_crypto_provider(CryptoProvider* crypto) { crypto_ = crypto; }
    void set_rate_limiter(RateLimiter* limiter) { rate_limiter_ = limiter; }
    void set_file_validator(FileValidator* validator) { file_validator_ = validator; }
    void set_performance_monitor(PerformanceMonitor* monitor) { monitor_ = monitor; }
    void set_queue_storage(QueueStorage* storage) { queue_storage_ = storage; }

    /**
     * Validate the configuration, create the components and start the
     * background threads. A stopped session cannot be started again.
     * @return false with get_last_error() == NotInitialized on a missing
     *         identity or invalid configuration
     */
    bool start(const MeshConfig& config);
    void stop();
    bool is_running() const { return running_.load(); }

    MeshError get_last_error() const;
    std::string get_last_error_message() const;
    std::string get_peer_id() const;

    // Operations; all return NotInitialized before a successful start()
    OperationResult connect(const std::string& peer_id);
    OperationResult disconnect(const std::string& peer_id);
    OperationResult accept_offer(const nlohmann::json& offer, nlohmann::json& out_answer);
    OperationResult finalize(const nlohmann::json& answer);

    OperationResult send_message(const std::string& recipient_id, const std::string& content,
                                 const std::vector<FileAttachment>& attachments = {},
                                 const std::string& group_id = "", Message* out_message = nullptr);
    OperationResult send_voice(const std::string& recipient_id, const std::string& data, uint32_t duration_ms,
                               const std::string& group_id = "", Message* out_message = nullptr);
    OperationResult send_reaction(const std::string& recipient_id, const std::string& target_message_id,
                                  const std::string& emoji, const std::string& group_id = "");
    OperationResult post_room_message(const std::string& content);

    // Run a retry pass over the offline queue now
    void notify_connectivity_regained();

    PeerStatus get_peer_status() const;
    size_t get_queue_size() const;
    std::vector<DiscoveredPeer> get_discovered_peers() const;

    // Subscriptions may be registered before start()
    uint64_t on_message_received(MessageCallback callback);
    uint64_t on_peer_connected(PeerCallback callback);
    uint64_t on_peer_disconnected(PeerCallback callback);
    uint64_t on_status_changed(StatusCallback callback);
    uint64_t on_relayed_message(RelayedMessageCallback callback);
    void unsubscribe(uint64_t subscription_id);

private:
    TransportAdapter& transport_;
    MessageStore& store_;
    RelayChannel* relay_channel_;

    CryptoProvider* crypto_;
    RateLimiter* rate_limiter_;
    FileValidator* file_validator_;
    PerformanceMonitor* monitor_;
    QueueStorage* queue_storage_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> running_;
    bool stopped_;
    MeshConfig config_;
    MeshError last_error_;
    std::string last_error_message_;

    // Declared in dependency order, destroyed in reverse
    std::unique_ptr<JsonFileQueueStorage> owned_queue_storage_;
    std::unique_ptr<SignalRelayClient> relay_client_;
    std::unique_ptr<ConnectionOrchestrator> orchestrator_;
    std::unique_ptr<OfflineQueue> queue_;
    std::unique_ptr<MessagePipeline> pipeline_;
    std::unique_ptr<DiscoveryLoop> discovery_;

    std::mutex subscribers_mutex_;
    uint64_t next_subscription_id_;
    std::map<uint64_t, MessageCallback> message_subscribers_;
    std::map<uint64_t, PeerCallback> connected_subscribers_;
    std::map<uint64_t, PeerCallback> disconnected_subscribers_;
    std::map<uint64_t, StatusCallback> status_subscribers_;
    std::map<uint64_t, RelayedMessageCallback> relayed_subscribers_;
    bool was_connected_;

    bool fail_start(const std::string& message);
    OperationResult not_running() const;
    void install_transport_handlers();
    void clear_transport_handlers();
    void wire_components();

    void handle_peer_connected(const std::string& peer_id);
    void handle_peer_disconnected(const std::string& peer_id);
    void handle_status_changed(const PeerStatus& status);
    void handle_message_received(const Message& message);
    void handle_relayed_message(const RelayedMessage& message);
};

} // namespace meshchat
