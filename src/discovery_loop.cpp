#include "discovery_loop.h"
#include "meshchat_log_macros.h"

namespace meshchat {

namespace {

constexpr size_t MAX_REMEMBERED_ROOM_MESSAGES = 1000;

} // namespace

DiscoveryLoop::DiscoveryLoop(SignalRelayClient& relay, ConnectionOrchestrator& orchestrator, MessageStore& store,
                             CryptoProvider* crypto, const DiscoveryConfig& config,
                             std::chrono::milliseconds connect_timeout)
    : relay_(relay), orchestrator_(orchestrator), store_(store), crypto_(crypto), config_(config),
      connect_timeout_(connect_timeout), running_(false), metadata_(nlohmann::json::object()) {
}

DiscoveryLoop::~DiscoveryLoop() {
    stop();
}

uint32_t DiscoveryLoop::compute_delay_ms(size_t peer_count, size_t pending_connections, const DiscoveryConfig& config) {
    if (pending_connections > 0) {
        return config.pending_delay_ms;
    }
    if (peer_count < config.sparse_peer_threshold) {
        return config.sparse_delay_ms;
    }
    if (peer_count < config.dense_peer_threshold) {
        return config.moderate_delay_ms;
    }
    return config.dense_delay_ms;
}

uint32_t DiscoveryLoop::next_delay_ms() const {
    size_t peer_count = orchestrator_.get_connected_count();
    size_t discovered = get_discovered_count();
    size_t pending = discovered > peer_count ? discovered - peer_count : 0;
    return compute_delay_ms(peer_count, pending, config_);
}

bool DiscoveryLoop::start(const nlohmann::json& metadata) {
    if (running_.load()) {
        LOG_DISCOVERY_WARN("Discovery loop is already running");
        return false;
    }

    metadata_ = metadata.is_object() ? metadata : nlohmann::json::object();
    reset_shutdown();
    running_.store(true);

    if (!join_relay()) {
        LOG_DISCOVERY_WARN("Initial join failed, will retry in " << config_.failure_delay_ms << " ms");
    }

    if (!add_managed_thread([this]() { discovery_loop(); }, "discovery-loop")) {
        running_.store(false);
        return false;
    }
    return true;
}

void DiscoveryLoop::stop() {
    bool was_running = running_.exchange(false);

    // Reconnect threads may exist even if the loop itself never ran
    shutdown_all_threads();
    join_all_active_threads();

    if (was_running) {
        relay_.leave();
        LOG_DISCOVERY_INFO("Discovery loop stopped");
    }
}

void DiscoveryLoop::discovery_loop() {
    LOG_DISCOVERY_INFO("Discovery loop started");

    while (true) {
        uint32_t delay_ms;
        if (!relay_.is_active()) {
            delay_ms = join_relay() ? next_delay_ms() : config_.failure_delay_ms;
        } else if (poll_once()) {
            delay_ms = next_delay_ms();
        } else {
            delay_ms = config_.failure_delay_ms;
        }

        LOG_DISCOVERY_DEBUG("Next poll in " << delay_ms << " ms");
        if (interruptible_wait(std::chrono::milliseconds(delay_ms))) {
            break;
        }
    }

    LOG_DISCOVERY_INFO("Discovery loop exiting");
}

bool DiscoveryLoop::join_relay() {
    std::vector<DiscoveredPeer> peers;
    if (!relay_.join(metadata_, peers)) {
        return false;
    }
    add_discovered_peers(peers);
    return true;
}

bool DiscoveryLoop::poll_once() {
    PollResult result;
    if (!relay_.poll(result)) {
        LOG_DISCOVERY_WARN("Poll failed, retrying in " << config_.failure_delay_ms << " ms");
        return false;
    }

    add_discovered_peers(result.peers);

    for (const auto& signal : result.signals) {
        orchestrator_.handle_signal(signal);
    }

    deliver_room_messages(result.messages);
    return true;
}

//=============================================================================
// Peers
//=============================================================================

bool DiscoveryLoop::verify_peer_identity(const DiscoveredPeer& peer) const {
    if (!crypto_) {
        return true;
    }
    auto key_it = peer.metadata.find("publicKey");
    if (key_it == peer.metadata.end() || !key_it->is_string()) {
        return true;
    }
    std::string expected = peer_id_from_fingerprint(crypto_->fingerprint(key_it->get<std::string>()));
    return expected == peer.id;
}

void DiscoveryLoop::add_discovered_peers(const std::vector<DiscoveredPeer>& peers) {
    std::vector<DiscoveredPeer> new_peers;
    std::vector<std::string> observed;

    for (const auto& peer : peers) {
        if (peer.id == relay_.local_peer_id()) {
            continue;
        }
        if (!verify_peer_identity(peer)) {
            LOG_DISCOVERY_WARN("Ignoring peer " << peer.id << ": id does not match its public key");
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(discovered_mutex_);
            auto result = discovered_.emplace(peer.id, peer);
            if (result.second) {
                new_peers.push_back(peer);
            } else {
                result.first->second.metadata = peer.metadata;
            }
        }
        observed.push_back(peer.id);
    }

    if (!new_peers.empty()) {
        LOG_DISCOVERY_INFO("Discovered " << new_peers.size() << " new peers");
    }
    for (const auto& peer : new_peers) {
        persist_discovered_peer(peer);
    }
    for (const auto& peer_id : observed) {
        maybe_auto_connect(peer_id);
    }
}

void DiscoveryLoop::persist_discovered_peer(const DiscoveredPeer& discovered) {
    if (store_.get_peer(discovered.id)) {
        return;
    }

    Peer peer(discovered.id);
    auto key_it = discovered.metadata.find("publicKey");
    if (key_it != discovered.metadata.end() && key_it->is_string()) {
        peer.public_key = key_it->get<std::string>();
    }
    peer.transport_type = "relay";
    peer.last_seen = now_ms();
    peer.is_verified = false;

    if (!store_.save_peer(peer)) {
        LOG_DISCOVERY_ERROR("Failed to persist discovered peer " << discovered.id);
    }
}

void DiscoveryLoop::maybe_auto_connect(const std::string& peer_id) {
    ConnectionState state = orchestrator_.get_state(peer_id);
    if (state != ConnectionState::IDLE && state != ConnectionState::DISCONNECTED) {
        return;
    }
    if (!store_.get_conversation(peer_id)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        if (!reconnecting_.insert(peer_id).second) {
            return;
        }
    }

    LOG_DISCOVERY_DEBUG("Reconnecting to known contact " << peer_id);
    std::chrono::milliseconds timeout = connect_timeout_;
    bool started = add_managed_thread([this, peer_id, timeout]() {
        OperationResult result = orchestrator_.connect(peer_id, timeout);
        if (result) {
            LOG_DISCOVERY_INFO("Reconnected to " << peer_id);
        } else {
            LOG_DISCOVERY_DEBUG("Reconnect to " << peer_id << " failed: " << result.error_message);
        }
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnecting_.erase(peer_id);
    }, "discovery-connect-" + peer_id);

    if (!started) {
        std::lock_guard<std::mutex> lock(reconnect_mutex_);
        reconnecting_.erase(peer_id);
    }
}

size_t DiscoveryLoop::get_reconnecting_count() const {
    std::lock_guard<std::mutex> lock(reconnect_mutex_);
    return reconnecting_.size();
}

size_t DiscoveryLoop::get_discovered_count() const {
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    return discovered_.size();
}

std::vector<DiscoveredPeer> DiscoveryLoop::get_discovered_peers() const {
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    std::vector<DiscoveredPeer> result;
    result.reserve(discovered_.size());
    for (const auto& pair : discovered_) {
        result.push_back(pair.second);
    }
    return result;
}

//=============================================================================
// Room messages
//=============================================================================

void DiscoveryLoop::set_relayed_message_callback(RelayedMessageCallback callback) {
    std::lock_guard<std::mutex> lock(room_mutex_);
    relayed_message_callback_ = std::move(callback);
}

void DiscoveryLoop::deliver_room_messages(const std::vector<RelayedMessage>& messages) {
    std::vector<RelayedMessage> fresh;
    RelayedMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(room_mutex_);
        callback = relayed_message_callback_;
        for (const auto& message : messages) {
            std::string key = message.from + "|" + std::to_string(message.timestamp) + "|" + message.content;
            if (!delivered_room_messages_.insert(key).second) {
                continue;
            }
            delivered_room_order_.push_back(key);
            if (delivered_room_order_.size() > MAX_REMEMBERED_ROOM_MESSAGES) {
                delivered_room_messages_.erase(delivered_room_order_.front());
                delivered_room_order_.pop_front();
            }
            fresh.push_back(message);
        }
    }

    if (!callback) {
        return;
    }
    for (const auto& message : fresh) {
        callback(message);
    }
}

} // namespace meshchat
