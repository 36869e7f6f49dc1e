#include "connection_orchestrator.h"
#include "meshchat_log_macros.h"

namespace meshchat {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::IDLE:              return "idle";
        case ConnectionState::AWAITING_ANSWER:   return "awaiting-answer";
        case ConnectionState::AWAITING_FINALIZE: return "awaiting-finalize";
        case ConnectionState::CONNECTED:         return "connected";
        case ConnectionState::DISCONNECTED:      return "disconnected";
        default: return "unknown";
    }
}

ConnectionOrchestrator::ConnectionOrchestrator(const std::string& local_peer_id, TransportAdapter& transport,
                                               MessageStore& store, SignalRelayClient* relay)
    : local_peer_id_(local_peer_id), transport_(transport), store_(store), relay_(relay),
      next_attempt_id_(0), stopped_(false), next_subscription_id_(1) {
}

ConnectionOrchestrator::~ConnectionOrchestrator() {
    shutdown();
}

bool ConnectionOrchestrator::is_in_flight(ConnectionState state) {
    return state == ConnectionState::AWAITING_ANSWER || state == ConnectionState::AWAITING_FINALIZE;
}

bool ConnectionOrchestrator::validate_handshake_payload(const nlohmann::json& payload, std::string& out_peer_id) {
    if (!payload.is_object()) {
        return false;
    }
    auto peer_it = payload.find("peerId");
    if (peer_it == payload.end() || !peer_it->is_string() || peer_it->get<std::string>().empty()) {
        return false;
    }
    auto sdp_it = payload.find("sdp");
    if (sdp_it == payload.end()) {
        return false;
    }
    if (sdp_it->is_string()) {
        if (sdp_it->get<std::string>().empty()) {
            return false;
        }
    } else if (!sdp_it->is_object()) {
        return false;
    }
    out_peer_id = peer_it->get<std::string>();
    return true;
}

//=============================================================================
// Attempt bookkeeping
//=============================================================================

uint64_t ConnectionOrchestrator::begin_attempt_locked(const std::string& peer_id, ConnectionState state,
                                                      std::chrono::milliseconds timeout) {
    PeerEntry& entry = peers_[peer_id];
    entry.state = state;
    entry.attempt_id = ++next_attempt_id_;
    entry.deadline = std::chrono::steady_clock::now() + timeout;
    return entry.attempt_id;
}

void ConnectionOrchestrator::release_attempt_locked(const std::string& peer_id, uint64_t attempt_id) {
    auto it = peers_.find(peer_id);
    if (it == peers_.end() || it->second.attempt_id != attempt_id || !is_in_flight(it->second.state)) {
        return;
    }
    it->second.state = it->second.ever_connected ? ConnectionState::DISCONNECTED : ConnectionState::IDLE;
    peers_cv_.notify_all();
}

void ConnectionOrchestrator::release_attempt(const std::string& peer_id, uint64_t attempt_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    release_attempt_locked(peer_id, attempt_id);
}

OperationResult ConnectionOrchestrator::wait_for_attempt(const std::string& peer_id, uint64_t attempt_id, bool owner,
                                                         std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(peers_mutex_);

    bool finished = peers_cv_.wait_until(lock, deadline, [&]() {
        if (stopped_) {
            return true;
        }
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return true;
        }
        return it->second.state == ConnectionState::CONNECTED ||
               it->second.attempt_id != attempt_id ||
               !is_in_flight(it->second.state);
    });

    auto it = peers_.find(peer_id);
    if (it != peers_.end() && it->second.state == ConnectionState::CONNECTED) {
        return OperationResult::ok();
    }
    if (stopped_) {
        return OperationResult::failure(MeshError::NotInitialized, "orchestrator is shut down");
    }
    if (!finished) {
        if (owner) {
            release_attempt_locked(peer_id, attempt_id);
            LOG_ORCH_WARN("Connection to " << peer_id << " timed out");
        }
        return OperationResult::failure(MeshError::ConnectionTimeout, "timed out connecting to " + peer_id);
    }
    return OperationResult::failure(MeshError::ConnectionTimeout, "connection attempt to " + peer_id + " was abandoned");
}

//=============================================================================
// Handshake
//=============================================================================

OperationResult ConnectionOrchestrator::connect(const std::string& peer_id, std::chrono::milliseconds timeout) {
    if (peer_id.empty() || peer_id == local_peer_id_) {
        return OperationResult::failure(MeshError::ConnectionRejected, "invalid peer id '" + peer_id + "'");
    }

    auto now = std::chrono::steady_clock::now();
    auto deadline = now + timeout;
    uint64_t attempt_id = 0;
    bool use_relay = false;

    {
        std::unique_lock<std::mutex> lock(peers_mutex_);
        if (stopped_) {
            return OperationResult::failure(MeshError::NotInitialized, "orchestrator is shut down");
        }

        PeerEntry& entry = peers_[peer_id];
        if (entry.state == ConnectionState::CONNECTED) {
            return OperationResult::ok();
        }

        if (is_in_flight(entry.state)) {
            if (entry.deadline > now) {
                uint64_t in_flight_id = entry.attempt_id;
                lock.unlock();
                LOG_ORCH_DEBUG("Connection to " << peer_id << " already in progress, waiting");
                return wait_for_attempt(peer_id, in_flight_id, false, deadline);
            }
            LOG_ORCH_DEBUG("Releasing stale " << connection_state_to_string(entry.state)
                           << " attempt for " << peer_id);
            release_attempt_locked(peer_id, entry.attempt_id);
        }

        attempt_id = begin_attempt_locked(peer_id, ConnectionState::AWAITING_ANSWER, timeout);
        use_relay = relay_ != nullptr && relay_->is_active();
    }

    if (use_relay) {
        LOG_ORCH_INFO("Connecting to " << peer_id << " via relayed signaling");
        auto offer = transport_.create_offer(peer_id);
        if (!offer || !offer->is_object()) {
            release_attempt(peer_id, attempt_id);
            return OperationResult::failure(MeshError::SendFailed, "transport could not create an offer");
        }
        (*offer)["peerId"] = local_peer_id_;
        if (!relay_->signal(peer_id, SignalType::OFFER, *offer)) {
            release_attempt(peer_id, attempt_id);
            return OperationResult::failure(MeshError::SendFailed, "failed to relay offer to " + peer_id);
        }
    } else {
        LOG_ORCH_INFO("Connecting to " << peer_id << " directly");
        if (!transport_.connect_direct(peer_id)) {
            release_attempt(peer_id, attempt_id);
            return OperationResult::failure(MeshError::SendFailed, "direct connect to " + peer_id + " failed");
        }
    }

    return wait_for_attempt(peer_id, attempt_id, true, deadline);
}

OperationResult ConnectionOrchestrator::accept_offer(const nlohmann::json& offer, SignalRoute via,
                                                     nlohmann::json* out_answer) {
    std::string peer_id;
    if (!validate_handshake_payload(offer, peer_id)) {
        LOG_ORCH_WARN("Rejecting malformed offer");
        return OperationResult::failure(MeshError::ConnectionRejected, "offer is missing peerId or sdp");
    }

    uint64_t attempt_id = 0;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (stopped_) {
            return OperationResult::failure(MeshError::NotInitialized, "orchestrator is shut down");
        }

        PeerEntry& entry = peers_[peer_id];
        if (entry.state == ConnectionState::CONNECTED) {
            LOG_ORCH_DEBUG("Ignoring offer from already connected peer " << peer_id);
            return OperationResult::ok();
        }

        if (is_in_flight(entry.state) && entry.deadline > std::chrono::steady_clock::now()) {
            // Crossing offers: answer theirs, our own connect() keeps waiting
            entry.state = ConnectionState::AWAITING_FINALIZE;
            attempt_id = entry.attempt_id;
        } else {
            attempt_id = begin_attempt_locked(peer_id, ConnectionState::AWAITING_FINALIZE, DEFAULT_CONNECT_TIMEOUT);
        }
    }

    auto answer = transport_.accept_offer(offer);
    if (!answer || !answer->is_object()) {
        release_attempt(peer_id, attempt_id);
        return OperationResult::failure(MeshError::ConnectionRejected, "transport rejected offer from " + peer_id);
    }
    (*answer)["peerId"] = local_peer_id_;

    if (via == SignalRoute::RELAYED) {
        if (relay_ == nullptr || !relay_->signal(peer_id, SignalType::ANSWER, *answer)) {
            release_attempt(peer_id, attempt_id);
            return OperationResult::failure(MeshError::SendFailed, "failed to relay answer to " + peer_id);
        }
    } else if (out_answer) {
        *out_answer = *answer;
    }

    LOG_ORCH_INFO("Accepted offer from " << peer_id << (via == SignalRoute::RELAYED ? " (relayed)" : " (direct)"));
    return OperationResult::ok();
}

OperationResult ConnectionOrchestrator::finalize(const nlohmann::json& answer) {
    std::string peer_id;
    if (!validate_handshake_payload(answer, peer_id)) {
        LOG_ORCH_WARN("Rejecting malformed answer");
        return OperationResult::failure(MeshError::ConnectionRejected, "answer is missing peerId or sdp");
    }

    uint64_t attempt_id = 0;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (stopped_) {
            return OperationResult::failure(MeshError::NotInitialized, "orchestrator is shut down");
        }
        auto it = peers_.find(peer_id);
        if (it != peers_.end() && it->second.state == ConnectionState::CONNECTED) {
            LOG_ORCH_DEBUG("Ignoring answer from already connected peer " << peer_id);
            return OperationResult::ok();
        }
        if (it == peers_.end() || it->second.state != ConnectionState::AWAITING_ANSWER) {
            return OperationResult::failure(MeshError::ConnectionRejected, "no pending offer to " + peer_id);
        }
        attempt_id = it->second.attempt_id;
    }

    if (!transport_.finalize(answer)) {
        release_attempt(peer_id, attempt_id);
        return OperationResult::failure(MeshError::ConnectionRejected, "transport rejected answer from " + peer_id);
    }

    mark_connected(peer_id);
    return OperationResult::ok();
}

bool ConnectionOrchestrator::add_candidate(const std::string& peer_id, const nlohmann::json& candidate) {
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (stopped_ || it == peers_.end() || !is_in_flight(it->second.state)) {
            LOG_ORCH_DEBUG("Dropping candidate from " << peer_id << ": no handshake in progress");
            return false;
        }
    }
    return transport_.add_candidate(peer_id, candidate);
}

void ConnectionOrchestrator::handle_signal(const PendingSignal& signal) {
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(signal.from);
        if (it != peers_.end() && it->second.state == ConnectionState::CONNECTED) {
            LOG_ORCH_DEBUG("Discarding " << signal_type_to_string(signal.type)
                           << " from connected peer " << signal.from);
            return;
        }
    }

    // The relay asserts the sender; it overrides whatever the payload claims
    nlohmann::json payload = signal.signal;
    OperationResult result;
    switch (signal.type) {
        case SignalType::OFFER:
            payload["peerId"] = signal.from;
            result = accept_offer(payload, SignalRoute::RELAYED);
            break;
        case SignalType::ANSWER:
            payload["peerId"] = signal.from;
            result = finalize(payload);
            break;
        case SignalType::CANDIDATE:
            add_candidate(signal.from, payload);
            return;
    }

    if (!result) {
        LOG_ORCH_WARN("Failed to apply " << signal_type_to_string(signal.type) << " from "
                      << signal.from << ": " << result.error_message);
    }
}

void ConnectionOrchestrator::disconnect(const std::string& peer_id) {
    LOG_ORCH_INFO("Disconnecting from " << peer_id);
    transport_.disconnect(peer_id);
    handle_peer_disconnected(peer_id);
}

void ConnectionOrchestrator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (auto& pair : peers_) {
            if (is_in_flight(pair.second.state)) {
                pair.second.state = pair.second.ever_connected ? ConnectionState::DISCONNECTED : ConnectionState::IDLE;
            }
        }
    }
    peers_cv_.notify_all();
    LOG_ORCH_DEBUG("Orchestrator shut down");
}

//=============================================================================
// Transport events
//=============================================================================

void ConnectionOrchestrator::handle_peer_connected(const std::string& peer_id) {
    mark_connected(peer_id);
}

void ConnectionOrchestrator::mark_connected(const std::string& peer_id) {
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        if (stopped_) {
            return;
        }
        PeerEntry& entry = peers_[peer_id];
        if (entry.state == ConnectionState::CONNECTED) {
            return;
        }
        entry.state = ConnectionState::CONNECTED;
        entry.ever_connected = true;
    }
    peers_cv_.notify_all();

    LOG_ORCH_INFO("Peer connected: " << peer_id);
    persist_connected_peer(peer_id);
    notify_peer_connected(peer_id);
    publish_status();
}

void ConnectionOrchestrator::handle_peer_disconnected(const std::string& peer_id) {
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end() ||
            it->second.state == ConnectionState::IDLE ||
            it->second.state == ConnectionState::DISCONNECTED) {
            return;
        }
        was_connected = it->second.state == ConnectionState::CONNECTED;
        it->second.state = ConnectionState::DISCONNECTED;
    }
    peers_cv_.notify_all();

    LOG_ORCH_INFO("Peer disconnected: " << peer_id);
    persist_disconnected_peer(peer_id);
    if (was_connected) {
        notify_peer_disconnected(peer_id);
    }
    publish_status();
}

void ConnectionOrchestrator::persist_connected_peer(const std::string& peer_id) {
    auto existing = store_.get_peer(peer_id);
    Peer peer = existing ? *existing : Peer(peer_id);

    int64_t now = now_ms();
    peer.last_seen = now;
    peer.connected_at = now;
    peer.connection_quality = 100;
    if (peer.transport_type.empty()) {
        peer.transport_type = "webrtc";
    }

    if (!store_.save_peer(peer)) {
        LOG_ORCH_ERROR("Failed to persist peer record for " << peer_id);
    }
}

void ConnectionOrchestrator::persist_disconnected_peer(const std::string& peer_id) {
    auto existing = store_.get_peer(peer_id);
    Peer peer = existing ? *existing : Peer(peer_id);

    peer.last_seen = now_ms();
    peer.connected_at.reset();

    if (!store_.save_peer(peer)) {
        LOG_ORCH_ERROR("Failed to persist peer record for " << peer_id);
    }
}

//=============================================================================
// Status and subscriptions
//=============================================================================

bool ConnectionOrchestrator::is_connected(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(peer_id);
    return it != peers_.end() && it->second.state == ConnectionState::CONNECTED;
}

ConnectionState ConnectionOrchestrator::get_state(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(peer_id);
    return it == peers_.end() ? ConnectionState::IDLE : it->second.state;
}

std::vector<std::string> ConnectionOrchestrator::get_connected_peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<std::string> result;
    for (const auto& pair : peers_) {
        if (pair.second.state == ConnectionState::CONNECTED) {
            result.push_back(pair.first);
        }
    }
    return result;
}

size_t ConnectionOrchestrator::get_connected_count() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    size_t count = 0;
    for (const auto& pair : peers_) {
        if (pair.second.state == ConnectionState::CONNECTED) {
            ++count;
        }
    }
    return count;
}

size_t ConnectionOrchestrator::get_connecting_count() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    size_t count = 0;
    for (const auto& pair : peers_) {
        if (is_in_flight(pair.second.state)) {
            ++count;
        }
    }
    return count;
}

PeerStatus ConnectionOrchestrator::get_status() const {
    std::vector<std::string> connected = get_connected_peers();

    PeerStatus status;
    status.peer_count = connected.size();
    status.is_connected = !connected.empty();
    if (connected.empty()) {
        return status;
    }

    int total_quality = 0;
    for (const auto& peer_id : connected) {
        auto peer = store_.get_peer(peer_id);
        if (peer) {
            total_quality += peer->connection_quality;
        }
    }
    status.average_quality = total_quality / static_cast<int>(connected.size());
    return status;
}

uint64_t ConnectionOrchestrator::on_peer_connected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    connected_subscribers_[id] = std::move(callback);
    return id;
}

uint64_t ConnectionOrchestrator::on_peer_disconnected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    disconnected_subscribers_[id] = std::move(callback);
    return id;
}

uint64_t ConnectionOrchestrator::on_status_changed(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    status_subscribers_[id] = std::move(callback);
    return id;
}

void ConnectionOrchestrator::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    connected_subscribers_.erase(subscription_id);
    disconnected_subscribers_.erase(subscription_id);
    status_subscribers_.erase(subscription_id);
}

void ConnectionOrchestrator::notify_peer_connected(const std::string& peer_id) {
    std::vector<PeerCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& pair : connected_subscribers_) {
            callbacks.push_back(pair.second);
        }
    }
    for (const auto& callback : callbacks) {
        callback(peer_id);
    }
}

void ConnectionOrchestrator::notify_peer_disconnected(const std::string& peer_id) {
    std::vector<PeerCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& pair : disconnected_subscribers_) {
            callbacks.push_back(pair.second);
        }
    }
    for (const auto& callback : callbacks) {
        callback(peer_id);
    }
}

void ConnectionOrchestrator::publish_status() {
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& pair : status_subscribers_) {
            callbacks.push_back(pair.second);
        }
    }
    if (callbacks.empty()) {
        return;
    }

    PeerStatus status = get_status();
    LOG_ORCH_DEBUG("Peer status: " << status.peer_count << " connected, average quality "
                   << status.average_quality);
    for (const auto& callback : callbacks) {
        callback(status);
    }
}

} // namespace meshchat
