#include "mesh_session.h"
#include "meshchat_log_macros.h"

namespace meshchat {

MeshSession::MeshSession(TransportAdapter& transport, MessageStore& store, RelayChannel* relay_channel)
    : transport_(transport), store_(store), relay_channel_(relay_channel),
      crypto_(nullptr), rate_limiter_(nullptr), file_validator_(nullptr), monitor_(nullptr),
      queue_storage_(nullptr), running_(false), stopped_(false),
      last_error_(MeshError::NotInitialized), last_error_message_("session not started"),
      next_subscription_id_(1), was_connected_(false) {
}

MeshSession::~MeshSession() {
    stop();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool MeshSession::fail_start(const std::string& message) {
    last_error_ = MeshError::NotInitialized;
    last_error_message_ = message;
    LOG_SESSION_ERROR("Cannot start session: " << message);
    return false;
}

bool MeshSession::start(const MeshConfig& config) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_.load()) {
        LOG_SESSION_WARN("Session is already running");
        return true;
    }
    if (stopped_) {
        return fail_start("session was stopped");
    }

    MeshConfig cfg = config;
    std::string error;
    if (!cfg.validate(error)) {
        return fail_start("invalid configuration: " + error);
    }

    if (cfg.peer_id.empty() && !cfg.public_key.empty() && crypto_) {
        cfg.peer_id = peer_id_from_fingerprint(crypto_->fingerprint(cfg.public_key));
    }
    if (cfg.peer_id.empty()) {
        return fail_start("missing local peer identity");
    }

    LogLevel level;
    if (parse_log_level(cfg.log_level, level)) {
        Logger::getInstance().set_log_level(level);
    }

    LOG_SESSION_INFO("Starting session for peer " << cfg.peer_id);
    config_ = cfg;

    if (relay_channel_ && cfg.relay_enabled) {
        relay_client_ = std::make_unique<SignalRelayClient>(*relay_channel_, cfg.peer_id);
    }

    orchestrator_ = std::make_unique<ConnectionOrchestrator>(cfg.peer_id, transport_, store_, relay_client_.get());

    QueueStorage* storage = queue_storage_;
    if (!storage && !cfg.queue_file.empty()) {
        owned_queue_storage_ = std::make_unique<JsonFileQueueStorage>(cfg.queue_file);
        storage = owned_queue_storage_.get();
    }
    queue_ = std::make_unique<OfflineQueue>(cfg.max_queue_size, cfg.max_retries, storage);
    if (!queue_->load()) {
        LOG_SESSION_WARN("Starting with an empty offline queue");
    }

    PipelineOptions options;
    options.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
    options.chunk_size = cfg.chunk_size;
    options.yield_every_chunks = cfg.yield_every_chunks;
    options.max_inbound_file_size = cfg.max_inbound_file_size;
    options.transfer_idle_timeout = std::chrono::milliseconds(cfg.transfer_idle_timeout_ms);
    pipeline_ = std::make_unique<MessagePipeline>(cfg.peer_id, store_, *orchestrator_, transport_, *queue_, options);
    pipeline_->set_rate_limiter(rate_limiter_);
    pipeline_->set_file_validator(file_validator_);
    pipeline_->set_performance_monitor(monitor_);

    if (relay_client_) {
        discovery_ = std::make_unique<DiscoveryLoop>(*relay_client_, *orchestrator_, store_, crypto_, cfg.discovery,
                                                     options.connect_timeout);
    }

    wire_components();
    install_transport_handlers();
    running_.store(true);

    queue_->start([this](const QueuedOutboundMessage& item) { return pipeline_->retry_queued(item); },
                  std::chrono::milliseconds(cfg.retry_interval_ms));

    if (discovery_) {
        nlohmann::json metadata;
        metadata["displayName"] = cfg.display_name;
        if (!cfg.public_key.empty()) {
            metadata["publicKey"] = cfg.public_key;
        }
        discovery_->start(metadata);
    }

    last_error_ = MeshError::None;
    last_error_message_.clear();
    LOG_SESSION_INFO("Session started" << (discovery_ ? " with rendezvous discovery" : " (direct only)"));
    return true;
}

void MeshSession::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    LOG_SESSION_INFO("Stopping session");
    stopped_ = true;
    clear_transport_handlers();

    // Wakes connect() waiters so the loops below can join promptly
    orchestrator_->shutdown();
    if (discovery_) {
        discovery_->stop();
    }
    queue_->stop();

    last_error_ = MeshError::NotInitialized;
    last_error_message_ = "session stopped";
    LOG_SESSION_INFO("Session stopped");
}

void MeshSession::wire_components() {
    orchestrator_->on_peer_connected([this](const std::string& peer_id) { handle_peer_connected(peer_id); });
    orchestrator_->on_peer_disconnected([this](const std::string& peer_id) { handle_peer_disconnected(peer_id); });
    orchestrator_->on_status_changed([this](const PeerStatus& status) { handle_status_changed(status); });
    pipeline_->on_message_received([this](const Message& message) { handle_message_received(message); });
    queue_->set_exhausted_callback([this](const QueuedOutboundMessage& item) { pipeline_->mark_failed(item); });
    if (discovery_) {
        discovery_->set_relayed_message_callback([this](const RelayedMessage& message) {
            handle_relayed_message(message);
        });
    }
}

void MeshSession::install_transport_handlers() {
    transport_.set_text_handler([this](const std::string& peer_id, const std::string& data) {
        if (running_.load()) {
            pipeline_->handle_inbound(peer_id, data);
        }
    });
    transport_.set_binary_handler([this](const std::string& peer_id, const std::vector<uint8_t>& data) {
        if (running_.load()) {
            pipeline_->handle_binary(peer_id, data);
        }
    });
    transport_.set_peer_connected_handler([this](const std::string& peer_id) {
        if (running_.load()) {
            orchestrator_->handle_peer_connected(peer_id);
        }
    });
    transport_.set_peer_disconnected_handler([this](const std::string& peer_id) {
        if (running_.load()) {
            orchestrator_->handle_peer_disconnected(peer_id);
        }
    });
}

void MeshSession::clear_transport_handlers() {
    transport_.set_text_handler([](const std::string&, const std::string&) {});
    transport_.set_binary_handler([](const std::string&, const std::vector<uint8_t>&) {});
    transport_.set_peer_connected_handler([](const std::string&) {});
    transport_.set_peer_disconnected_handler([](const std::string&) {});
}

MeshError MeshSession::get_last_error() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return last_error_;
}

std::string MeshSession::get_last_error_message() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return last_error_message_;
}

std::string MeshSession::get_peer_id() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return config_.peer_id;
}

OperationResult MeshSession::not_running() const {
    return OperationResult::failure(MeshError::NotInitialized, "session is not running");
}

//=============================================================================
// Operations
//=============================================================================

OperationResult MeshSession::connect(const std::string& peer_id) {
    if (!running_.load()) {
        return not_running();
    }
    return orchestrator_->connect(peer_id, std::chrono::milliseconds(config_.connect_timeout_ms));
}

OperationResult MeshSession::disconnect(const std::string& peer_id) {
    if (!running_.load()) {
        return not_running();
    }
    orchestrator_->disconnect(peer_id);
    return OperationResult::ok();
}

OperationResult MeshSession::accept_offer(const nlohmann::json& offer, nlohmann::json& out_answer) {
    if (!running_.load()) {
        return not_running();
    }
    return orchestrator_->accept_offer(offer, SignalRoute::DIRECT, &out_answer);
}

OperationResult MeshSession::finalize(const nlohmann::json& answer) {
    if (!running_.load()) {
        return not_running();
    }
    return orchestrator_->finalize(answer);
}

OperationResult MeshSession::send_message(const std::string& recipient_id, const std::string& content,
                                          const std::vector<FileAttachment>& attachments,
                                          const std::string& group_id, Message* out_message) {
    if (!running_.load()) {
        return not_running();
    }
    return pipeline_->send(recipient_id, content, attachments, group_id, out_message);
}

OperationResult MeshSession::send_voice(const std::string& recipient_id, const std::string& data,
                                        uint32_t duration_ms, const std::string& group_id, Message* out_message) {
    if (!running_.load()) {
        return not_running();
    }
    return pipeline_->send_voice(recipient_id, data, duration_ms, group_id, out_message);
}

OperationResult MeshSession::send_reaction(const std::string& recipient_id, const std::string& target_message_id,
                                           const std::string& emoji, const std::string& group_id) {
    if (!running_.load()) {
        return not_running();
    }
    return pipeline_->send_reaction(recipient_id, target_message_id, emoji, group_id);
}

OperationResult MeshSession::post_room_message(const std::string& content) {
    if (!running_.load()) {
        return not_running();
    }
    if (!relay_client_ || !relay_client_->is_active()) {
        return OperationResult::failure(MeshError::SendFailed, "rendezvous channel is not active");
    }
    if (!relay_client_->post_message(content)) {
        return OperationResult::failure(MeshError::SendFailed, "rendezvous rejected the message");
    }
    return OperationResult::ok();
}

void MeshSession::notify_connectivity_regained() {
    if (running_.load()) {
        queue_->notify_connectivity_regained();
    }
}

PeerStatus MeshSession::get_peer_status() const {
    if (!running_.load()) {
        return PeerStatus();
    }
    return orchestrator_->get_status();
}

size_t MeshSession::get_queue_size() const {
    return queue_ ? queue_->size() : 0;
}

std::vector<DiscoveredPeer> MeshSession::get_discovered_peers() const {
    if (!running_.load() || !discovery_) {
        return {};
    }
    return discovery_->get_discovered_peers();
}

//=============================================================================
// Events
//=============================================================================

void MeshSession::handle_peer_connected(const std::string& peer_id) {
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

    // Retry runs on the queue thread, never on the transport callback thread
    if (running_.load()) {
        queue_->notify_peer_connected(peer_id);
    }
}

void MeshSession::handle_peer_disconnected(const std::string& peer_id) {
    if (pipeline_) {
        pipeline_->handle_peer_disconnected(peer_id);
    }

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

void MeshSession::handle_status_changed(const PeerStatus& status) {
    std::vector<StatusCallback> callbacks;
    bool regained = false;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        regained = status.is_connected && !was_connected_;
        was_connected_ = status.is_connected;
        for (const auto& pair : status_subscribers_) {
            callbacks.push_back(pair.second);
        }
    }

    if (regained) {
        notify_connectivity_regained();
    }
    for (const auto& callback : callbacks) {
        callback(status);
    }
}

void MeshSession::handle_message_received(const Message& message) {
    std::vector<MessageCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& pair : message_subscribers_) {
            callbacks.push_back(pair.second);
        }
    }
    for (const auto& callback : callbacks) {
        callback(message);
    }
}

void MeshSession::handle_relayed_message(const RelayedMessage& message) {
    std::vector<RelayedMessageCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& pair : relayed_subscribers_) {
            callbacks.push_back(pair.second);
        }
    }
    for (const auto& callback : callbacks) {
        callback(message);
    }
}

//=============================================================================
// Subscriptions
//=============================================================================

uint64_t MeshSession::on_message_received(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    message_subscribers_[id] = std::move(callback);
    return id;
}

uint64_t MeshSession::on_peer_connected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    connected_subscribers_[id] = std::move(callback);
    return id;
}

uint64_t MeshSession::on_peer_disconnected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    disconnected_subscribers_[id] = std::move(callback);
    return id;
}

uint64_t MeshSession::on_status_changed(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    status_subscribers_[id] = std::move(callback);
    return id;
}

uint64_t MeshSession::on_relayed_message(RelayedMessageCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    relayed_subscribers_[id] = std::move(callback);
    return id;
}

void MeshSession::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    message_subscribers_.erase(subscription_id);
    connected_subscribers_.erase(subscription_id);
    disconnected_subscribers_.erase(subscription_id);
    status_subscribers_.erase(subscription_id);
    relayed_subscribers_.erase(subscription_id);
}

} // namespace meshchat
