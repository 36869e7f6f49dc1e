#include "offline_queue.h"
#include "fs.h"
#include "meshchat_log_macros.h"

#include <algorithm>
#include <unordered_set>

namespace meshchat {

//=============================================================================
// JsonFileQueueStorage
//=============================================================================

JsonFileQueueStorage::JsonFileQueueStorage(const std::string& path) : path_(path) {
}

bool JsonFileQueueStorage::load(std::vector<QueuedOutboundMessage>& out_items) {
    out_items.clear();

    if (!file_exists(path_)) {
        LOG_DEBUG("queue", "No queue file at " << path_);
        return true;
    }

    std::string data;
    if (!read_file_text(path_, data)) {
        LOG_ERROR("queue", "Failed to read queue file " << path_);
        return false;
    }
    if (data.empty()) {
        return true;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(data);
        if (!json.is_array()) {
            LOG_ERROR("queue", "Invalid queue file format - expected array");
            return false;
        }
        for (const auto& entry : json) {
            auto item = QueuedOutboundMessage::from_json(entry);
            if (!item) {
                LOG_WARN("queue", "Skipping malformed queue entry: " << entry.dump());
                continue;
            }
            out_items.push_back(std::move(*item));
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("queue", "Failed to parse queue file: " << e.what());
        return false;
    }

    return true;
}

bool JsonFileQueueStorage::save(const std::vector<QueuedOutboundMessage>& items) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& item : items) {
        json.push_back(item.to_json());
    }
    return write_file_atomic(path_, json.dump(4));
}

//=============================================================================
// OfflineQueue
//=============================================================================

OfflineQueue::OfflineQueue(size_t max_size, uint32_t max_retries, QueueStorage* storage)
    : max_size_(max_size == 0 ? DEFAULT_MAX_SIZE : max_size),
      max_retries_(max_retries), storage_(storage),
      interval_(std::chrono::milliseconds(30000)), running_(false), full_pass_requested_(false) {
}

OfflineQueue::~OfflineQueue() {
    stop();
}

bool OfflineQueue::load() {
    if (!storage_) {
        return true;
    }

    std::vector<QueuedOutboundMessage> loaded;
    if (!storage_->load(loaded)) {
        LOG_QUEUE_ERROR("Failed to load queued messages");
        return false;
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto& item : loaded) {
        if (items_.size() >= max_size_) {
            LOG_QUEUE_WARN("Queue file holds more than " << max_size_ << " items, keeping the oldest");
            break;
        }
        items_.push_back(std::move(item));
    }
    LOG_QUEUE_INFO("Restored " << items_.size() << " queued messages");
    return true;
}

OperationResult OfflineQueue::enqueue(const QueuedOutboundMessage& item) {
    if (item.recipient_id.empty()) {
        return OperationResult::failure(MeshError::SendFailed, "queued message has no recipient");
    }

    QueuedOutboundMessage queued = item;
    if (queued.message_id.empty()) {
        queued.message_id = generate_id();
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);

    auto it = std::find_if(items_.begin(), items_.end(), [&](const QueuedOutboundMessage& existing) {
        return existing.message_id == queued.message_id;
    });
    if (it != items_.end()) {
        return OperationResult::ok();
    }

    if (items_.size() >= max_size_) {
        LOG_QUEUE_WARN("Queue full (" << max_size_ << "), rejecting message for " << queued.recipient_id);
        return OperationResult::failure(MeshError::QueueFull);
    }

    items_.push_back(queued);
    LOG_QUEUE_DEBUG("Queued message " << queued.message_id << " for " << queued.recipient_id
                    << " (" << items_.size() << " queued)");
    persist_locked();
    return OperationResult::ok();
}

size_t OfflineQueue::process_queue(const AttemptFunction& attempt, const std::string& recipient_id) {
    if (!attempt) {
        return 0;
    }

    std::lock_guard<std::mutex> process_lock(process_mutex_);
    return run_pass_locked(attempt, recipient_id);
}

// Requires process_mutex_ held
size_t OfflineQueue::run_pass_locked(const AttemptFunction& attempt, const std::string& recipient_id) {
    std::vector<QueuedOutboundMessage> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (const auto& item : items_) {
            if (recipient_id.empty() || item.recipient_id == recipient_id) {
                batch.push_back(item);
            }
        }
    }
    if (batch.empty()) {
        return 0;
    }

    LOG_QUEUE_DEBUG("Retrying " << batch.size() << " queued messages"
                    << (recipient_id.empty() ? "" : " for " + recipient_id));

    // Attempts run without the queue lock
    size_t delivered_count = 0;
    std::unordered_set<std::string> served;
    std::unordered_set<std::string> delivered;
    std::unordered_set<std::string> failed;
    for (const auto& item : batch) {
        if (recipient_id.empty()) {
            // A peer that just connected is not kept waiting behind unreachable ones
            delivered_count += serve_priority_locked(attempt, served);
            if (served.count(item.recipient_id) > 0 || !contains(item.message_id)) {
                continue;
            }
        }
        if (attempt(item)) {
            delivered.insert(item.message_id);
        } else {
            failed.insert(item.message_id);
        }
    }

    settle_locked(delivered, failed);
    return delivered_count + delivered.size();
}

// Requires process_mutex_ held
size_t OfflineQueue::serve_priority_locked(const AttemptFunction& attempt, std::unordered_set<std::string>& served) {
    size_t delivered_count = 0;
    while (true) {
        std::string peer_id;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (priority_recipients_.empty()) {
                break;
            }
            peer_id = priority_recipients_.front();
            priority_recipients_.pop_front();
        }
        served.insert(peer_id);
        delivered_count += run_pass_locked(attempt, peer_id);
    }
    return delivered_count;
}

// Requires process_mutex_ held
void OfflineQueue::settle_locked(const std::unordered_set<std::string>& delivered,
                                 const std::unordered_set<std::string>& failed) {
    std::vector<QueuedOutboundMessage> exhausted;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (auto it = items_.begin(); it != items_.end();) {
            if (delivered.count(it->message_id) > 0) {
                it = items_.erase(it);
                continue;
            }
            if (failed.count(it->message_id) > 0) {
                it->retries++;
                if (max_retries_ > 0 && it->retries >= max_retries_) {
                    exhausted.push_back(*it);
                    it = items_.erase(it);
                    continue;
                }
            }
            ++it;
        }
        persist_locked();
    }

    if (!delivered.empty()) {
        LOG_QUEUE_INFO("Delivered " << delivered.size() << " queued messages");
    }

    if (!exhausted.empty()) {
        ExhaustedCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = exhausted_callback_;
        }
        for (const auto& item : exhausted) {
            LOG_QUEUE_WARN("Giving up on message " << item.message_id << " after " << item.retries << " retries");
            if (callback) {
                callback(item);
            }
        }
    }
}

bool OfflineQueue::start(AttemptFunction attempt, std::chrono::milliseconds interval) {
    if (running_.load()) {
        return false;
    }

    timer_attempt_ = std::move(attempt);
    interval_ = interval;
    reset_shutdown();
    running_.store(true);
    if (!add_managed_thread([this]() { retry_loop(); }, "offline-queue-retry")) {
        running_.store(false);
        return false;
    }
    LOG_QUEUE_INFO("Retry timer started (every " << interval_.count() << " ms)");
    return true;
}

void OfflineQueue::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    shutdown_all_threads();
    join_all_active_threads();
    LOG_QUEUE_INFO("Retry timer stopped");
}

void OfflineQueue::notify_connectivity_regained() {
    if (!running_.load()) {
        return;
    }
    LOG_QUEUE_DEBUG("Connectivity regained, retrying queued messages");
    full_pass_requested_.store(true);
    wake();
}

void OfflineQueue::notify_peer_connected(const std::string& peer_id) {
    if (!running_.load() || peer_id.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        bool has_items = std::any_of(items_.begin(), items_.end(), [&](const QueuedOutboundMessage& item) {
            return item.recipient_id == peer_id;
        });
        if (!has_items ||
            std::find(priority_recipients_.begin(), priority_recipients_.end(), peer_id) != priority_recipients_.end()) {
            return;
        }
        priority_recipients_.push_back(peer_id);
    }
    LOG_QUEUE_DEBUG("Peer " << peer_id << " connected, retrying its queued messages first");
    wake();
}

void OfflineQueue::retry_loop() {
    auto next_full_pass = std::chrono::steady_clock::now() + interval_;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        auto wait = next_full_pass > now
            ? std::chrono::duration_cast<std::chrono::milliseconds>(next_full_pass - now)
            : std::chrono::milliseconds(0);
        if (interruptible_wait(wait)) {
            break;
        }

        {
            std::lock_guard<std::mutex> process_lock(process_mutex_);
            std::unordered_set<std::string> served;
            serve_priority_locked(timer_attempt_, served);
        }

        if (full_pass_requested_.exchange(false) || std::chrono::steady_clock::now() >= next_full_pass) {
            process_queue(timer_attempt_);
            next_full_pass = std::chrono::steady_clock::now() + interval_;
        }
    }
}

void OfflineQueue::set_exhausted_callback(ExhaustedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    exhausted_callback_ = std::move(callback);
}

size_t OfflineQueue::size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return items_.size();
}

bool OfflineQueue::empty() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return items_.empty();
}

bool OfflineQueue::contains(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return std::any_of(items_.begin(), items_.end(), [&](const QueuedOutboundMessage& item) {
        return item.message_id == message_id;
    });
}

std::vector<QueuedOutboundMessage> OfflineQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return std::vector<QueuedOutboundMessage>(items_.begin(), items_.end());
}

void OfflineQueue::persist_locked() {
    if (!storage_) {
        return;
    }
    std::vector<QueuedOutboundMessage> items(items_.begin(), items_.end());
    if (!storage_->save(items)) {
        LOG_QUEUE_ERROR("Failed to persist " << items.size() << " queued messages");
    }
}

} // namespace meshchat
