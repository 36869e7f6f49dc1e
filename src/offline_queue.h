#pragma once

#include "capabilities.h"
#include "errors.h"
#include "threadmanager.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace meshchat {

/**
 * QueueStorage backed by a JSON array file. A missing file loads as an
 * empty queue.
 */
class JsonFileQueueStorage : public QueueStorage {
public:
    explicit JsonFileQueueStorage(const std::string& path);

    bool load(std::vector<QueuedOutboundMessage>& out_items) override;
    bool save(const std::vector<QueuedOutboundMessage>& items) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Bounded FIFO of outbound messages awaiting delivery. Items leave the
 * queue only when an attempt succeeds, or when max_retries is positive
 * and exhausted (reported through the exhausted callback).
 */
class OfflineQueue : public ThreadManager {
public:
    using AttemptFunction = std::function<bool(const QueuedOutboundMessage& item)>;
    using ExhaustedCallback = std::function<void(const QueuedOutboundMessage& item)>;

    static constexpr size_t DEFAULT_MAX_SIZE = 1000;

    /**
     * @param max_size Capacity, enqueue fails with QueueFull beyond it
     * @param max_retries 0 retries forever
     * @param storage Optional durable backing, not owned
     */
    explicit OfflineQueue(size_t max_size = DEFAULT_MAX_SIZE, uint32_t max_retries = 0,
                          QueueStorage* storage = nullptr);
    ~OfflineQueue();

    // Restore items saved by a previous session
    bool load();

    /**
     * Append an item. An item whose message_id is already queued is
     * accepted without being added twice.
     */
    OperationResult enqueue(const QueuedOutboundMessage& item);

    /**
     * Attempt every queued item in FIFO order
     * @param attempt Delivery function, true on success
     * @param recipient_id Restrict the pass to one recipient, empty for all
     * @return Number of items delivered and removed
     */
    size_t process_queue(const AttemptFunction& attempt, const std::string& recipient_id = "");

    /**
     * Start the periodic retry timer
     * @return false if already running
     */
    bool start(AttemptFunction attempt, std::chrono::milliseconds interval);
    void stop();
    bool is_running() const { return running_.load(); }

    // Run a full retry pass now instead of waiting for the timer
    void notify_connectivity_regained();

    /**
     * Retry the items addressed to `peer_id` on the retry thread, ahead of
     * any other queued item. A full pass in progress serves it between
     * items.
     */
    void notify_peer_connected(const std::string& peer_id);

    void set_exhausted_callback(ExhaustedCallback callback);

    size_t size() const;
    bool empty() const;
    bool contains(const std::string& message_id) const;
    std::vector<QueuedOutboundMessage> snapshot() const;

private:
    size_t max_size_;
    uint32_t max_retries_;
    QueueStorage* storage_;

    mutable std::mutex queue_mutex_;
    std::deque<QueuedOutboundMessage> items_;

    std::mutex process_mutex_;                  // One retry pass at a time
    std::mutex callback_mutex_;
    ExhaustedCallback exhausted_callback_;

    AttemptFunction timer_attempt_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<bool> full_pass_requested_;
    std::deque<std::string> priority_recipients_;   // guarded by queue_mutex_

    void retry_loop();
    size_t run_pass_locked(const AttemptFunction& attempt, const std::string& recipient_id);
    size_t serve_priority_locked(const AttemptFunction& attempt, std::unordered_set<std::string>& served);
    void settle_locked(const std::unordered_set<std::string>& delivered,
                       const std::unordered_set<std::string>& failed);
    void persist_locked();
};

} // namespace meshchat
