#pragma once

#include "capabilities.h"
#include "connection_orchestrator.h"
#include "errors.h"
#include "offline_queue.h"
#include "wire_codec.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace meshchat {

struct PipelineOptions {
    std::chrono::milliseconds connect_timeout;
    uint32_t chunk_size;
    uint32_t yield_every_chunks;
    uint64_t max_inbound_file_size;
    std::chrono::milliseconds transfer_idle_timeout;    // Partial inbound transfers idle this long are dropped

    PipelineOptions()
        : connect_timeout(10000), chunk_size(DEFAULT_CHUNK_SIZE), yield_every_chunks(10),
          max_inbound_file_size(DEFAULT_MAX_INBOUND_FILE_SIZE), transfer_idle_timeout(60000) {}
};

// Outcome of processing one inbound payload
enum class InboundResult {
    Stored,             // New message persisted
    Duplicate,          // Already processed, dropped
    ReactionApplied,    // Reaction merged into its target
    Ignored,            // Echo, unknown reaction target or stray chunk
    Rejected,           // Payload failed to decode
    StoreFailed         // Persisting the message failed
};

const char* inbound_result_to_string(InboundResult result);

/**
 * Turns wire payloads into stored messages and stored messages into wire
 * payloads. The store is the source of truth for message status; views
 * handed back to callers are re-read from it.
 */
class MessagePipeline {
public:
    using MessageCallback = std::function<void(const Message& message)>;

    MessagePipeline(const std::string& local_peer_id, MessageStore& store,
                    ConnectionOrchestrator& orchestrator, TransportAdapter& transport,
                    OfflineQueue& queue, const PipelineOptions& options = PipelineOptions());

    // Optional policy services, not owned
    void set_rate_limiter(RateLimiter* limiter) { rate_limiter_ = limiter; }
    void set_file_validator(FileValidator* validator) { file_validator_ = validator; }
    void set_performance_monitor(PerformanceMonitor* monitor) { monitor_ = monitor; }

    /**
     * Process a JSON envelope received from a peer
     * @param sender_id Identity asserted by the transport
     */
    InboundResult handle_inbound(const std::string& sender_id, const std::string& payload);

    // Process a binary chunk frame received from a peer
    InboundResult handle_binary(const std::string& sender_id, const std::vector<uint8_t>& data);

    /**
     * Send a text message, or one file message per attachment with
     * `content` as caption. Connection and transport failures move the
     * message to the offline queue and are not reported as errors.
     * @param out_message Stored state of the (first) message after the attempt
     */
    OperationResult send(const std::string& recipient_id, const std::string& content,
                         const std::vector<FileAttachment>& attachments = {},
                         const std::string& group_id = "", Message* out_message = nullptr);

    // Voice note, `data` is base64 encoded audio
    OperationResult send_voice(const std::string& recipient_id, const std::string& data, uint32_t duration_ms,
                               const std::string& group_id = "", Message* out_message = nullptr);

    /**
     * React to a message. Applied locally first; reactions are not queued
     * when the peer cannot be reached.
     */
    OperationResult send_reaction(const std::string& recipient_id, const std::string& target_message_id,
                                  const std::string& emoji, const std::string& group_id = "");

    /**
     * Delivery attempt used by the offline queue. Marks the stored message
     * sent on success.
     */
    bool retry_queued(const QueuedOutboundMessage& item);

    // Called when the queue abandons an item
    void mark_failed(const QueuedOutboundMessage& item);

    uint64_t on_message_received(MessageCallback callback);
    void unsubscribe(uint64_t subscription_id);

    // Drops the peer's partially received files
    void handle_peer_disconnected(const std::string& peer_id);

    // Drops partial transfers idle longer than the configured timeout
    size_t prune_stale_transfers();

    size_t seen_count() const;
    size_t active_transfer_count() const { return reassembler_.active_transfer_count(); }

private:
    std::string local_peer_id_;
    MessageStore& store_;
    ConnectionOrchestrator& orchestrator_;
    TransportAdapter& transport_;
    OfflineQueue& queue_;
    PipelineOptions options_;

    RateLimiter* rate_limiter_;
    FileValidator* file_validator_;
    PerformanceMonitor* monitor_;

    // Ids already processed in this session
    mutable std::mutex seen_mutex_;
    std::unordered_set<std::string> seen_ids_;

    // Read-modify-write of stored messages and conversations
    std::mutex records_mutex_;

    ChunkReassembler reassembler_;
    std::mutex transfers_mutex_;
    // (sender, normalized transfer id) -> message id
    std::map<std::pair<std::string, std::string>, std::string> transfer_messages_;

    std::mutex subscribers_mutex_;
    uint64_t next_subscription_id_;
    std::map<uint64_t, MessageCallback> message_subscribers_;

    bool claim_message_id(const std::string& message_id);
    void forget_message_id(const std::string& message_id);

    InboundResult apply_reaction(const std::string& target_message_id, const Reaction& reaction);
    void update_conversation(const Message& message, const std::string& conversation_id,
                             const std::string& contact_id, bool inbound);
    void attach_blob(const std::string& transfer_id, std::vector<uint8_t> blob);
    size_t prune_stale_transfers_locked();

    OperationResult dispatch_outbound(const std::vector<Message>& messages, Message* out_message);
    bool deliver(const Message& message);
    bool send_file(const Message& message, const std::string& group_id);
    bool set_status(const std::string& message_id, MessageStatus status);

    void notify_message_received(const Message& message);
};

} // namespace meshchat
