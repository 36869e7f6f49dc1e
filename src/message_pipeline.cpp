#include "message_pipeline.h"
#include "meshchat_log_macros.h"

#include <optional>
#include <thread>

namespace meshchat {

namespace {

// Outbound group messages are stored under the group's conversation
std::string group_of(const Message& message) {
    return message.conversation_id != message.recipient_id ? message.conversation_id : "";
}

} // namespace

const char* inbound_result_to_string(InboundResult result) {
    switch (result) {
        case InboundResult::Stored:          return "stored";
        case InboundResult::Duplicate:       return "duplicate";
        case InboundResult::ReactionApplied: return "reaction applied";
        case InboundResult::Ignored:         return "ignored";
        case InboundResult::Rejected:        return "rejected";
        case InboundResult::StoreFailed:     return "store failed";
        default: return "unknown";
    }
}

MessagePipeline::MessagePipeline(const std::string& local_peer_id, MessageStore& store,
                                 ConnectionOrchestrator& orchestrator, TransportAdapter& transport,
                                 OfflineQueue& queue, const PipelineOptions& options)
    : local_peer_id_(local_peer_id), store_(store), orchestrator_(orchestrator),
      transport_(transport), queue_(queue), options_(options),
      rate_limiter_(nullptr), file_validator_(nullptr), monitor_(nullptr),
      reassembler_(options.chunk_size, options.max_inbound_file_size), next_subscription_id_(1) {
}

//=============================================================================
// Inbound
//=============================================================================

bool MessagePipeline::claim_message_id(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    if (seen_ids_.count(message_id) > 0) {
        return false;
    }
    // Store lookup and insert under one lock
    if (store_.get_message(message_id)) {
        seen_ids_.insert(message_id);
        return false;
    }
    seen_ids_.insert(message_id);
    return true;
}

void MessagePipeline::forget_message_id(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    seen_ids_.erase(message_id);
}

InboundResult MessagePipeline::handle_inbound(const std::string& sender_id, const std::string& payload) {
    if (sender_id.empty()) {
        LOG_PIPELINE_WARN("Dropping payload without sender identity");
        return InboundResult::Rejected;
    }
    if (sender_id == local_peer_id_) {
        LOG_PIPELINE_DEBUG("Suppressing echo of our own message");
        return InboundResult::Ignored;
    }

    auto envelope = WireCodec::decode_envelope(payload);
    if (!envelope) {
        LOG_PIPELINE_WARN("Rejected malformed envelope from " << sender_id);
        return InboundResult::Rejected;
    }

    if (envelope->type == EnvelopeType::REACTION) {
        // Reactions are attributed to the transport identity, not the claimed userId
        if (!envelope->user_id.empty() && envelope->user_id != sender_id) {
            LOG_PIPELINE_WARN("Reaction from " << sender_id << " claims user " << envelope->user_id);
        }
        return apply_reaction(envelope->target_message_id, Reaction(sender_id, envelope->emoji));
    }

    if (envelope->type == EnvelopeType::FILE_START && !reassembler_.accepts_size(envelope->file_size)) {
        LOG_PIPELINE_WARN("Rejected file of " << envelope->file_size << " bytes from " << sender_id
                          << " (limit " << reassembler_.max_file_size() << ")");
        return InboundResult::Rejected;
    }

    std::string message_id = envelope->id.empty()
        ? std::to_string(envelope->timestamp) + "-" + sender_id
        : envelope->id;

    if (!claim_message_id(message_id)) {
        LOG_PIPELINE_DEBUG("Duplicate message " << message_id << " from " << sender_id);
        return InboundResult::Duplicate;
    }

    Message message;
    message.id = message_id;
    message.conversation_id = envelope->group_id.empty() ? sender_id : envelope->group_id;
    message.sender_id = sender_id;
    message.recipient_id = local_peer_id_;
    message.timestamp = envelope->timestamp;
    message.status = MessageStatus::DELIVERED;
    message.content = envelope->text;

    bool register_transfer = false;
    switch (envelope->type) {
        case EnvelopeType::TEXT:
            message.type = MessageType::TEXT;
            break;
        case EnvelopeType::VOICE: {
            message.type = MessageType::VOICE;
            MessageMetadata metadata;
            metadata.duration_ms = envelope->duration_ms;
            message.metadata = metadata;
            break;
        }
        case EnvelopeType::FILE_START: {
            message.type = MessageType::FILE;
            MessageMetadata metadata;
            metadata.file_name = envelope->file_name;
            metadata.file_size = envelope->file_size;
            metadata.file_type = envelope->file_type;
            message.metadata = metadata;
            register_transfer = envelope->file_size > 0;
            break;
        }
        case EnvelopeType::REACTION:
            break;
    }

    if (register_transfer) {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        prune_stale_transfers_locked();
        if (!reassembler_.begin(sender_id, message_id, envelope->file_size)) {
            LOG_PIPELINE_WARN("Transfer " << message_id << " from " << sender_id << " already in progress");
        }
        transfer_messages_[std::make_pair(sender_id, WireCodec::normalize_transfer_id(message_id))] = message_id;
    }

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        if (!store_.save_message(message)) {
            LOG_PIPELINE_ERROR("Failed to persist message " << message_id);
            forget_message_id(message_id);
            if (register_transfer) {
                std::lock_guard<std::mutex> transfer_lock(transfers_mutex_);
                reassembler_.cancel(sender_id, message_id);
                transfer_messages_.erase(std::make_pair(sender_id, WireCodec::normalize_transfer_id(message_id)));
            }
            return InboundResult::StoreFailed;
        }
        std::string contact_id = envelope->group_id.empty() ? sender_id : envelope->group_id;
        update_conversation(message, message.conversation_id, contact_id, true);
    }

    LOG_PIPELINE_DEBUG("Stored " << message_type_to_string(message.type) << " message "
                       << message_id << " from " << sender_id);
    notify_message_received(message);
    return InboundResult::Stored;
}

InboundResult MessagePipeline::handle_binary(const std::string& sender_id, const std::vector<uint8_t>& data) {
    if (sender_id == local_peer_id_) {
        return InboundResult::Ignored;
    }

    std::string transfer_id;
    std::string message_id;
    std::optional<std::vector<uint8_t>> blob;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        prune_stale_transfers_locked();
        ChunkResult result = reassembler_.add_frame(sender_id, data, &transfer_id);

        switch (result) {
            case ChunkResult::Accepted:
                return InboundResult::Stored;
            case ChunkResult::Duplicate:
                return InboundResult::Duplicate;
            case ChunkResult::Complete:
                break;
            case ChunkResult::Malformed:
                LOG_PIPELINE_WARN("Malformed chunk frame from " << sender_id);
                return InboundResult::Rejected;
            default:
                LOG_PIPELINE_WARN("Dropping chunk for " << transfer_id << " from " << sender_id
                                  << ": " << chunk_result_to_string(result));
                return InboundResult::Ignored;
        }

        blob = reassembler_.take(sender_id, transfer_id);
        auto it = transfer_messages_.find(std::make_pair(sender_id, transfer_id));
        if (it != transfer_messages_.end()) {
            message_id = it->second;
            transfer_messages_.erase(it);
        } else {
            message_id = transfer_id;
        }
    }

    if (!blob) {
        LOG_PIPELINE_ERROR("Transfer " << message_id << " completed with a size mismatch");
        return InboundResult::Rejected;
    }

    attach_blob(message_id, std::move(*blob));
    return InboundResult::Stored;
}

void MessagePipeline::handle_peer_disconnected(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    size_t dropped = reassembler_.cancel_sender(peer_id);
    auto it = transfer_messages_.lower_bound(std::make_pair(peer_id, std::string()));
    while (it != transfer_messages_.end() && it->first.first == peer_id) {
        it = transfer_messages_.erase(it);
    }
    if (dropped > 0) {
        LOG_PIPELINE_INFO("Dropped " << dropped << " partial transfer(s) from disconnected peer " << peer_id);
    }
}

size_t MessagePipeline::prune_stale_transfers() {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    return prune_stale_transfers_locked();
}

// Requires transfers_mutex_ held
size_t MessagePipeline::prune_stale_transfers_locked() {
    auto pruned = reassembler_.prune_stale(options_.transfer_idle_timeout);
    for (const auto& key : pruned) {
        transfer_messages_.erase(key);
    }
    return pruned.size();
}

void MessagePipeline::attach_blob(const std::string& message_id, std::vector<uint8_t> blob) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto message = store_.get_message(message_id);
    if (!message) {
        LOG_PIPELINE_WARN("Completed transfer " << message_id << " has no message record");
        return;
    }
    if (!message->metadata) {
        message->metadata = MessageMetadata();
    }
    message->metadata->blob = std::move(blob);
    if (!store_.save_message(*message)) {
        LOG_PIPELINE_ERROR("Failed to persist file contents for " << message_id);
        return;
    }
    LOG_PIPELINE_INFO("File transfer " << message_id << " complete (" << message->metadata->blob.size() << " bytes)");
}

InboundResult MessagePipeline::apply_reaction(const std::string& target_message_id, const Reaction& reaction) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto message = store_.get_message(target_message_id);
    if (!message) {
        LOG_PIPELINE_WARN("Reaction for unknown message " << target_message_id);
        return InboundResult::Ignored;
    }
    if (!message->add_reaction(reaction)) {
        return InboundResult::ReactionApplied;
    }
    if (!store_.save_message(*message)) {
        LOG_PIPELINE_ERROR("Failed to persist reaction on " << target_message_id);
        return InboundResult::StoreFailed;
    }
    return InboundResult::ReactionApplied;
}

// Requires records_mutex_ held
void MessagePipeline::update_conversation(const Message& message, const std::string& conversation_id,
                                          const std::string& contact_id, bool inbound) {
    auto existing = store_.get_conversation(conversation_id);
    Conversation conversation;
    if (existing) {
        conversation = *existing;
    } else {
        conversation.id = conversation_id;
        conversation.contact_id = contact_id;
        conversation.created_at = now_ms();
        if (inbound && conversation_id == message.sender_id) {
            auto peer = store_.get_peer(message.sender_id);
            if (!peer || !peer->is_verified) {
                conversation.request_status = RequestStatus::PENDING;
            }
        }
        LOG_PIPELINE_INFO("New conversation " << conversation_id);
    }

    conversation.last_message_timestamp = message.timestamp;
    conversation.last_message_id = message.id;
    if (inbound) {
        conversation.unread_count++;
    }

    if (!store_.save_conversation(conversation)) {
        LOG_PIPELINE_ERROR("Failed to persist conversation " << conversation_id);
    }
}

//=============================================================================
// Outbound
//=============================================================================

OperationResult MessagePipeline::send(const std::string& recipient_id, const std::string& content,
                                      const std::vector<FileAttachment>& attachments,
                                      const std::string& group_id, Message* out_message) {
    if (recipient_id.empty() || recipient_id == local_peer_id_) {
        return OperationResult::failure(MeshError::SendFailed, "invalid recipient '" + recipient_id + "'");
    }

    ScopedMeasure measure(monitor_, attachments.empty() ? "send_message" : "send_files");

    if (rate_limiter_ && !rate_limiter_->can_send_message(recipient_id)) {
        LOG_PIPELINE_WARN("Rate limited sending to " << recipient_id);
        return OperationResult::failure(MeshError::RateLimited);
    }

    if (!attachments.empty()) {
        std::string reason;
        if (file_validator_ && !file_validator_->validate(attachments, reason)) {
            LOG_PIPELINE_WARN("File validation failed: " << reason);
            return OperationResult::failure(MeshError::ValidationFailed, reason);
        }
        if (rate_limiter_ && !rate_limiter_->can_send_file(recipient_id)) {
            LOG_PIPELINE_WARN("File rate limit reached for " << recipient_id);
            return OperationResult::failure(MeshError::RateLimited, "file rate limit reached");
        }
    }

    int64_t timestamp = now_ms();
    std::vector<Message> messages;

    auto make_message = [&](MessageType type) {
        Message message;
        message.id = generate_id();
        message.conversation_id = group_id.empty() ? recipient_id : group_id;
        message.sender_id = local_peer_id_;
        message.recipient_id = recipient_id;
        message.content = content;
        message.timestamp = timestamp;
        message.type = type;
        message.status = MessageStatus::PENDING;
        return message;
    };

    if (attachments.empty()) {
        messages.push_back(make_message(MessageType::TEXT));
    } else {
        for (const auto& file : attachments) {
            Message message = make_message(MessageType::FILE);
            MessageMetadata metadata;
            metadata.file_name = file.name;
            metadata.file_size = file.data.size();
            metadata.file_type = file.mime_type;
            metadata.blob = file.data;
            message.metadata = std::move(metadata);
            messages.push_back(std::move(message));
        }
    }

    return dispatch_outbound(messages, out_message);
}

OperationResult MessagePipeline::send_voice(const std::string& recipient_id, const std::string& data,
                                            uint32_t duration_ms, const std::string& group_id,
                                            Message* out_message) {
    if (recipient_id.empty() || recipient_id == local_peer_id_) {
        return OperationResult::failure(MeshError::SendFailed, "invalid recipient '" + recipient_id + "'");
    }
    if (rate_limiter_ && !rate_limiter_->can_send_message(recipient_id)) {
        return OperationResult::failure(MeshError::RateLimited);
    }

    Message message;
    message.id = generate_id();
    message.conversation_id = group_id.empty() ? recipient_id : group_id;
    message.sender_id = local_peer_id_;
    message.recipient_id = recipient_id;
    message.content = data;
    message.timestamp = now_ms();
    message.type = MessageType::VOICE;
    message.status = MessageStatus::PENDING;
    MessageMetadata metadata;
    metadata.duration_ms = duration_ms;
    message.metadata = metadata;

    return dispatch_outbound({message}, out_message);
}

OperationResult MessagePipeline::dispatch_outbound(const std::vector<Message>& messages, Message* out_message) {
    // Tentative: visible in the store before any network activity
    for (const auto& message : messages) {
        std::lock_guard<std::mutex> lock(records_mutex_);
        if (!store_.save_message(message)) {
            LOG_PIPELINE_ERROR("Failed to persist outbound message " << message.id);
            return OperationResult::failure(MeshError::SendFailed, "failed to persist message");
        }
        {
            std::lock_guard<std::mutex> seen_lock(seen_mutex_);
            seen_ids_.insert(message.id);
        }
        update_conversation(message, message.conversation_id, message.recipient_id, false);
    }

    OperationResult result;
    for (const auto& message : messages) {
        if (deliver(message)) {
            set_status(message.id, MessageStatus::SENT);
            continue;
        }

        QueuedOutboundMessage item;
        item.message_id = message.id;
        item.recipient_id = message.recipient_id;
        item.content = message.content;
        item.timestamp = message.timestamp;
        item.group_id = group_of(message);

        OperationResult queued = queue_.enqueue(item);
        if (queued) {
            set_status(message.id, MessageStatus::QUEUED);
            LOG_PIPELINE_INFO("Message " << message.id << " queued for " << message.recipient_id);
        } else {
            set_status(message.id, MessageStatus::FAILED);
            LOG_PIPELINE_ERROR("Could not queue message " << message.id << ": " << queued.error_message);
            result = queued;
        }
    }

    if (out_message) {
        auto stored = store_.get_message(messages.front().id);
        if (stored) {
            *out_message = *stored;
        }
    }
    return result;
}

bool MessagePipeline::deliver(const Message& message) {
    const std::string& recipient_id = message.recipient_id;

    if (!orchestrator_.is_connected(recipient_id)) {
        OperationResult connected = orchestrator_.connect(recipient_id, options_.connect_timeout);
        if (!connected) {
            LOG_PIPELINE_DEBUG("Cannot reach " << recipient_id << ": " << connected.error_message);
            return false;
        }
    }

    std::string group_id = group_of(message);
    switch (message.type) {
        case MessageType::FILE:
            return send_file(message, group_id);
        case MessageType::VOICE: {
            Envelope envelope;
            envelope.type = EnvelopeType::VOICE;
            envelope.id = message.id;
            envelope.text = message.content;
            envelope.timestamp = message.timestamp;
            envelope.group_id = group_id;
            envelope.duration_ms = message.metadata ? message.metadata->duration_ms : 0;
            return transport_.send_text(recipient_id, WireCodec::encode_envelope(envelope));
        }
        default:
            return transport_.send_text(recipient_id, WireCodec::encode_envelope(
                Envelope::make_text(message.id, message.content, message.timestamp, group_id)));
    }
}

bool MessagePipeline::send_file(const Message& message, const std::string& group_id) {
    if (!message.metadata) {
        LOG_PIPELINE_ERROR("File message " << message.id << " has no file data");
        return false;
    }
    const MessageMetadata& metadata = *message.metadata;

    ScopedMeasure measure(monitor_, "file_transfer");

    Envelope start = Envelope::make_file_start(message.id, metadata.file_name, metadata.blob.size(),
                                               metadata.file_type, message.content, message.timestamp, group_id);
    if (!transport_.send_text(message.recipient_id, WireCodec::encode_envelope(start))) {
        return false;
    }

    auto frames = WireCodec::split_into_chunks(message.id, metadata.blob, options_.chunk_size);
    for (size_t i = 0; i < frames.size(); ++i) {
        if (!transport_.send_binary(message.recipient_id, frames[i])) {
            LOG_PIPELINE_WARN("Transfer " << message.id << " failed at chunk " << i << "/" << frames.size());
            return false;
        }
        if (options_.yield_every_chunks > 0 && (i + 1) % options_.yield_every_chunks == 0) {
            std::this_thread::yield();
        }
    }

    LOG_PIPELINE_DEBUG("Sent " << frames.size() << " chunks for " << metadata.file_name);
    return true;
}

OperationResult MessagePipeline::send_reaction(const std::string& recipient_id, const std::string& target_message_id,
                                               const std::string& emoji, const std::string& group_id) {
    if (target_message_id.empty() || emoji.empty()) {
        return OperationResult::failure(MeshError::SendFailed, "reaction needs a target and an emoji");
    }
    if (rate_limiter_ && !rate_limiter_->can_send_message(recipient_id)) {
        return OperationResult::failure(MeshError::RateLimited);
    }

    apply_reaction(target_message_id, Reaction(local_peer_id_, emoji));

    if (!orchestrator_.is_connected(recipient_id)) {
        OperationResult connected = orchestrator_.connect(recipient_id, options_.connect_timeout);
        if (!connected) {
            return connected;
        }
    }

    Envelope envelope = Envelope::make_reaction(target_message_id, emoji, local_peer_id_, now_ms(), group_id);
    if (!transport_.send_text(recipient_id, WireCodec::encode_envelope(envelope))) {
        return OperationResult::failure(MeshError::SendFailed, "transport refused reaction");
    }
    return OperationResult::ok();
}

bool MessagePipeline::set_status(const std::string& message_id, MessageStatus status) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto message = store_.get_message(message_id);
    if (!message) {
        return false;
    }
    message->status = status;
    if (!store_.save_message(*message)) {
        LOG_PIPELINE_ERROR("Failed to persist status " << message_status_to_string(status)
                           << " for " << message_id);
        return false;
    }
    return true;
}

//=============================================================================
// Retry
//=============================================================================

bool MessagePipeline::retry_queued(const QueuedOutboundMessage& item) {
    auto stored = store_.get_message(item.message_id);

    Message message;
    if (stored) {
        if (stored->status == MessageStatus::SENT || stored->status == MessageStatus::DELIVERED ||
            stored->status == MessageStatus::READ) {
            return true;
        }
        message = *stored;
    } else {
        // Record lost; resend from the queue entry alone
        message.id = item.message_id;
        message.sender_id = local_peer_id_;
        message.recipient_id = item.recipient_id;
        message.conversation_id = item.group_id.empty() ? item.recipient_id : item.group_id;
        message.content = item.content;
        message.timestamp = item.timestamp;
    }

    if (!deliver(message)) {
        return false;
    }

    if (stored) {
        set_status(item.message_id, MessageStatus::SENT);
    }
    LOG_PIPELINE_INFO("Delivered queued message " << item.message_id << " to " << item.recipient_id);
    return true;
}

void MessagePipeline::mark_failed(const QueuedOutboundMessage& item) {
    set_status(item.message_id, MessageStatus::FAILED);
}

//=============================================================================
// Subscriptions
//=============================================================================

uint64_t MessagePipeline::on_message_received(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    uint64_t id = next_subscription_id_++;
    message_subscribers_[id] = std::move(callback);
    return id;
}

void MessagePipeline::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    message_subscribers_.erase(subscription_id);
}

void MessagePipeline::notify_message_received(const Message& message) {
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

size_t MessagePipeline::seen_count() const {
    std::lock_guard<std::mutex> lock(seen_mutex_);
    return seen_ids_.size();
}

} // namespace meshchat
