#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace meshchat {

// Milliseconds since the Unix epoch
int64_t now_ms();

// 32 random hex characters
std::string generate_id();

// Peer ids are the first 16 characters of the public key fingerprint
constexpr size_t PEER_ID_LENGTH = 16;
std::string peer_id_from_fingerprint(const std::string& fingerprint);

/**
 * Remote participant, created on first contact and never deleted
 */
struct Peer {
    std::string id;                         // Stable id derived from the public key
    std::string public_key;                 // Public key material (encoded)
    std::string transport_type;             // "webrtc", "relay", ...
    int64_t last_seen;                      // Last activity (ms)
    std::optional<int64_t> connected_at;    // Set while connected
    int connection_quality;                 // 0..100
    uint64_t bytes_sent;
    uint64_t bytes_received;
    int reputation;                         // 0..100
    bool is_blacklisted;
    bool is_verified;                       // False for contacts learned from discovery only

    Peer() : last_seen(0), connection_quality(0), bytes_sent(0), bytes_received(0),
             reputation(50), is_blacklisted(false), is_verified(false) {}

    explicit Peer(const std::string& peer_id) : Peer() { id = peer_id; }
};

enum class MessageType {
    TEXT,
    FILE,
    VOICE,
    REACTION
};

enum class MessageStatus {
    PENDING,
    SENT,
    DELIVERED,
    READ,
    QUEUED,
    FAILED
};

const char* message_type_to_string(MessageType type);
const char* message_status_to_string(MessageStatus status);

struct Reaction {
    std::string user_id;
    std::string emoji;

    Reaction() = default;
    Reaction(const std::string& user, const std::string& e) : user_id(user), emoji(e) {}

    bool operator==(const Reaction& other) const {
        return user_id == other.user_id && emoji == other.emoji;
    }
};

struct MessageMetadata {
    std::string file_name;
    uint64_t file_size;
    std::string file_type;                  // MIME type
    uint32_t duration_ms;                   // Voice notes
    std::vector<uint8_t> blob;              // Reassembled file contents

    MessageMetadata() : file_size(0), duration_ms(0) {}
};

struct Message {
    std::string id;
    std::string conversation_id;
    std::string sender_id;
    std::string recipient_id;
    std::string content;
    int64_t timestamp;
    MessageType type;
    MessageStatus status;
    std::vector<Reaction> reactions;
    std::optional<MessageMetadata> metadata;

    Message() : timestamp(0), type(MessageType::TEXT), status(MessageStatus::PENDING) {}

    /**
     * Add a reaction unless the same (user, emoji) pair is already present
     * @return true if the reaction was added
     */
    bool add_reaction(const Reaction& reaction);
};

enum class RequestStatus {
    PENDING,
    ACCEPTED,
    REJECTED
};

struct Conversation {
    std::string id;
    std::string contact_id;
    int64_t last_message_timestamp;
    std::string last_message_id;
    uint32_t unread_count;
    int64_t created_at;
    std::optional<RequestStatus> request_status;

    Conversation() : last_message_timestamp(0), unread_count(0), created_at(0) {}
};

struct Group {
    std::string id;
    std::string name;
    std::vector<std::string> members;
    int64_t created_at;

    Group() : created_at(0) {}
};

enum class SignalType {
    OFFER,
    ANSWER,
    CANDIDATE
};

const char* signal_type_to_string(SignalType type);
std::optional<SignalType> signal_type_from_string(const std::string& name);

/**
 * Signaling payload received from a peer. Consumed once, never persisted.
 */
struct PendingSignal {
    std::string from;
    SignalType type;
    nlohmann::json signal;

    PendingSignal() : type(SignalType::OFFER) {}

    nlohmann::json to_json() const;

    /**
     * Decode {from, type, signal}. Unknown types, a missing sender or a
     * non-object payload are rejected.
     */
    static std::optional<PendingSignal> from_json(const nlohmann::json& json);
};

/**
 * Outbound message waiting for a successful delivery attempt
 */
struct QueuedOutboundMessage {
    std::string message_id;
    std::string recipient_id;
    std::string content;
    int64_t timestamp;
    std::string group_id;
    uint32_t retries;

    QueuedOutboundMessage() : timestamp(0), retries(0) {}

    nlohmann::json to_json() const;
    static std::optional<QueuedOutboundMessage> from_json(const nlohmann::json& json);
};

/**
 * File handed to the pipeline for sending
 */
struct FileAttachment {
    std::string name;
    std::string mime_type;
    std::vector<uint8_t> data;
};

/**
 * Peer visible on the rendezvous channel
 */
struct DiscoveredPeer {
    std::string id;
    nlohmann::json metadata;
};

} // namespace meshchat
