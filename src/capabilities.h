#pragma once

/**
 * @file capabilities.h
 * @brief Interfaces of the collaborators the delivery core depends on.
 *
 * The transport, the persistent store and the policy services live outside
 * this library; embedding applications hand implementations to MeshSession.
 */

#include "types.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meshchat {

/**
 * Raw connection primitives of the underlying peer transport.
 * Handlers may be invoked from any thread.
 */
class TransportAdapter {
public:
    using TextHandler = std::function<void(const std::string& peer_id, const std::string& data)>;
    using BinaryHandler = std::function<void(const std::string& peer_id, const std::vector<uint8_t>& data)>;
    using PeerHandler = std::function<void(const std::string& peer_id)>;

    virtual ~TransportAdapter() = default;

    /**
     * Create a connection offer for a peer
     * @return Offer ({"peerId", "sdp", ...}) or nullopt on failure
     */
    virtual std::optional<nlohmann::json> create_offer(const std::string& peer_id) = 0;

    /**
     * Accept a remote offer
     * @return Answer to return to the offering peer, nullopt on failure
     */
    virtual std::optional<nlohmann::json> accept_offer(const nlohmann::json& offer) = 0;

    // Complete the handshake with the remote answer
    virtual bool finalize(const nlohmann::json& answer) = 0;

    virtual bool add_candidate(const std::string& peer_id, const nlohmann::json& candidate) = 0;

    // Connect without relayed signaling
    virtual bool connect_direct(const std::string& peer_id) = 0;

    virtual void disconnect(const std::string& peer_id) = 0;

    virtual bool send_text(const std::string& peer_id, const std::string& data) = 0;
    virtual bool send_binary(const std::string& peer_id, const std::vector<uint8_t>& data) = 0;

    virtual void set_text_handler(TextHandler handler) = 0;
    virtual void set_binary_handler(BinaryHandler handler) = 0;
    virtual void set_peer_connected_handler(PeerHandler handler) = 0;
    virtual void set_peer_disconnected_handler(PeerHandler handler) = 0;
};

/**
 * Persistent record store. Getters return nullopt when the id is unknown.
 */
class MessageStore {
public:
    virtual ~MessageStore() = default;

    virtual std::optional<Message> get_message(const std::string& id) = 0;
    virtual bool save_message(const Message& message) = 0;

    virtual std::optional<Conversation> get_conversation(const std::string& id) = 0;
    virtual bool save_conversation(const Conversation& conversation) = 0;

    virtual std::optional<Peer> get_peer(const std::string& id) = 0;
    virtual bool save_peer(const Peer& peer) = 0;

    virtual std::optional<Group> get_group(const std::string& id) = 0;
    virtual bool save_group(const Group& group) = 0;
    virtual bool delete_group(const std::string& id) = 0;
};

/**
 * Primitives of the crypto layer. Payload encryption happens below the
 * transport adapter; the delivery core only needs fingerprints to derive
 * and check peer ids.
 */
class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;

    virtual std::vector<uint8_t> encrypt(const std::string& peer_id, const std::vector<uint8_t>& plaintext) = 0;
    virtual std::optional<std::vector<uint8_t>> decrypt(const std::string& peer_id,
                                                        const std::vector<uint8_t>& ciphertext) = 0;

    virtual std::string fingerprint(const std::string& public_key) = 0;
};

class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual bool can_send_message(const std::string& recipient_id) = 0;
    virtual bool can_send_file(const std::string& recipient_id) = 0;
};

class FileValidator {
public:
    virtual ~FileValidator() = default;

    /**
     * Check size/type/count policy for a batch of files
     * @param files Files about to be sent
     * @param out_reason Human readable reason on rejection
     * @return true if every file may be sent
     */
    virtual bool validate(const std::vector<FileAttachment>& files, std::string& out_reason) = 0;
};

class PerformanceMonitor {
public:
    virtual ~PerformanceMonitor() = default;

    virtual void start_measure(const std::string& name) = 0;
    virtual void end_measure(const std::string& name) = 0;
};

/**
 * Ends a measurement when leaving scope. A null monitor is allowed.
 */
class ScopedMeasure {
public:
    ScopedMeasure(PerformanceMonitor* monitor, const std::string& name)
        : monitor_(monitor), name_(name) {
        if (monitor_) monitor_->start_measure(name_);
    }
    ~ScopedMeasure() {
        if (monitor_) monitor_->end_measure(name_);
    }

    ScopedMeasure(const ScopedMeasure&) = delete;
    ScopedMeasure& operator=(const ScopedMeasure&) = delete;

private:
    PerformanceMonitor* monitor_;
    std::string name_;
};

/**
 * Durable backing for the offline retry queue
 */
class QueueStorage {
public:
    virtual ~QueueStorage() = default;

    virtual bool load(std::vector<QueuedOutboundMessage>& out_items) = 0;
    virtual bool save(const std::vector<QueuedOutboundMessage>& items) = 0;
};

} // namespace meshchat
