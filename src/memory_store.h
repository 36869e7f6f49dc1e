#pragma once

#include "capabilities.h"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace meshchat {

/**
 * Thread-safe in-memory MessageStore. Records are copied in and out.
 */
class MemoryStore : public MessageStore {
public:
    MemoryStore() = default;

    std::optional<Message> get_message(const std::string& id) override;
    bool save_message(const Message& message) override;

    std::optional<Conversation> get_conversation(const std::string& id) override;
    bool save_conversation(const Conversation& conversation) override;

    std::optional<Peer> get_peer(const std::string& id) override;
    bool save_peer(const Peer& peer) override;

    std::optional<Group> get_group(const std::string& id) override;
    bool save_group(const Group& group) override;
    bool delete_group(const std::string& id) override;

    size_t message_count() const;
    size_t conversation_count() const;
    std::vector<Message> get_conversation_messages(const std::string& conversation_id) const;
    std::vector<Peer> get_all_peers() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Message> messages_;
    std::unordered_map<std::string, Conversation> conversations_;
    std::unordered_map<std::string, Peer> peers_;
    std::unordered_map<std::string, Group> groups_;
};

} // namespace meshchat
