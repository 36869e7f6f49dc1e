#include "memory_store.h"

#include <algorithm>

namespace meshchat {

namespace {

template<typename Record>
std::optional<Record> find_record(const std::unordered_map<std::string, Record>& table,
                                  const std::string& id) {
    auto it = table.find(id);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

std::optional<Message> MemoryStore::get_message(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_record(messages_, id);
}

bool MemoryStore::save_message(const Message& message) {
    if (message.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    messages_[message.id] = message;
    return true;
}

std::optional<Conversation> MemoryStore::get_conversation(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_record(conversations_, id);
}

bool MemoryStore::save_conversation(const Conversation& conversation) {
    if (conversation.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    conversations_[conversation.id] = conversation;
    return true;
}

std::optional<Peer> MemoryStore::get_peer(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_record(peers_, id);
}

bool MemoryStore::save_peer(const Peer& peer) {
    if (peer.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    peers_[peer.id] = peer;
    return true;
}

std::optional<Group> MemoryStore::get_group(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_record(groups_, id);
}

bool MemoryStore::save_group(const Group& group) {
    if (group.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    groups_[group.id] = group;
    return true;
}

bool MemoryStore::delete_group(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.erase(id) > 0;
}

size_t MemoryStore::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

size_t MemoryStore::conversation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

std::vector<Message> MemoryStore::get_conversation_messages(const std::string& conversation_id) const {
    std::vector<Message> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : messages_) {
            if (pair.second.conversation_id == conversation_id) {
                result.push_back(pair.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const Message& a, const Message& b) {
        return a.timestamp < b.timestamp;
    });
    return result;
}

std::vector<Peer> MemoryStore::get_all_peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Peer> result;
    result.reserve(peers_.size());
    for (const auto& pair : peers_) {
        result.push_back(pair.second);
    }
    return result;
}

} // namespace meshchat
