#include "types.h"

#include <algorithm>
#include <chrono>
#include <random>
#include <sstream>

namespace meshchat {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string generate_id() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        ss << dis(gen);
    }
    return ss.str();
}

std::string peer_id_from_fingerprint(const std::string& fingerprint) {
    return fingerprint.substr(0, std::min(fingerprint.size(), PEER_ID_LENGTH));
}

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::TEXT:     return "text";
        case MessageType::FILE:     return "file";
        case MessageType::VOICE:    return "voice";
        case MessageType::REACTION: return "reaction";
        default: return "unknown";
    }
}

const char* message_status_to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::PENDING:   return "pending";
        case MessageStatus::SENT:      return "sent";
        case MessageStatus::DELIVERED: return "delivered";
        case MessageStatus::READ:      return "read";
        case MessageStatus::QUEUED:    return "queued";
        case MessageStatus::FAILED:    return "failed";
        default: return "unknown";
    }
}

bool Message::add_reaction(const Reaction& reaction) {
    if (std::find(reactions.begin(), reactions.end(), reaction) != reactions.end()) {
        return false;
    }
    reactions.push_back(reaction);
    return true;
}

const char* signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::OFFER:     return "offer";
        case SignalType::ANSWER:    return "answer";
        case SignalType::CANDIDATE: return "candidate";
        default: return "unknown";
    }
}

std::optional<SignalType> signal_type_from_string(const std::string& name) {
    if (name == "offer") return SignalType::OFFER;
    if (name == "answer") return SignalType::ANSWER;
    if (name == "candidate") return SignalType::CANDIDATE;
    return std::nullopt;
}

nlohmann::json PendingSignal::to_json() const {
    nlohmann::json json;
    json["from"] = from;
    json["type"] = signal_type_to_string(type);
    json["signal"] = signal;
    return json;
}

std::optional<PendingSignal> PendingSignal::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    auto from_it = json.find("from");
    auto type_it = json.find("type");
    auto signal_it = json.find("signal");
    if (from_it == json.end() || type_it == json.end() || signal_it == json.end()) {
        return std::nullopt;
    }
    if (!from_it->is_string() || !type_it->is_string() || !signal_it->is_object()) {
        return std::nullopt;
    }

    auto type = signal_type_from_string(type_it->get<std::string>());
    if (!type) {
        return std::nullopt;
    }

    PendingSignal result;
    result.from = from_it->get<std::string>();
    if (result.from.empty()) {
        return std::nullopt;
    }
    result.type = *type;
    result.signal = *signal_it;
    return result;
}

nlohmann::json QueuedOutboundMessage::to_json() const {
    nlohmann::json json;
    json["message_id"] = message_id;
    json["recipient_id"] = recipient_id;
    json["content"] = content;
    json["timestamp"] = timestamp;
    json["retries"] = retries;
    if (!group_id.empty()) {
        json["group_id"] = group_id;
    }
    return json;
}

std::optional<QueuedOutboundMessage> QueuedOutboundMessage::from_json(const nlohmann::json& json) {
    try {
        QueuedOutboundMessage item;
        item.message_id = json.at("message_id").get<std::string>();
        item.recipient_id = json.at("recipient_id").get<std::string>();
        item.content = json.at("content").get<std::string>();
        item.timestamp = json.at("timestamp").get<int64_t>();
        item.retries = json.value("retries", 0u);
        item.group_id = json.value("group_id", "");
        if (item.recipient_id.empty()) {
            return std::nullopt;
        }
        return item;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

} // namespace meshchat
