#include "signal_relay.h"
#include "meshchat_log_macros.h"

namespace meshchat {

SignalRelayClient::SignalRelayClient(RelayChannel& channel, const std::string& local_peer_id)
    : channel_(channel), local_peer_id_(local_peer_id), active_(false) {
}

std::optional<nlohmann::json> SignalRelayClient::send_request(const std::string& action,
                                                              const nlohmann::json& payload) {
    nlohmann::json request;
    request["action"] = action;
    request["peerId"] = local_peer_id_;
    request["payload"] = payload;

    std::optional<nlohmann::json> response;
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        response = channel_.request(request);
    }

    if (!response) {
        LOG_RELAY_WARN("Rendezvous request '" << action << "' failed");
        return std::nullopt;
    }
    if (!response->is_object()) {
        LOG_RELAY_WARN("Rendezvous request '" << action << "' returned a non-object body");
        return std::nullopt;
    }
    auto error_it = response->find("error");
    if (error_it != response->end() && error_it->is_string()) {
        LOG_RELAY_WARN("Rendezvous rejected '" << action << "': " << error_it->get<std::string>());
        return std::nullopt;
    }
    return response;
}

bool SignalRelayClient::parse_peer(const nlohmann::json& json, DiscoveredPeer& out_peer) {
    if (!json.is_object()) {
        return false;
    }

    // The service reports its storage key as "_id"
    auto id_it = json.find("_id");
    if (id_it == json.end()) {
        id_it = json.find("id");
    }
    if (id_it == json.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        return false;
    }

    out_peer.id = id_it->get<std::string>();
    auto meta_it = json.find("metadata");
    out_peer.metadata = (meta_it != json.end() && meta_it->is_object()) ? *meta_it : nlohmann::json::object();
    return true;
}

bool SignalRelayClient::join(const nlohmann::json& metadata, std::vector<DiscoveredPeer>& out_peers) {
    nlohmann::json payload;
    payload["metadata"] = metadata.is_object() ? metadata : nlohmann::json::object();

    auto response = send_request("join", payload);
    if (!response) {
        active_.store(false);
        return false;
    }

    out_peers.clear();
    auto peers_it = response->find("peers");
    if (peers_it != response->end() && peers_it->is_array()) {
        for (const auto& entry : *peers_it) {
            DiscoveredPeer peer;
            if (!parse_peer(entry, peer)) {
                LOG_RELAY_DEBUG("Skipping malformed peer entry: " << entry.dump());
                continue;
            }
            if (peer.id == local_peer_id_) {
                continue;
            }
            out_peers.push_back(std::move(peer));
        }
    }

    active_.store(true);
    LOG_RELAY_INFO("Joined rendezvous as " << local_peer_id_ << ", " << out_peers.size() << " peers visible");
    return true;
}

bool SignalRelayClient::poll(PollResult& out_result) {
    out_result = PollResult();

    auto response = send_request("poll", nlohmann::json::object());
    if (!response) {
        return false;
    }

    auto signals_it = response->find("signals");
    if (signals_it != response->end() && signals_it->is_array()) {
        for (const auto& entry : *signals_it) {
            auto signal = PendingSignal::from_json(entry);
            if (!signal) {
                LOG_RELAY_WARN("Dropping malformed signal: " << entry.dump());
                continue;
            }
            out_result.signals.push_back(std::move(*signal));
        }
    }

    auto messages_it = response->find("messages");
    if (messages_it != response->end() && messages_it->is_array()) {
        for (const auto& entry : *messages_it) {
            if (!entry.is_object()) {
                continue;
            }
            auto from_it = entry.find("from");
            auto content_it = entry.find("content");
            if (from_it == entry.end() || !from_it->is_string() ||
                content_it == entry.end() || !content_it->is_string()) {
                continue;
            }
            RelayedMessage message;
            message.from = from_it->get<std::string>();
            message.content = content_it->get<std::string>();
            auto ts_it = entry.find("timestamp");
            if (ts_it != entry.end() && ts_it->is_number()) {
                message.timestamp = ts_it->get<int64_t>();
            }
            out_result.messages.push_back(std::move(message));
        }
    }

    auto peers_it = response->find("peers");
    if (peers_it != response->end() && peers_it->is_array()) {
        for (const auto& entry : *peers_it) {
            DiscoveredPeer peer;
            if (parse_peer(entry, peer) && peer.id != local_peer_id_) {
                out_result.peers.push_back(std::move(peer));
            }
        }
    }

    if (!out_result.signals.empty()) {
        LOG_RELAY_DEBUG("Poll returned " << out_result.signals.size() << " signals");
    }
    return true;
}

bool SignalRelayClient::signal(const std::string& peer_id, SignalType type, const nlohmann::json& payload) {
    if (peer_id.empty()) {
        return false;
    }

    nlohmann::json body;
    body["to"] = peer_id;
    body["type"] = signal_type_to_string(type);
    body["signal"] = payload;

    LOG_RELAY_DEBUG("Relaying " << signal_type_to_string(type) << " to " << peer_id);
    return send_request("signal", body).has_value();
}

bool SignalRelayClient::post_message(const std::string& content) {
    if (content.empty()) {
        return false;
    }
    nlohmann::json body;
    body["content"] = content;
    return send_request("message", body).has_value();
}

void SignalRelayClient::leave() {
    if (active_.exchange(false)) {
        LOG_RELAY_INFO("Left rendezvous");
    }
}

} // namespace meshchat
