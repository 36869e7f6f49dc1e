#include "config.h"
#include "fs.h"
#include "types.h"

namespace meshchat {

namespace {

constexpr uint32_t MAX_CHUNK_SIZE = 256 * 1024;

template<typename T>
bool read_field(const nlohmann::json& json, const char* key, T& out, std::string& out_error) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    try {
        out = it->get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        out_error = std::string("invalid value for '") + key + "': " + e.what();
        return false;
    }
}

} // namespace

nlohmann::json MeshConfig::to_json() const {
    nlohmann::json json;
    json["peer_id"] = peer_id;
    json["public_key"] = public_key;
    json["display_name"] = display_name;
    json["relay_enabled"] = relay_enabled;
    json["connect_timeout_ms"] = connect_timeout_ms;
    json["chunk_size"] = chunk_size;
    json["yield_every_chunks"] = yield_every_chunks;
    json["max_inbound_file_size"] = max_inbound_file_size;
    json["transfer_idle_timeout_ms"] = transfer_idle_timeout_ms;
    json["retry_interval_ms"] = retry_interval_ms;
    json["max_queue_size"] = max_queue_size;
    json["max_retries"] = max_retries;
    json["queue_file"] = queue_file;
    json["log_level"] = log_level;

    nlohmann::json poll;
    poll["pending_delay_ms"] = discovery.pending_delay_ms;
    poll["sparse_delay_ms"] = discovery.sparse_delay_ms;
    poll["moderate_delay_ms"] = discovery.moderate_delay_ms;
    poll["dense_delay_ms"] = discovery.dense_delay_ms;
    poll["sparse_peer_threshold"] = discovery.sparse_peer_threshold;
    poll["dense_peer_threshold"] = discovery.dense_peer_threshold;
    poll["failure_delay_ms"] = discovery.failure_delay_ms;
    json["discovery"] = poll;
    return json;
}

bool MeshConfig::apply_json(const nlohmann::json& json, std::string& out_error) {
    if (!json.is_object()) {
        out_error = "configuration root must be an object";
        return false;
    }

    bool ok = read_field(json, "peer_id", peer_id, out_error) &&
              read_field(json, "public_key", public_key, out_error) &&
              read_field(json, "display_name", display_name, out_error) &&
              read_field(json, "relay_enabled", relay_enabled, out_error) &&
              read_field(json, "connect_timeout_ms", connect_timeout_ms, out_error) &&
              read_field(json, "chunk_size", chunk_size, out_error) &&
              read_field(json, "yield_every_chunks", yield_every_chunks, out_error) &&
              read_field(json, "max_inbound_file_size", max_inbound_file_size, out_error) &&
              read_field(json, "transfer_idle_timeout_ms", transfer_idle_timeout_ms, out_error) &&
              read_field(json, "retry_interval_ms", retry_interval_ms, out_error) &&
              read_field(json, "max_queue_size", max_queue_size, out_error) &&
              read_field(json, "max_retries", max_retries, out_error) &&
              read_field(json, "queue_file", queue_file, out_error) &&
              read_field(json, "log_level", log_level, out_error);
    if (!ok) {
        return false;
    }

    auto poll_it = json.find("discovery");
    if (poll_it != json.end() && poll_it->is_object()) {
        const nlohmann::json& poll = *poll_it;
        ok = read_field(poll, "pending_delay_ms", discovery.pending_delay_ms, out_error) &&
             read_field(poll, "sparse_delay_ms", discovery.sparse_delay_ms, out_error) &&
             read_field(poll, "moderate_delay_ms", discovery.moderate_delay_ms, out_error) &&
             read_field(poll, "dense_delay_ms", discovery.dense_delay_ms, out_error) &&
             read_field(poll, "sparse_peer_threshold", discovery.sparse_peer_threshold, out_error) &&
             read_field(poll, "dense_peer_threshold", discovery.dense_peer_threshold, out_error) &&
             read_field(poll, "failure_delay_ms", discovery.failure_delay_ms, out_error);
        if (!ok) {
            return false;
        }
    }

    return validate(out_error);
}

bool MeshConfig::validate(std::string& out_error) const {
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
        out_error = "chunk_size must be between 1 and " + std::to_string(MAX_CHUNK_SIZE);
        return false;
    }
    if (connect_timeout_ms == 0) {
        out_error = "connect_timeout_ms must be positive";
        return false;
    }
    if (max_inbound_file_size == 0) {
        out_error = "max_inbound_file_size must be positive";
        return false;
    }
    if (transfer_idle_timeout_ms == 0) {
        out_error = "transfer_idle_timeout_ms must be positive";
        return false;
    }
    if (retry_interval_ms == 0) {
        out_error = "retry_interval_ms must be positive";
        return false;
    }
    if (discovery.sparse_peer_threshold > discovery.dense_peer_threshold) {
        out_error = "discovery.sparse_peer_threshold exceeds dense_peer_threshold";
        return false;
    }
    LogLevel level;
    if (!parse_log_level(log_level, level)) {
        out_error = "unknown log_level '" + log_level + "'";
        return false;
    }
    return true;
}

bool load_config_file(const std::string& path, MeshConfig& out_config, std::string& out_error) {
    LOG_INFO("config", "Loading configuration from " << path);

    if (!file_exists(path)) {
        LOG_INFO("config", "No existing configuration found, generating new peer ID");
        if (out_config.peer_id.empty() && out_config.public_key.empty()) {
            out_config.peer_id = generate_id().substr(0, PEER_ID_LENGTH);
        }
        if (!save_config_file(path, out_config)) {
            out_error = "failed to create configuration file " + path;
            return false;
        }
        return true;
    }

    std::string content;
    if (!read_file_text(path, content)) {
        out_error = "failed to read configuration file " + path;
        return false;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(content);
        if (!out_config.apply_json(json, out_error)) {
            LOG_ERROR("config", "Invalid configuration in " << path << ": " << out_error);
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        out_error = std::string("failed to parse configuration file: ") + e.what();
        LOG_ERROR("config", out_error);
        return false;
    }

    LOG_INFO("config", "Loaded configuration with peer ID: " << out_config.peer_id);
    return true;
}

bool save_config_file(const std::string& path, const MeshConfig& config) {
    LOG_DEBUG("config", "Saving configuration to " << path);
    return write_file_atomic(path, config.to_json().dump(4));
}

} // namespace meshchat
