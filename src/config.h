#pragma once

#include "logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace meshchat {

/**
 * Poll delay tiers of the discovery loop
 */
struct DiscoveryConfig {
    uint32_t pending_delay_ms;          // Connections being established
    uint32_t sparse_delay_ms;           // Fewer than sparse_peer_threshold peers
    uint32_t moderate_delay_ms;         // Fewer than dense_peer_threshold peers
    uint32_t dense_delay_ms;            // Well connected
    uint32_t sparse_peer_threshold;
    uint32_t dense_peer_threshold;
    uint32_t failure_delay_ms;          // After a failed poll

    DiscoveryConfig()
        : pending_delay_ms(1000), sparse_delay_ms(2000), moderate_delay_ms(10000),
          dense_delay_ms(30000), sparse_peer_threshold(3), dense_peer_threshold(10),
          failure_delay_ms(10000) {}
};

/**
 * Session configuration, persisted as JSON
 */
struct MeshConfig {
    std::string peer_id;                // Local identity, required to start
    std::string public_key;             // Used to derive peer_id when empty
    std::string display_name;
    bool relay_enabled;                 // Signal through the rendezvous channel
    uint32_t connect_timeout_ms;
    uint32_t chunk_size;
    uint32_t yield_every_chunks;
    uint64_t max_inbound_file_size;     // Larger announced files are refused
    uint32_t transfer_idle_timeout_ms;  // Partial inbound transfers are dropped after this
    uint32_t retry_interval_ms;
    uint32_t max_queue_size;
    uint32_t max_retries;               // 0 = retry forever
    std::string queue_file;             // Empty = queue kept in memory only
    std::string log_level;
    DiscoveryConfig discovery;

    MeshConfig()
        : relay_enabled(true), connect_timeout_ms(10000), chunk_size(16384),
          yield_every_chunks(10), max_inbound_file_size(100ull * 1024 * 1024),
          transfer_idle_timeout_ms(60000), retry_interval_ms(30000), max_queue_size(1000),
          max_retries(0), log_level("info") {}

    nlohmann::json to_json() const;

    /**
     * Read fields present in `json`, keeping defaults for the others
     * @return false if a field has the wrong type or value
     */
    bool apply_json(const nlohmann::json& json, std::string& out_error);

    /**
     * Check the values that would make the session unusable
     */
    bool validate(std::string& out_error) const;
};

/**
 * Load configuration from a JSON file. A missing file is created with a
 * freshly generated peer id; an unreadable or malformed file is an error.
 */
bool load_config_file(const std::string& path, MeshConfig& out_config, std::string& out_error);

bool save_config_file(const std::string& path, const MeshConfig& config);

} // namespace meshchat
