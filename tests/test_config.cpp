#include <gtest/gtest.h>
#include "config.h"
#include "types.h"
#include "fs.h"

using namespace meshchat;

class ConfigTest : public ::testing::Test {
protected:
    const std::string config_file = "test_meshchat_config.json";

    void clean_test_files() {
        if (file_exists(config_file)) delete_file(config_file);
        if (file_exists(config_file + ".tmp")) delete_file(config_file + ".tmp");
    }

    void SetUp() override {
        clean_test_files();
    }

    void TearDown() override {
        clean_test_files();
    }
};

TEST_F(ConfigTest, Defaults) {
    MeshConfig config;
    EXPECT_TRUE(config.relay_enabled);
    EXPECT_EQ(config.connect_timeout_ms, 10000u);
    EXPECT_EQ(config.chunk_size, 16384u);
    EXPECT_EQ(config.yield_every_chunks, 10u);
    EXPECT_EQ(config.max_inbound_file_size, 100ull * 1024 * 1024);
    EXPECT_EQ(config.transfer_idle_timeout_ms, 60000u);
    EXPECT_EQ(config.max_queue_size, 1000u);
    EXPECT_EQ(config.max_retries, 0u);
    EXPECT_EQ(config.discovery.pending_delay_ms, 1000u);
    EXPECT_EQ(config.discovery.sparse_delay_ms, 2000u);
    EXPECT_EQ(config.discovery.moderate_delay_ms, 10000u);
    EXPECT_EQ(config.discovery.dense_delay_ms, 30000u);
    EXPECT_EQ(config.discovery.failure_delay_ms, 10000u);

    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
}

TEST_F(ConfigTest, PeerIdGenerationAndPersistence) {
    std::string first_peer_id;
    {
        MeshConfig config;
        std::string error;
        ASSERT_TRUE(load_config_file(config_file, config, error)) << error;
        first_peer_id = config.peer_id;
        EXPECT_EQ(first_peer_id.length(), PEER_ID_LENGTH);
    }

    EXPECT_TRUE(file_exists(config_file));

    // Second load reads the same identity back
    {
        MeshConfig config;
        std::string error;
        ASSERT_TRUE(load_config_file(config_file, config, error)) << error;
        EXPECT_EQ(config.peer_id, first_peer_id);
    }

    std::string data;
    ASSERT_TRUE(read_file_text(config_file, data));
    nlohmann::json json = nlohmann::json::parse(data);
    EXPECT_EQ(json["peer_id"], first_peer_id);
    EXPECT_TRUE(json.contains("discovery"));
}

TEST_F(ConfigTest, ApplyJsonKeepsDefaultsForMissingFields) {
    MeshConfig config;
    std::string error;
    ASSERT_TRUE(config.apply_json(nlohmann::json{
        {"display_name", "Alice"},
        {"max_retries", 5},
        {"discovery", {{"dense_delay_ms", 60000}}}
    }, error)) << error;

    EXPECT_EQ(config.display_name, "Alice");
    EXPECT_EQ(config.max_retries, 5u);
    EXPECT_EQ(config.discovery.dense_delay_ms, 60000u);
    EXPECT_EQ(config.discovery.sparse_delay_ms, 2000u);
    EXPECT_EQ(config.chunk_size, 16384u);
}

TEST_F(ConfigTest, ApplyJsonRejectsBadValues) {
    std::string error;

    MeshConfig wrong_type;
    EXPECT_FALSE(wrong_type.apply_json(nlohmann::json{{"chunk_size", "big"}}, error));
    EXPECT_FALSE(error.empty());

    MeshConfig zero_chunk;
    EXPECT_FALSE(zero_chunk.apply_json(nlohmann::json{{"chunk_size", 0}}, error));

    MeshConfig zero_file_limit;
    EXPECT_FALSE(zero_file_limit.apply_json(nlohmann::json{{"max_inbound_file_size", 0}}, error));

    MeshConfig bad_level;
    EXPECT_FALSE(bad_level.apply_json(nlohmann::json{{"log_level", "chatty"}}, error));

    MeshConfig not_object;
    EXPECT_FALSE(not_object.apply_json(nlohmann::json::array(), error));
}

TEST_F(ConfigTest, MalformedFileIsAnError) {
    ASSERT_TRUE(write_file_atomic(config_file, "{ this is not json"));
    MeshConfig config;
    std::string error;
    EXPECT_FALSE(load_config_file(config_file, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, SaveAndReload) {
    MeshConfig config;
    config.peer_id = "0123456789abcdef";
    config.display_name = "Bob";
    config.relay_enabled = false;
    config.queue_file = "queue.json";
    ASSERT_TRUE(save_config_file(config_file, config));

    MeshConfig loaded;
    std::string error;
    ASSERT_TRUE(load_config_file(config_file, loaded, error)) << error;
    EXPECT_EQ(loaded.peer_id, "0123456789abcdef");
    EXPECT_EQ(loaded.display_name, "Bob");
    EXPECT_FALSE(loaded.relay_enabled);
    EXPECT_EQ(loaded.queue_file, "queue.json");
}
