#include <gtest/gtest.h>
#include "wire_codec.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <limits>
#include <random>
#include <thread>

using namespace meshchat;

class WireCodecTest : public ::testing::Test {
protected:
    std::vector<uint8_t> make_payload(size_t size) {
        std::vector<uint8_t> data(size);
        std::mt19937 gen(42);
        std::uniform_int_distribution<int> dis(0, 255);
        for (auto& byte : data) {
            byte = static_cast<uint8_t>(dis(gen));
        }
        return data;
    }
};

// ============================================================================
// Envelopes
// ============================================================================

TEST_F(WireCodecTest, EncodesTextEnvelope) {
    std::string encoded = WireCodec::encode_envelope(Envelope::make_text("msg-1", "hello", 1700000000000));
    nlohmann::json json = nlohmann::json::parse(encoded);

    EXPECT_EQ(json["type"], "text");
    EXPECT_EQ(json["id"], "msg-1");
    EXPECT_EQ(json["text"], "hello");
    EXPECT_EQ(json["timestamp"], 1700000000000LL);
    EXPECT_FALSE(json.contains("groupId"));
}

TEST_F(WireCodecTest, DecodesGroupTextEnvelope) {
    auto envelope = WireCodec::decode_envelope(
        R"({"type":"text","id":"m1","text":"hi all","timestamp":5,"groupId":"group-7"})");
    ASSERT_TRUE(envelope.has_value());
    EXPECT_EQ(envelope->type, EnvelopeType::TEXT);
    EXPECT_EQ(envelope->id, "m1");
    EXPECT_EQ(envelope->text, "hi all");
    EXPECT_EQ(envelope->group_id, "group-7");
    EXPECT_EQ(envelope->timestamp, 5);
}

TEST_F(WireCodecTest, TaglessObjectWithTextIsTextEnvelope) {
    auto envelope = WireCodec::decode_envelope(R"({"text":"legacy","timestamp":12})");
    ASSERT_TRUE(envelope.has_value());
    EXPECT_EQ(envelope->type, EnvelopeType::TEXT);
    EXPECT_EQ(envelope->text, "legacy");
    EXPECT_TRUE(envelope->id.empty());
}

TEST_F(WireCodecTest, RejectsMalformedEnvelopes) {
    EXPECT_FALSE(WireCodec::decode_envelope("{not json").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope("[1,2,3]").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(R"({"type":"poke","timestamp":1})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(R"({"type":"text","text":"no timestamp"})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(R"({"timestamp":1})").has_value());
}

TEST_F(WireCodecTest, ReactionRequiresTargetAndEmoji) {
    auto reaction = WireCodec::decode_envelope(
        R"({"type":"reaction","targetMessageId":"m1","emoji":"👍","userId":"bob","timestamp":3})");
    ASSERT_TRUE(reaction.has_value());
    EXPECT_EQ(reaction->type, EnvelopeType::REACTION);
    EXPECT_EQ(reaction->target_message_id, "m1");
    EXPECT_EQ(reaction->emoji, "👍");
    EXPECT_EQ(reaction->user_id, "bob");

    EXPECT_FALSE(WireCodec::decode_envelope(R"({"type":"reaction","emoji":"👍","timestamp":3})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(
        R"({"type":"reaction","targetMessageId":"m1","emoji":"","timestamp":3})").has_value());
}

TEST_F(WireCodecTest, FileStartCarriesMetadata) {
    Envelope start = Envelope::make_file_start("transfer-1", "photo.jpg", 100000, "image/jpeg", "look", 99, "g1");
    auto decoded = WireCodec::decode_envelope(WireCodec::encode_envelope(start));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, EnvelopeType::FILE_START);
    EXPECT_EQ(decoded->id, "transfer-1");
    EXPECT_EQ(decoded->file_name, "photo.jpg");
    EXPECT_EQ(decoded->file_size, 100000u);
    EXPECT_EQ(decoded->file_type, "image/jpeg");
    EXPECT_EQ(decoded->text, "look");
    EXPECT_EQ(decoded->group_id, "g1");

    // Negative or missing size is not a file announcement
    EXPECT_FALSE(WireCodec::decode_envelope(
        R"({"type":"file_start","id":"t","name":"a","size":-1,"timestamp":1})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(
        R"({"type":"file_start","name":"a","size":10,"timestamp":1})").has_value());
}

TEST_F(WireCodecTest, VoiceEnvelopeKeepsDuration) {
    Envelope voice;
    voice.type = EnvelopeType::VOICE;
    voice.id = "v1";
    voice.text = "UklGRg==";
    voice.timestamp = 10;
    voice.duration_ms = 3200;

    auto decoded = WireCodec::decode_envelope(WireCodec::encode_envelope(voice));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, EnvelopeType::VOICE);
    EXPECT_EQ(decoded->text, "UklGRg==");
    EXPECT_EQ(decoded->duration_ms, 3200u);
}

TEST_F(WireCodecTest, RejectsOutOfRangeNumbers) {
    EXPECT_FALSE(WireCodec::decode_envelope(R"({"type":"text","text":"x","timestamp":1e300})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(R"({"type":"text","text":"x","timestamp":12.5})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(
        R"({"type":"text","text":"x","timestamp":18446744073709551615})").has_value());
    EXPECT_TRUE(WireCodec::decode_envelope(
        R"({"type":"text","text":"x","timestamp":9223372036854775807})").has_value());

    EXPECT_FALSE(WireCodec::decode_envelope(
        R"({"type":"voice","content":"AA==","duration":4294967296,"timestamp":1})").has_value());
    EXPECT_FALSE(WireCodec::decode_envelope(
        R"({"type":"voice","content":"AA==","duration":-5,"timestamp":1})").has_value());
    auto voice = WireCodec::decode_envelope(
        R"({"type":"voice","content":"AA==","duration":4294967295,"timestamp":1})");
    ASSERT_TRUE(voice.has_value());
    EXPECT_EQ(voice->duration_ms, 4294967295u);
}

// ============================================================================
// Chunk frames
// ============================================================================

TEST_F(WireCodecTest, ChunkHeaderLayout) {
    ChunkFrame frame;
    frame.transfer_id = "abc";
    frame.index = 0x01020304;
    frame.total = 7;
    frame.payload = {0xAA, 0xBB};

    std::vector<uint8_t> data = WireCodec::encode_chunk(frame);
    ASSERT_EQ(data.size(), CHUNK_HEADER_SIZE + 2);

    EXPECT_EQ(data[0], 'a');
    EXPECT_EQ(data[2], 'c');
    for (size_t i = 3; i < TRANSFER_ID_FIELD_SIZE; ++i) {
        EXPECT_EQ(data[i], ' ') << "padding byte " << i;
    }
    // Big-endian index and total
    EXPECT_EQ(data[36], 0x01);
    EXPECT_EQ(data[37], 0x02);
    EXPECT_EQ(data[38], 0x03);
    EXPECT_EQ(data[39], 0x04);
    EXPECT_EQ(data[40], 0x00);
    EXPECT_EQ(data[43], 0x07);
    EXPECT_EQ(data[44], 0xAA);
    EXPECT_EQ(data[45], 0xBB);

    auto decoded = WireCodec::decode_chunk(data);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->transfer_id, "abc");
    EXPECT_EQ(decoded->index, 0x01020304u);
    EXPECT_EQ(decoded->total, 7u);
    EXPECT_EQ(decoded->payload, frame.payload);
}

TEST_F(WireCodecTest, LongTransferIdIsTruncated) {
    std::string id(50, 'x');
    EXPECT_EQ(WireCodec::normalize_transfer_id(id), std::string(36, 'x'));

    ChunkFrame frame;
    frame.transfer_id = id;
    frame.total = 1;
    auto decoded = WireCodec::decode_chunk(WireCodec::encode_chunk(frame));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->transfer_id, std::string(36, 'x'));
}

TEST_F(WireCodecTest, RejectsShortFrames) {
    EXPECT_FALSE(WireCodec::decode_chunk(std::vector<uint8_t>(CHUNK_HEADER_SIZE - 1, 'a')).has_value());
    // All-space id
    EXPECT_FALSE(WireCodec::decode_chunk(std::vector<uint8_t>(CHUNK_HEADER_SIZE, ' ')).has_value());
}

TEST_F(WireCodecTest, ChunkCount) {
    EXPECT_EQ(WireCodec::chunk_count(0, 16384), 0u);
    EXPECT_EQ(WireCodec::chunk_count(1, 16384), 1u);
    EXPECT_EQ(WireCodec::chunk_count(16384, 16384), 1u);
    EXPECT_EQ(WireCodec::chunk_count(16385, 16384), 2u);
    EXPECT_EQ(WireCodec::chunk_count(100000, 16384), 7u);
}

// ============================================================================
// Reassembly
// ============================================================================

TEST_F(WireCodecTest, ReassemblesOutOfOrderChunks) {
    const std::string transfer_id = "5f2b7c0e-aaaa-bbbb-cccc-1234567890ab";
    std::vector<uint8_t> data = make_payload(100000);

    auto frames = WireCodec::split_into_chunks(transfer_id, data);
    ASSERT_EQ(frames.size(), 7u);
    EXPECT_EQ(frames.back().size(), CHUNK_HEADER_SIZE + (100000 - 6 * 16384));

    ChunkReassembler reassembler;
    ASSERT_TRUE(reassembler.begin("peer-b", transfer_id, data.size()));

    std::vector<size_t> order = {6, 0, 3, 5, 1, 4, 2};
    for (size_t i = 0; i < order.size(); ++i) {
        ChunkResult result = reassembler.add_frame("peer-b", frames[order[i]]);
        if (i + 1 < order.size()) {
            EXPECT_EQ(result, ChunkResult::Accepted);
            EXPECT_FALSE(reassembler.is_complete("peer-b", transfer_id));
        } else {
            EXPECT_EQ(result, ChunkResult::Complete);
        }
    }

    EXPECT_EQ(reassembler.received_count("peer-b", transfer_id), 7u);
    auto blob = reassembler.take("peer-b", transfer_id);
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(*blob, data);
    EXPECT_FALSE(reassembler.is_known("peer-b", transfer_id));
    EXPECT_EQ(reassembler.active_transfer_count(), 0u);
}

TEST_F(WireCodecTest, ReassemblerRejectsInvalidChunks) {
    ChunkReassembler reassembler(4);
    ASSERT_TRUE(reassembler.begin("peer-b", "t1", 10));   // 3 chunks
    EXPECT_FALSE(reassembler.begin("peer-b", "t1", 10));
    EXPECT_FALSE(reassembler.begin("peer-b", "", 10));

    ChunkFrame frame;
    frame.transfer_id = "unknown";
    frame.total = 3;
    frame.payload = {1, 2, 3, 4};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::UnknownTransfer);

    frame.transfer_id = "t1";
    frame.total = 4;
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::TotalMismatch);

    frame.total = 3;
    frame.index = 3;
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::IndexOutOfRange);

    frame.index = 0;
    frame.payload = {1, 2, 3, 4, 5};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Malformed);

    frame.payload = {1, 2, 3, 4};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Accepted);
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Duplicate);
    EXPECT_EQ(reassembler.received_count("peer-b", "t1"), 1u);

    EXPECT_EQ(reassembler.add_frame("peer-b", {1, 2, 3}), ChunkResult::Malformed);
}

TEST_F(WireCodecTest, ChunksBeyondAnnouncedSizeAreRejected) {
    ChunkReassembler reassembler(4);
    ASSERT_TRUE(reassembler.begin("peer-b", "t2", 6));    // 2 chunks, last one 2 bytes

    ChunkFrame frame;
    frame.transfer_id = "t2";
    frame.total = 2;
    frame.index = 0;
    frame.payload = {1, 2, 3, 4};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Accepted);

    frame.index = 1;
    frame.payload = {5, 6, 7};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Malformed);
    EXPECT_FALSE(reassembler.is_complete("peer-b", "t2"));
}

TEST_F(WireCodecTest, TakeRejectsSizeMismatch) {
    ChunkReassembler reassembler(4);
    ASSERT_TRUE(reassembler.begin("peer-b", "t2", 6));

    ChunkFrame frame;
    frame.transfer_id = "t2";
    frame.total = 2;
    frame.index = 0;
    frame.payload = {1, 2, 3, 4};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Accepted);

    frame.index = 1;
    frame.payload = {5};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Complete);

    EXPECT_FALSE(reassembler.take("peer-b", "t2").has_value());
    EXPECT_FALSE(reassembler.is_known("peer-b", "t2"));
}

TEST_F(WireCodecTest, TakeIncompleteTransferFails) {
    ChunkReassembler reassembler(4);
    ASSERT_TRUE(reassembler.begin("peer-b", "t3", 8));
    EXPECT_FALSE(reassembler.take("peer-b", "t3").has_value());
    EXPECT_TRUE(reassembler.is_known("peer-b", "t3"));

    reassembler.cancel("peer-b", "t3");
    EXPECT_FALSE(reassembler.is_known("peer-b", "t3"));
}

TEST_F(WireCodecTest, OversizedAnnouncementIsRefused) {
    ChunkReassembler reassembler(DEFAULT_CHUNK_SIZE, 1024 * 1024);
    EXPECT_TRUE(reassembler.accepts_size(1024 * 1024));
    EXPECT_FALSE(reassembler.accepts_size(1024 * 1024 + 1));
    EXPECT_FALSE(reassembler.begin("peer-b", "big", 1024 * 1024 + 1));

    // 2^46 + 1 bytes would need more chunks than the header can count
    ChunkReassembler unbounded(1, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(WireCodec::chunk_count(70368744177665ull, 16384), 4294967297ull);
    EXPECT_FALSE(unbounded.accepts_size(70368744177665ull));
    EXPECT_FALSE(unbounded.begin("peer-b", "f1", 70368744177665ull));
    EXPECT_EQ(unbounded.active_transfer_count(), 0u);
}

TEST_F(WireCodecTest, TransfersAreScopedToTheirSender) {
    ChunkReassembler reassembler(4);
    ASSERT_TRUE(reassembler.begin("peer-b", "shared", 4));
    ASSERT_TRUE(reassembler.begin("peer-c", "shared", 4));

    ChunkFrame frame;
    frame.transfer_id = "shared";
    frame.total = 1;
    frame.payload = {9, 9, 9, 9};
    EXPECT_EQ(reassembler.add_chunk("peer-d", frame), ChunkResult::UnknownTransfer);
    EXPECT_EQ(reassembler.add_chunk("peer-c", frame), ChunkResult::Complete);
    EXPECT_FALSE(reassembler.is_complete("peer-b", "shared"));

    EXPECT_EQ(reassembler.cancel_sender("peer-b"), 1u);
    EXPECT_FALSE(reassembler.is_known("peer-b", "shared"));
    EXPECT_TRUE(reassembler.is_known("peer-c", "shared"));
}

TEST_F(WireCodecTest, StalledTransfersArePruned) {
    ChunkReassembler reassembler(4);
    ASSERT_TRUE(reassembler.begin("peer-b", "stalled", 40));

    ChunkFrame frame;
    frame.transfer_id = "stalled";
    frame.total = 10;
    frame.payload = {1, 2, 3, 4};
    EXPECT_EQ(reassembler.add_chunk("peer-b", frame), ChunkResult::Accepted);

    EXPECT_TRUE(reassembler.prune_stale(std::chrono::milliseconds(60000)).empty());
    EXPECT_TRUE(reassembler.is_known("peer-b", "stalled"));

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto pruned = reassembler.prune_stale(std::chrono::milliseconds(5));
    ASSERT_EQ(pruned.size(), 1u);
    EXPECT_EQ(pruned[0].first, "peer-b");
    EXPECT_EQ(pruned[0].second, "stalled");
    EXPECT_EQ(reassembler.active_transfer_count(), 0u);
}
