#pragma once

/**
 * @file wire_codec.h
 * @brief Peer-to-peer wire formats: JSON control envelopes and binary
 *        file chunk frames.
 *
 * Chunk frame layout (all integers big-endian):
 *
 *   offset  size  field
 *   0       36    transfer id, ASCII, right-padded with spaces
 *   36      4     chunk index (0-based)
 *   40      4     total chunk count
 *   44      n     payload, n <= chunk size
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshchat {

constexpr size_t TRANSFER_ID_FIELD_SIZE = 36;
constexpr size_t CHUNK_HEADER_SIZE = TRANSFER_ID_FIELD_SIZE + 4 + 4;
constexpr uint32_t DEFAULT_CHUNK_SIZE = 16 * 1024;
constexpr uint64_t DEFAULT_MAX_INBOUND_FILE_SIZE = 100ull * 1024 * 1024;

enum class EnvelopeType {
    TEXT,
    VOICE,
    REACTION,
    FILE_START
};

const char* envelope_type_to_string(EnvelopeType type);

/**
 * Decoded control envelope. Fields not used by `type` stay empty.
 */
struct Envelope {
    EnvelopeType type;
    std::string id;                 // Sender-assigned message id (optional for text/voice)
    std::string text;               // Text body, voice data (base64) or file caption
    int64_t timestamp;
    std::string group_id;           // Set for group-addressed content

    // Reaction
    std::string target_message_id;
    std::string emoji;
    std::string user_id;

    // File announcement
    std::string file_name;
    uint64_t file_size;
    std::string file_type;

    // Voice note
    uint32_t duration_ms;

    Envelope() : type(EnvelopeType::TEXT), timestamp(0), file_size(0), duration_ms(0) {}

    static Envelope make_text(const std::string& id, const std::string& text, int64_t timestamp,
                              const std::string& group_id = "");
    static Envelope make_reaction(const std::string& target_message_id, const std::string& emoji,
                                  const std::string& user_id, int64_t timestamp,
                                  const std::string& group_id = "");
    static Envelope make_file_start(const std::string& transfer_id, const std::string& name,
                                    uint64_t size, const std::string& mime_type,
                                    const std::string& caption, int64_t timestamp,
                                    const std::string& group_id = "");
};

struct ChunkFrame {
    std::string transfer_id;
    uint32_t index;
    uint32_t total;
    std::vector<uint8_t> payload;

    ChunkFrame() : index(0), total(0) {}
};

/**
 * Stateless encoders and decoders for the wire formats
 */
class WireCodec {
public:
    static std::string encode_envelope(const Envelope& envelope);

    /**
     * Decode a JSON envelope. Unknown tags, malformed JSON and missing
     * required fields yield nullopt. A tagless object carrying "text" is
     * read as a text envelope.
     */
    static std::optional<Envelope> decode_envelope(const std::string& data);

    static std::vector<uint8_t> encode_chunk(const ChunkFrame& frame);
    static std::optional<ChunkFrame> decode_chunk(const std::vector<uint8_t>& data);

    // ceil(size / chunk_size), 0 for a zero chunk size
    static uint64_t chunk_count(uint64_t size, uint32_t chunk_size);

    /**
     * Split a payload into encoded chunk frames
     * @param transfer_id Transfer id (truncated to 36 bytes on the wire)
     * @param data Full payload
     * @param chunk_size Maximum payload bytes per frame
     */
    static std::vector<std::vector<uint8_t>> split_into_chunks(const std::string& transfer_id,
                                                               const std::vector<uint8_t>& data,
                                                               uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Transfer id as it appears after a round trip through the header
    static std::string normalize_transfer_id(const std::string& transfer_id);
};

enum class ChunkResult {
    Accepted,           // Buffered, transfer still incomplete
    Complete,           // Last missing chunk received
    Duplicate,          // Index already buffered, ignored
    UnknownTransfer,    // No file_start seen for the id
    IndexOutOfRange,    // index >= total
    TotalMismatch,      // total differs from the announced size
    Malformed           // Frame too short to carry a header
};

const char* chunk_result_to_string(ChunkResult result);

/**
 * Receive-side reassembly of chunked transfers. Chunks may arrive out of
 * order; they are buffered by index until every index 0..total-1 is present.
 * Transfers are keyed by (sender, transfer id), so a peer can only feed its
 * own transfers. Announced sizes above the configured maximum are refused.
 */
class ChunkReassembler {
public:
    explicit ChunkReassembler(uint32_t chunk_size = DEFAULT_CHUNK_SIZE,
                              uint64_t max_file_size = DEFAULT_MAX_INBOUND_FILE_SIZE);

    // Size within the limit and chunk count representable in the header
    bool accepts_size(uint64_t file_size) const;

    /**
     * Register a transfer announced by file_start
     * @return false if the id is empty, already registered or the size is refused
     */
    bool begin(const std::string& sender_id, const std::string& transfer_id, uint64_t file_size);

    ChunkResult add_chunk(const std::string& sender_id, const ChunkFrame& frame);
    ChunkResult add_frame(const std::string& sender_id, const std::vector<uint8_t>& data,
                          std::string* out_transfer_id = nullptr);

    bool is_known(const std::string& sender_id, const std::string& transfer_id) const;
    bool is_complete(const std::string& sender_id, const std::string& transfer_id) const;
    uint32_t received_count(const std::string& sender_id, const std::string& transfer_id) const;

    /**
     * Remove a complete transfer and return its bytes in index order
     * @return nullopt if unknown, incomplete or the size does not match
     */
    std::optional<std::vector<uint8_t>> take(const std::string& sender_id, const std::string& transfer_id);

    void cancel(const std::string& sender_id, const std::string& transfer_id);

    // Drop every transfer from one sender, returns how many were dropped
    size_t cancel_sender(const std::string& sender_id);

    // Drop transfers that received nothing for `max_idle`
    std::vector<std::pair<std::string, std::string>> prune_stale(std::chrono::milliseconds max_idle);

    size_t active_transfer_count() const;
    uint64_t max_file_size() const { return max_file_size_; }

private:
    using TransferKey = std::pair<std::string, std::string>;   // sender, normalized id

    struct Transfer {
        uint64_t file_size;
        uint32_t total_chunks;
        uint64_t buffered_bytes;
        std::chrono::steady_clock::time_point last_activity;
        std::map<uint32_t, std::vector<uint8_t>> chunks;
    };

    uint32_t chunk_size_;
    uint64_t max_file_size_;
    mutable std::mutex mutex_;
    std::map<TransferKey, Transfer> transfers_;

    static TransferKey make_key(const std::string& sender_id, const std::string& transfer_id);
};

} // namespace meshchat
