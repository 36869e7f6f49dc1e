#include "wire_codec.h"
#include "meshchat_log_macros.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <limits>

namespace meshchat {

namespace {

inline void write_uint32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline uint32_t read_uint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

bool get_string(const nlohmann::json& json, const char* key, std::string& out) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Integral and representable in int64_t; floating point values are refused
bool get_timestamp(const nlohmann::json& json, int64_t& out) {
    auto it = json.find("timestamp");
    if (it == json.end() || !it->is_number_integer()) {
        return false;
    }
    if (it->is_number_unsigned() &&
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

} // namespace

const char* envelope_type_to_string(EnvelopeType type) {
    switch (type) {
        case EnvelopeType::TEXT:       return "text";
        case EnvelopeType::VOICE:      return "voice";
        case EnvelopeType::REACTION:   return "reaction";
        case EnvelopeType::FILE_START: return "file_start";
        default: return "unknown";
    }
}

Envelope Envelope::make_text(const std::string& id, const std::string& text, int64_t timestamp,
                             const std::string& group_id) {
    Envelope envelope;
    envelope.type = EnvelopeType::TEXT;
    envelope.id = id;
    envelope.text = text;
    envelope.timestamp = timestamp;
    envelope.group_id = group_id;
    return envelope;
}

Envelope Envelope::make_reaction(const std::string& target_message_id, const std::string& emoji,
                                 const std::string& user_id, int64_t timestamp,
                                 const std::string& group_id) {
    Envelope envelope;
    envelope.type = EnvelopeType::REACTION;
    envelope.target_message_id = target_message_id;
    envelope.emoji = emoji;
    envelope.user_id = user_id;
    envelope.timestamp = timestamp;
    envelope.group_id = group_id;
    return envelope;
}

Envelope Envelope::make_file_start(const std::string& transfer_id, const std::string& name,
                                   uint64_t size, const std::string& mime_type,
                                   const std::string& caption, int64_t timestamp,
                                   const std::string& group_id) {
    Envelope envelope;
    envelope.type = EnvelopeType::FILE_START;
    envelope.id = transfer_id;
    envelope.file_name = name;
    envelope.file_size = size;
    envelope.file_type = mime_type;
    envelope.text = caption;
    envelope.timestamp = timestamp;
    envelope.group_id = group_id;
    return envelope;
}

//=============================================================================
// Envelopes
//=============================================================================

std::string WireCodec::encode_envelope(const Envelope& envelope) {
    nlohmann::json json;
    json["type"] = envelope_type_to_string(envelope.type);
    json["timestamp"] = envelope.timestamp;
    if (!envelope.id.empty()) {
        json["id"] = envelope.id;
    }
    if (!envelope.group_id.empty()) {
        json["groupId"] = envelope.group_id;
    }

    switch (envelope.type) {
        case EnvelopeType::TEXT:
            json["text"] = envelope.text;
            break;
        case EnvelopeType::VOICE:
            json["content"] = envelope.text;
            json["duration"] = envelope.duration_ms;
            break;
        case EnvelopeType::REACTION:
            json["targetMessageId"] = envelope.target_message_id;
            json["emoji"] = envelope.emoji;
            if (!envelope.user_id.empty()) {
                json["userId"] = envelope.user_id;
            }
            break;
        case EnvelopeType::FILE_START:
            json["name"] = envelope.file_name;
            json["size"] = envelope.file_size;
            json["fileType"] = envelope.file_type;
            json["content"] = envelope.text;
            break;
    }

    return json.dump();
}

std::optional<Envelope> WireCodec::decode_envelope(const std::string& data) {
    nlohmann::json json = nlohmann::json::parse(data, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        LOG_CODEC_DEBUG("Rejected envelope: not a JSON object");
        return std::nullopt;
    }

    std::string tag;
    if (!get_string(json, "type", tag)) {
        // Older senders omit the tag on plain text
        if (json.contains("text") && !json.contains("type")) {
            tag = "text";
        } else {
            LOG_CODEC_DEBUG("Rejected envelope: missing type tag");
            return std::nullopt;
        }
    }

    Envelope envelope;
    get_string(json, "id", envelope.id);
    get_string(json, "groupId", envelope.group_id);

    if (!get_timestamp(json, envelope.timestamp)) {
        LOG_CODEC_DEBUG("Rejected " << tag << " envelope: missing timestamp");
        return std::nullopt;
    }

    if (tag == "text") {
        envelope.type = EnvelopeType::TEXT;
        if (!get_string(json, "text", envelope.text)) {
            return std::nullopt;
        }
    } else if (tag == "voice") {
        envelope.type = EnvelopeType::VOICE;
        if (!get_string(json, "content", envelope.text)) {
            return std::nullopt;
        }
        auto it = json.find("duration");
        if (it != json.end()) {
            if (!it->is_number_unsigned() || it->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
                LOG_CODEC_DEBUG("Rejected voice envelope: bad duration");
                return std::nullopt;
            }
            envelope.duration_ms = static_cast<uint32_t>(it->get<uint64_t>());
        }
    } else if (tag == "reaction") {
        envelope.type = EnvelopeType::REACTION;
        if (!get_string(json, "targetMessageId", envelope.target_message_id) ||
            !get_string(json, "emoji", envelope.emoji) ||
            envelope.target_message_id.empty() || envelope.emoji.empty()) {
            return std::nullopt;
        }
        get_string(json, "userId", envelope.user_id);
    } else if (tag == "file_start") {
        envelope.type = EnvelopeType::FILE_START;
        auto size_it = json.find("size");
        if (envelope.id.empty() || !get_string(json, "name", envelope.file_name) ||
            size_it == json.end() || !size_it->is_number_unsigned()) {
            return std::nullopt;
        }
        envelope.file_size = size_it->get<uint64_t>();
        get_string(json, "fileType", envelope.file_type);
        get_string(json, "content", envelope.text);
    } else {
        LOG_CODEC_DEBUG("Rejected envelope with unknown type: " << tag);
        return std::nullopt;
    }

    return envelope;
}

//=============================================================================
// Chunk frames
//=============================================================================

std::string WireCodec::normalize_transfer_id(const std::string& transfer_id) {
    std::string normalized = transfer_id.substr(0, std::min(transfer_id.size(), TRANSFER_ID_FIELD_SIZE));
    size_t end = normalized.find_last_not_of(' ');
    if (end == std::string::npos) {
        return "";
    }
    return normalized.substr(0, end + 1);
}

std::vector<uint8_t> WireCodec::encode_chunk(const ChunkFrame& frame) {
    std::vector<uint8_t> data;
    data.reserve(CHUNK_HEADER_SIZE + frame.payload.size());

    for (size_t i = 0; i < TRANSFER_ID_FIELD_SIZE; ++i) {
        data.push_back(i < frame.transfer_id.size() ? static_cast<uint8_t>(frame.transfer_id[i]) : ' ');
    }
    write_uint32(data, frame.index);
    write_uint32(data, frame.total);
    data.insert(data.end(), frame.payload.begin(), frame.payload.end());
    return data;
}

std::optional<ChunkFrame> WireCodec::decode_chunk(const std::vector<uint8_t>& data) {
    if (data.size() < CHUNK_HEADER_SIZE) {
        return std::nullopt;
    }

    ChunkFrame frame;
    std::string raw_id(data.begin(), data.begin() + TRANSFER_ID_FIELD_SIZE);
    frame.transfer_id = normalize_transfer_id(raw_id);
    if (frame.transfer_id.empty()) {
        return std::nullopt;
    }
    frame.index = read_uint32(data.data() + TRANSFER_ID_FIELD_SIZE);
    frame.total = read_uint32(data.data() + TRANSFER_ID_FIELD_SIZE + 4);
    frame.payload.assign(data.begin() + CHUNK_HEADER_SIZE, data.end());
    return frame;
}

uint64_t WireCodec::chunk_count(uint64_t size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

std::vector<std::vector<uint8_t>> WireCodec::split_into_chunks(const std::string& transfer_id,
                                                               const std::vector<uint8_t>& data,
                                                               uint32_t chunk_size) {
    std::vector<std::vector<uint8_t>> frames;
    uint64_t count = chunk_count(data.size(), chunk_size);
    if (count > std::numeric_limits<uint32_t>::max()) {
        LOG_CODEC_ERROR("Transfer " << transfer_id << " needs " << count << " chunks, more than the header can carry");
        return frames;
    }
    uint32_t total = static_cast<uint32_t>(count);
    frames.reserve(total);

    ChunkFrame frame;
    frame.transfer_id = transfer_id;
    frame.total = total;

    for (uint32_t index = 0; index < total; ++index) {
        size_t offset = static_cast<size_t>(index) * chunk_size;
        size_t length = std::min<size_t>(chunk_size, data.size() - offset);
        frame.index = index;
        frame.payload.assign(data.begin() + offset, data.begin() + offset + length);
        frames.push_back(encode_chunk(frame));
    }
    return frames;
}

const char* chunk_result_to_string(ChunkResult result) {
    switch (result) {
        case ChunkResult::Accepted:        return "accepted";
        case ChunkResult::Complete:        return "complete";
        case ChunkResult::Duplicate:       return "duplicate";
        case ChunkResult::UnknownTransfer: return "unknown transfer";
        case ChunkResult::IndexOutOfRange: return "index out of range";
        case ChunkResult::TotalMismatch:   return "total mismatch";
        case ChunkResult::Malformed:       return "malformed";
        default: return "unknown";
    }
}

//=============================================================================
// Reassembly
//=============================================================================

ChunkReassembler::ChunkReassembler(uint32_t chunk_size, uint64_t max_file_size)
    : chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size),
      max_file_size_(max_file_size == 0 ? DEFAULT_MAX_INBOUND_FILE_SIZE : max_file_size) {
}

ChunkReassembler::TransferKey ChunkReassembler::make_key(const std::string& sender_id,
                                                         const std::string& transfer_id) {
    return TransferKey(sender_id, WireCodec::normalize_transfer_id(transfer_id));
}

bool ChunkReassembler::accepts_size(uint64_t file_size) const {
    return file_size <= max_file_size_ &&
           WireCodec::chunk_count(file_size, chunk_size_) <= std::numeric_limits<uint32_t>::max();
}

bool ChunkReassembler::begin(const std::string& sender_id, const std::string& transfer_id, uint64_t file_size) {
    TransferKey key = make_key(sender_id, transfer_id);
    if (key.second.empty()) {
        return false;
    }
    if (!accepts_size(file_size)) {
        LOG_CODEC_WARN("Refusing transfer " << key.second << " from " << sender_id << ": "
                       << file_size << " bytes exceeds the " << max_file_size_ << " byte limit");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (transfers_.count(key) > 0) {
        return false;
    }
    Transfer transfer;
    transfer.file_size = file_size;
    transfer.total_chunks = static_cast<uint32_t>(WireCodec::chunk_count(file_size, chunk_size_));
    transfer.buffered_bytes = 0;
    transfer.last_activity = std::chrono::steady_clock::now();
    transfers_.emplace(std::move(key), std::move(transfer));
    return true;
}

ChunkResult ChunkReassembler::add_chunk(const std::string& sender_id, const ChunkFrame& frame) {
    TransferKey key = make_key(sender_id, frame.transfer_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(key);
    if (it == transfers_.end()) {
        return ChunkResult::UnknownTransfer;
    }

    Transfer& transfer = it->second;
    if (frame.total != transfer.total_chunks) {
        return ChunkResult::TotalMismatch;
    }
    if (frame.index >= transfer.total_chunks) {
        return ChunkResult::IndexOutOfRange;
    }
    if (frame.payload.size() > chunk_size_ ||
        transfer.buffered_bytes + frame.payload.size() > transfer.file_size) {
        return ChunkResult::Malformed;
    }
    if (transfer.chunks.count(frame.index) > 0) {
        return ChunkResult::Duplicate;
    }

    transfer.chunks.emplace(frame.index, frame.payload);
    transfer.buffered_bytes += frame.payload.size();
    transfer.last_activity = std::chrono::steady_clock::now();
    if (transfer.chunks.size() == transfer.total_chunks) {
        return ChunkResult::Complete;
    }
    return ChunkResult::Accepted;
}

ChunkResult ChunkReassembler::add_frame(const std::string& sender_id, const std::vector<uint8_t>& data,
                                        std::string* out_transfer_id) {
    auto frame = WireCodec::decode_chunk(data);
    if (!frame) {
        return ChunkResult::Malformed;
    }
    if (out_transfer_id) {
        *out_transfer_id = frame->transfer_id;
    }
    return add_chunk(sender_id, *frame);
}

bool ChunkReassembler::is_known(const std::string& sender_id, const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.count(make_key(sender_id, transfer_id)) > 0;
}

bool ChunkReassembler::is_complete(const std::string& sender_id, const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(make_key(sender_id, transfer_id));
    return it != transfers_.end() && it->second.chunks.size() == it->second.total_chunks;
}

uint32_t ChunkReassembler::received_count(const std::string& sender_id, const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(make_key(sender_id, transfer_id));
    if (it == transfers_.end()) {
        return 0;
    }
    return static_cast<uint32_t>(it->second.chunks.size());
}

std::optional<std::vector<uint8_t>> ChunkReassembler::take(const std::string& sender_id,
                                                           const std::string& transfer_id) {
    TransferKey key = make_key(sender_id, transfer_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(key);
    if (it == transfers_.end() || it->second.chunks.size() != it->second.total_chunks) {
        return std::nullopt;
    }

    uint64_t expected = it->second.file_size;
    uint64_t buffered = it->second.buffered_bytes;

    std::vector<uint8_t> data;
    if (buffered == expected) {
        data.reserve(static_cast<size_t>(buffered));
        // std::map iterates in index order
        for (const auto& chunk : it->second.chunks) {
            data.insert(data.end(), chunk.second.begin(), chunk.second.end());
        }
    }
    transfers_.erase(it);

    if (buffered != expected) {
        LOG_CODEC_WARN("Transfer " << key.second << " from " << sender_id << " reassembled to "
                       << buffered << " bytes, expected " << expected);
        return std::nullopt;
    }
    return data;
}

void ChunkReassembler::cancel(const std::string& sender_id, const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_.erase(make_key(sender_id, transfer_id));
}

size_t ChunkReassembler::cancel_sender(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = transfers_.lower_bound(TransferKey(sender_id, "")); it != transfers_.end() && it->first.first == sender_id;) {
        it = transfers_.erase(it);
        removed++;
    }
    return removed;
}

std::vector<std::pair<std::string, std::string>> ChunkReassembler::prune_stale(std::chrono::milliseconds max_idle) {
    std::vector<TransferKey> pruned;
    auto cutoff = std::chrono::steady_clock::now() - max_idle;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (it->second.last_activity < cutoff) {
            LOG_CODEC_INFO("Dropping stalled transfer " << it->first.second << " from " << it->first.first
                           << " (" << it->second.chunks.size() << "/" << it->second.total_chunks << " chunks)");
            pruned.push_back(it->first);
            it = transfers_.erase(it);
        } else {
            ++it;
        }
    }
    return pruned;
}

size_t ChunkReassembler::active_transfer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

} // namespace meshchat
