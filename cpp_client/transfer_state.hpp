#ifndef TRANSFER_STATE_HPP
#define TRANSFER_STATE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class TransferType {
    Upload,
    Download
};

const char* TransferTypeName(TransferType type);
TransferType ParseTransferType(const std::string& name);

// Composite key of a persisted transfer.
struct TransferIdentity {
    std::string bucket;
    std::string object_key;
    std::string local_path;
    TransferType type = TransferType::Upload;

    bool operator==(const TransferIdentity& other) const {
        return bucket == other.bucket && object_key == other.object_key && local_path == other.local_path &&
               type == other.type;
    }

    std::string Describe() const;
};

// Uploads compare size + mtime; downloads compare size + remote ETag.
struct SourceFingerprint {
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;
    std::string etag;
};

// Sent with CreateMultipartUpload; user entries go out as x-amz-meta-<name> headers.
struct UploadMetadata {
    std::string content_type;
    std::map<std::string, std::string> user;

    bool Empty() const { return content_type.empty() && user.empty(); }

    bool operator==(const UploadMetadata& other) const {
        return content_type == other.content_type && user == other.user;
    }
    bool operator!=(const UploadMetadata& other) const { return !(*this == other); }
};

struct ChunkRecord {
    int index = 0;
    std::uint64_t start = 0; // inclusive
    std::uint64_t end = 0;   // inclusive
    std::uint64_t size = 0;
    bool completed = false;
    std::string etag; // upload only, unquoted
    std::chrono::system_clock::time_point completed_at{};
    int retry_count = 0;
    std::string last_error;
};

struct TransferState {
    TransferIdentity identity;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::vector<ChunkRecord> chunks;
    std::string upload_id; // empty until the multipart upload is created
    UploadMetadata metadata; // upload only
    SourceFingerprint fingerprint;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point updated_at{};

    std::uint64_t BytesTransferred() const;
    std::size_t CompletedChunks() const;
    std::vector<int> PendingChunks() const;
    bool IsComplete() const;

    // Chunk count and ranges agree with total_size / chunk_size.
    bool IsConsistent() const;

    // Marks every chunk incomplete and drops remote part tags.
    void ResetProgress();
};

// Splits [0, total_size) into ceil(total_size / chunk_size) contiguous chunks.
std::vector<ChunkRecord> PlanChunks(std::uint64_t total_size, std::uint64_t chunk_size);

TransferState NewTransferState(const TransferIdentity& identity, std::uint64_t total_size,
                               std::uint64_t chunk_size, const SourceFingerprint& fingerprint,
                               std::chrono::system_clock::time_point now);

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point time);
std::chrono::system_clock::time_point FromEpochMillis(std::int64_t millis);

void to_json(nlohmann::json& j, const TransferIdentity& identity);
void from_json(const nlohmann::json& j, TransferIdentity& identity);
void to_json(nlohmann::json& j, const SourceFingerprint& fingerprint);
void from_json(const nlohmann::json& j, SourceFingerprint& fingerprint);
void to_json(nlohmann::json& j, const UploadMetadata& metadata);
void from_json(const nlohmann::json& j, UploadMetadata& metadata);
void to_json(nlohmann::json& j, const ChunkRecord& chunk);
void from_json(const nlohmann::json& j, ChunkRecord& chunk);
void to_json(nlohmann::json& j, const TransferState& state);
void from_json(const nlohmann::json& j, TransferState& state);

#endif // TRANSFER_STATE_HPP
