#include "transfer_state.hpp"
#include "transfer_errors.hpp"
#include <algorithm>

using json = nlohmann::json;

const char* TransferTypeName(TransferType type) {
    return type == TransferType::Upload ? "upload" : "download";
}

TransferType ParseTransferType(const std::string& name) {
    if (name == "upload") return TransferType::Upload;
    if (name == "download") return TransferType::Download;
    throw ValidationError("Unknown transfer type: " + name);
}

std::string TransferIdentity::Describe() const {
    return std::string(TransferTypeName(type)) + " " + bucket + "/" + object_key + " <-> " + local_path;
}

std::uint64_t TransferState::BytesTransferred() const {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks) {
        if (chunk.completed) total += chunk.size;
    }
    return total;
}

std::size_t TransferState::CompletedChunks() const {
    return static_cast<std::size_t>(
        std::count_if(chunks.begin(), chunks.end(), [](const ChunkRecord& c) { return c.completed; }));
}

std::vector<int> TransferState::PendingChunks() const {
    std::vector<int> pending;
    for (const auto& chunk : chunks) {
        if (!chunk.completed) pending.push_back(chunk.index);
    }
    return pending;
}

bool TransferState::IsComplete() const {
    return CompletedChunks() == chunks.size();
}

bool TransferState::IsConsistent() const {
    if (chunk_size == 0) return false;
    std::uint64_t expected_count = (total_size + chunk_size - 1) / chunk_size;
    if (chunks.size() != expected_count) return false;

    std::uint64_t next = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.index != static_cast<int>(i) || chunk.start != next || chunk.size == 0 ||
            chunk.end != chunk.start + chunk.size - 1) {
            return false;
        }
        next = chunk.end + 1;
    }
    return next == total_size;
}

void TransferState::ResetProgress() {
    for (auto& chunk : chunks) {
        chunk.completed = false;
        chunk.etag.clear();
        chunk.completed_at = std::chrono::system_clock::time_point{};
    }
}

std::vector<ChunkRecord> PlanChunks(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw ValidationError("chunk size must be greater than zero");
    }

    std::vector<ChunkRecord> chunks;
    chunks.reserve(static_cast<std::size_t>((total_size + chunk_size - 1) / chunk_size));
    std::uint64_t offset = 0;
    int index = 0;
    while (offset < total_size) {
        ChunkRecord chunk;
        chunk.index = index++;
        chunk.start = offset;
        chunk.size = std::min(chunk_size, total_size - offset);
        chunk.end = offset + chunk.size - 1;
        chunks.push_back(chunk);
        offset += chunk.size;
    }
    return chunks;
}

TransferState NewTransferState(const TransferIdentity& identity, std::uint64_t total_size,
                               std::uint64_t chunk_size, const SourceFingerprint& fingerprint,
                               std::chrono::system_clock::time_point now) {
    TransferState state;
    state.identity = identity;
    state.total_size = total_size;
    state.chunk_size = chunk_size;
    state.chunks = PlanChunks(total_size, chunk_size);
    state.fingerprint = fingerprint;
    state.created_at = now;
    state.updated_at = now;
    return state;
}

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(std::int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

void to_json(json& j, const TransferIdentity& identity) {
    j = json{{"bucket", identity.bucket},
             {"object_key", identity.object_key},
             {"local_path", identity.local_path},
             {"transfer_type", TransferTypeName(identity.type)}};
}

void from_json(const json& j, TransferIdentity& identity) {
    identity.bucket = j.at("bucket").get<std::string>();
    identity.object_key = j.at("object_key").get<std::string>();
    identity.local_path = j.at("local_path").get<std::string>();
    identity.type = ParseTransferType(j.at("transfer_type").get<std::string>());
}

void to_json(json& j, const SourceFingerprint& fingerprint) {
    j = json{{"size", fingerprint.size}, {"mtime_ns", fingerprint.mtime_ns}, {"etag", fingerprint.etag}};
}

void from_json(const json& j, SourceFingerprint& fingerprint) {
    fingerprint.size = j.at("size").get<std::uint64_t>();
    fingerprint.mtime_ns = j.value("mtime_ns", static_cast<std::int64_t>(0));
    fingerprint.etag = j.value("etag", std::string());
}

void to_json(json& j, const ChunkRecord& chunk) {
    j = json{{"index", chunk.index},
             {"start", chunk.start},
             {"end", chunk.end},
             {"size", chunk.size},
             {"completed", chunk.completed},
             {"etag", chunk.etag},
             {"completed_at", ToEpochMillis(chunk.completed_at)},
             {"retry_count", chunk.retry_count},
             {"last_error", chunk.last_error}};
}

void from_json(const json& j, ChunkRecord& chunk) {
    chunk.index = j.at("index").get<int>();
    chunk.start = j.at("start").get<std::uint64_t>();
    chunk.end = j.at("end").get<std::uint64_t>();
    chunk.size = j.at("size").get<std::uint64_t>();
    chunk.completed = j.at("completed").get<bool>();
    chunk.etag = j.value("etag", std::string());
    chunk.completed_at = FromEpochMillis(j.value("completed_at", static_cast<std::int64_t>(0)));
    chunk.retry_count = j.value("retry_count", 0);
    chunk.last_error = j.value("last_error", std::string());
}

void to_json(json& j, const UploadMetadata& metadata) {
    j = json{{"content_type", metadata.content_type}, {"user", metadata.user}};
}

void from_json(const json& j, UploadMetadata& metadata) {
    metadata.content_type = j.value("content_type", std::string());
    metadata.user = j.value("user", std::map<std::string, std::string>());
}

void to_json(json& j, const TransferState& state) {
    j = json{{"identity", state.identity},
             {"total_size", state.total_size},
             {"chunk_size", state.chunk_size},
             {"chunks", state.chunks},
             {"upload_id", state.upload_id},
             {"fingerprint", state.fingerprint},
             {"metadata", state.metadata},
             {"created_at", ToEpochMillis(state.created_at)},
             {"updated_at", ToEpochMillis(state.updated_at)}};
}

void from_json(const json& j, TransferState& state) {
    state.identity = j.at("identity").get<TransferIdentity>();
    state.total_size = j.at("total_size").get<std::uint64_t>();
    state.chunk_size = j.at("chunk_size").get<std::uint64_t>();
    state.chunks = j.at("chunks").get<std::vector<ChunkRecord>>();
    state.upload_id = j.value("upload_id", std::string());
    state.fingerprint = j.at("fingerprint").get<SourceFingerprint>();
    if (j.contains("metadata")) {
        state.metadata = j.at("metadata").get<UploadMetadata>();
    }
    state.created_at = FromEpochMillis(j.at("created_at").get<std::int64_t>());
    state.updated_at = FromEpochMillis(j.at("updated_at").get<std::int64_t>());
}
