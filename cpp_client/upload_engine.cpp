#include "upload_engine.hpp"
#include "chunk_scheduler.hpp"
#include "crypto_utils.hpp"
#include "logger.hpp"
#include "transfer_errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace {
const char* kComponent = "UploadEngine";

// Single-part uploads without SSE-KMS return the hex MD5 of the body as ETag.
bool IsPlainMd5ETag(const std::string& etag) {
    return etag.size() == 32 &&
           std::all_of(etag.begin(), etag.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string ReadChunk(const std::string& path, std::uint64_t offset, std::uint64_t size) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IntegrityError("Cannot open upload source " + path);
    }
    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);

    std::string data(static_cast<size_t>(size), '\0');
    file.read(&data[0], static_cast<std::streamsize>(size));
    if (static_cast<std::uint64_t>(file.gcount()) != size) {
        throw IntegrityError("Short read from " + path + " at offset " + std::to_string(offset) + ": expected " +
                             std::to_string(size) + " bytes, got " + std::to_string(file.gcount()));
    }
    return data;
}
} // namespace

UploadEngine::UploadEngine(S3Client& client, TransferStateStore& store, const RetryPolicy& retry,
                           ProgressSink& sink, const Config::UploadConfig& config)
    : client_(client), store_(store), retry_(retry), sink_(sink), default_chunk_size_(config.chunk_size),
      min_part_size_(std::max<std::uint64_t>(1, config.min_part_size)),
      concurrency_(std::min(std::max(config.concurrency, 1), kMaxConcurrency)) {}

std::uint64_t UploadEngine::EffectiveChunkSize(std::uint64_t requested, std::uint64_t total_size) const {
    std::uint64_t chunk = requested == 0 ? default_chunk_size_ : requested;
    chunk = std::max(chunk, min_part_size_);
    if (total_size > 0 && (total_size + chunk - 1) / chunk > kMaxParts) {
        chunk = (total_size + kMaxParts - 1) / kMaxParts;
    }
    return chunk;
}

SourceFingerprint UploadEngine::StatSource(const std::string& local_path) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        throw ValidationError("Upload source is not a readable file: " + local_path);
    }

    SourceFingerprint fingerprint;
    fingerprint.size = fs::file_size(local_path);
    fingerprint.mtime_ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(fs::last_write_time(local_path).time_since_epoch())
            .count();
    return fingerprint;
}

TransferState UploadEngine::PrepareUpload(const std::string& bucket, const std::string& key,
                                          const std::string& local_path, std::uint64_t chunk_size, bool resume,
                                          const UploadMetadata& metadata) {
    if (bucket.empty()) throw ValidationError("bucket name must not be empty");
    if (key.empty()) throw ValidationError("object key must not be empty");
    if (local_path.empty()) throw ValidationError("local path must not be empty");

    SourceFingerprint fingerprint = StatSource(local_path);
    if (fingerprint.size == 0) {
        throw ValidationError("Upload source is empty: " + local_path);
    }

    TransferIdentity identity;
    identity.bucket = bucket;
    identity.object_key = key;
    identity.local_path = fs::absolute(local_path).lexically_normal().string();
    identity.type = TransferType::Upload;

    auto now = std::chrono::system_clock::now();
    if (auto saved = store_.Load(identity)) {
        if (resume) {
            try {
                store_.CheckResumable(*saved, fingerprint, now);
                if (saved->metadata != metadata) {
                    throw ResumeInvalidError("object metadata differs from the saved upload");
                }
                Logger::Info("Resuming " + identity.Describe() + " with " + std::to_string(saved->CompletedChunks()) +
                                 "/" + std::to_string(saved->chunks.size()) + " parts done",
                             kComponent);
                return *saved;
            } catch (const ResumeInvalidError& e) {
                Logger::Warn(std::string(e.what()) + "; starting over", kComponent);
            }
        }
        AbortQuietly(*saved);
        store_.Delete(identity);
    }

    std::uint64_t effective = EffectiveChunkSize(chunk_size, fingerprint.size);
    TransferState state = NewTransferState(identity, fingerprint.size, effective, fingerprint, now);
    state.metadata = metadata;
    return state;
}

void UploadEngine::UploadChunk(TransferState& state, int index, std::mutex& state_mutex,
                               const CancellationToken& cancel) {
    ChunkRecord chunk;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        chunk = state.chunks[static_cast<size_t>(index)];
    }
    const TransferIdentity& id = state.identity;
    const std::string upload_id = state.upload_id;

    sink_.OnChunkStart(index, chunk.size);

    auto attempt_upload = [&](int /*attempt*/) {
        std::string data = ReadChunk(id.local_path, chunk.start, chunk.size);
        std::string md5 = Md5Digest(data.data(), data.size());

        std::string etag = client_.UploadPart(
            id.bucket, id.object_key, upload_id, index + 1, data, Base64Encode(md5),
            [this, index](std::uint64_t bytes) { sink_.OnChunkProgress(index, bytes); }, &cancel);

        if (IsPlainMd5ETag(etag) && ToLower(etag) != HexEncode(md5)) {
            throw IntegrityError("Part " + std::to_string(index + 1) + " ETag " + etag +
                                 " does not match local MD5 " + HexEncode(md5));
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex);
            ChunkRecord& record = state.chunks[static_cast<size_t>(index)];
            record.completed = true;
            record.etag = etag;
            record.completed_at = std::chrono::system_clock::now();
            record.last_error.clear();
            state.updated_at = record.completed_at;
            store_.Save(state);
        }
        sink_.OnChunkComplete(index, etag);
    };

    auto on_error = [&](const std::exception& error, int attempt, bool will_retry) {
        if (dynamic_cast<const CancelledError*>(&error)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            ChunkRecord& record = state.chunks[static_cast<size_t>(index)];
            record.last_error = error.what();
            if (will_retry) {
                ++record.retry_count;
            }
        }
        Logger::Warn("Part " + std::to_string(index + 1) + " attempt " + std::to_string(attempt) +
                         " failed: " + error.what(),
                     kComponent);
        sink_.OnChunkError(index, error.what(), attempt);
    };

    retry_.Run(attempt_upload, on_error, &cancel);
}

void UploadEngine::AbortQuietly(const TransferState& state) {
    if (state.upload_id.empty()) {
        return;
    }
    try {
        client_.AbortMultipartUpload(state.identity.bucket, state.identity.object_key, state.upload_id);
    } catch (const std::exception& e) {
        Logger::Warn("Failed to abort multipart upload " + state.upload_id + ": " + e.what(), kComponent);
    }
}

void UploadEngine::SaveQuietly(const TransferState& state) {
    try {
        store_.Save(state);
    } catch (const std::exception& e) {
        Logger::Error("Failed to persist transfer state for " + state.identity.Describe() + ": " + e.what(),
                      kComponent);
    }
}

TransferResult UploadEngine::Run(TransferState& state, const CancellationToken& cancel) {
    auto started = std::chrono::steady_clock::now();
    const TransferIdentity& id = state.identity;

    TransferResult result;
    result.total_size = state.total_size;
    result.chunk_count = state.chunks.size();
    result.resumed = !state.upload_id.empty() || state.CompletedChunks() > 0;

    Logger::Info("Starting " + id.Describe() + ": " + std::to_string(state.total_size) + " bytes in " +
                     std::to_string(state.chunks.size()) + " parts, concurrency " + std::to_string(concurrency_),
                 kComponent);

    std::mutex state_mutex;
    try {
        if (state.chunks.empty()) {
            throw ValidationError("Nothing to upload for " + id.Describe());
        }
        if (cancel.IsCancelled()) {
            throw CancelledError();
        }

        if (state.upload_id.empty()) {
            retry_.Run(
                [&](int) {
                    state.upload_id = client_.CreateMultipartUpload(id.bucket, id.object_key, state.metadata, &cancel)
                                          .upload_id;
                },
                nullptr, &cancel);
            state.ResetProgress();
            state.updated_at = std::chrono::system_clock::now();
            store_.Save(state);
        }
        result.upload_id = state.upload_id;

        ChunkScheduler::Outcome outcome = ChunkScheduler::Run(
            state.PendingChunks(), concurrency_, &cancel,
            [&](int index) { UploadChunk(state, index, state_mutex, cancel); });

        if (outcome.error) {
            result.failed_chunk = outcome.failed_chunk;
            std::rethrow_exception(outcome.error);
        }
        if (outcome.cancelled || !state.IsComplete()) {
            throw CancelledError();
        }

        std::vector<PartResult> parts;
        parts.reserve(state.chunks.size());
        for (const auto& chunk : state.chunks) {
            parts.push_back(PartResult{chunk.index + 1, chunk.etag, chunk.size});
        }
        std::sort(parts.begin(), parts.end(),
                  [](const PartResult& a, const PartResult& b) { return a.part_number < b.part_number; });

        CompleteMultipartUploadResult completed;
        retry_.Run(
            [&](int) {
                completed = client_.CompleteMultipartUpload(id.bucket, id.object_key, state.upload_id, parts, &cancel);
            },
            nullptr, &cancel);

        result.success = true;
        try {
            store_.Delete(id);
        } catch (const std::exception& e) {
            Logger::Warn("Upload completed but its state record could not be removed: " + std::string(e.what()),
                         kComponent);
        }
        result.etag = completed.etag;
        result.location = completed.location;
        result.message = "upload completed";
        Logger::Info("Completed " + id.Describe() + " etag " + completed.etag, kComponent);
    } catch (const CancelledError& e) {
        // Upload id and finished parts stay persisted for resume.
        SaveQuietly(state);
        result.error = ErrorKind::Cancelled;
        result.message = e.what();
        Logger::Info("Cancelled " + id.Describe(), kComponent);
    } catch (const TransferError& e) {
        result.error = e.Kind();
        result.message = e.what();
    } catch (const std::exception& e) {
        result.error = ErrorKind::Internal;
        result.message = e.what();
    } catch (...) {
        result.error = ErrorKind::Internal;
        result.message = "unknown error";
    }

    result.bytes_transferred = result.success ? state.total_size : state.BytesTransferred();
    result.chunks_completed = result.success ? state.chunks.size() : state.CompletedChunks();

    if (!result.success && !result.Cancelled()) {
        Logger::Error("Upload " + id.Describe() + " failed: " + result.message, kComponent);
        // The next attempt starts a new multipart upload; retry counts and errors stay inspectable.
        bool had_upload = !state.upload_id.empty();
        if (had_upload) {
            AbortQuietly(state);
            state.upload_id.clear();
            state.ResetProgress();
        }
        if (had_upload || result.error != ErrorKind::Validation) {
            state.updated_at = std::chrono::system_clock::now();
            SaveQuietly(state);
        }
    }
    result.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    sink_.OnTransferComplete(result);
    return result;
}

std::size_t PurgeExpiredTransfers(TransferStateStore& store, S3Client& client,
                                  std::chrono::system_clock::time_point now) {
    std::vector<TransferState> purged = store.PurgeExpired(now);
    for (const auto& state : purged) {
        if (state.identity.type != TransferType::Upload || state.upload_id.empty()) {
            continue;
        }
        try {
            client.AbortMultipartUpload(state.identity.bucket, state.identity.object_key, state.upload_id);
            Logger::Info("Aborted expired multipart upload " + state.upload_id + " for " + state.identity.Describe(),
                         kComponent);
        } catch (const std::exception& e) {
            Logger::Warn("Failed to abort expired multipart upload " + state.upload_id + ": " + e.what(),
                         kComponent);
        }
    }
    return purged.size();
}
