#include "download_engine.hpp"
#include "chunk_scheduler.hpp"
#include "logger.hpp"
#include "transfer_errors.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
const char* kComponent = "DownloadEngine";
}

DownloadEngine::DownloadEngine(S3Client& client, TransferStateStore& store, const RetryPolicy& retry,
                               ProgressSink& sink, const Config::DownloadConfig& config)
    : client_(client), store_(store), retry_(retry), sink_(sink), default_chunk_size_(config.chunk_size),
      min_chunk_size_(std::max<std::uint64_t>(1, config.min_chunk_size)),
      concurrency_(std::min(std::max(config.concurrency, 1), kMaxConcurrency)) {}

std::uint64_t DownloadEngine::EffectiveChunkSize(std::uint64_t requested) const {
    std::uint64_t chunk = requested == 0 ? default_chunk_size_ : requested;
    return std::max(chunk, min_chunk_size_);
}

bool DownloadEngine::PartialFileIntact(const TransferState& state) const {
    std::error_code ec;
    if (!fs::is_regular_file(state.identity.local_path, ec)) {
        return false;
    }
    auto size = fs::file_size(state.identity.local_path, ec);
    return !ec && size == state.total_size;
}

TransferState DownloadEngine::PrepareDownload(const std::string& bucket, const std::string& key,
                                              const std::string& local_path, std::uint64_t chunk_size,
                                              bool resume) {
    if (bucket.empty()) throw ValidationError("bucket name must not be empty");
    if (key.empty()) throw ValidationError("object key must not be empty");
    if (local_path.empty()) throw ValidationError("local path must not be empty");

    ObjectMetadata metadata;
    retry_.Run([&](int) { metadata = client_.HeadObject(bucket, key); }, nullptr, nullptr);

    SourceFingerprint fingerprint;
    fingerprint.size = metadata.size;
    fingerprint.etag = metadata.etag;

    TransferIdentity identity;
    identity.bucket = bucket;
    identity.object_key = key;
    identity.local_path = fs::absolute(local_path).lexically_normal().string();
    identity.type = TransferType::Download;

    auto now = std::chrono::system_clock::now();
    if (auto saved = store_.Load(identity)) {
        if (resume) {
            try {
                store_.CheckResumable(*saved, fingerprint, now);
                if (saved->CompletedChunks() > 0 && !PartialFileIntact(*saved)) {
                    throw ResumeInvalidError("Cannot resume " + identity.Describe() +
                                             ": partial file is missing or truncated");
                }
                Logger::Info("Resuming " + identity.Describe() + " with " +
                                 std::to_string(saved->CompletedChunks()) + "/" +
                                 std::to_string(saved->chunks.size()) + " chunks done",
                             kComponent);
                return *saved;
            } catch (const ResumeInvalidError& e) {
                Logger::Warn(std::string(e.what()) + "; starting over", kComponent);
            }
        }
        store_.Delete(identity);
    }

    return NewTransferState(identity, metadata.size, EffectiveChunkSize(chunk_size), fingerprint, now);
}

void DownloadEngine::OpenDestination(TransferState& state, Destination& destination) {
    const std::string& path = state.identity.local_path;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    if (state.CompletedChunks() > 0 && !PartialFileIntact(state)) {
        Logger::Warn("Partial file " + path + " no longer matches its state; downloading every chunk again",
                     kComponent);
        state.ResetProgress();
    }

    if (state.CompletedChunks() == 0) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create.is_open()) {
            throw std::runtime_error("Cannot create destination file " + path);
        }
        create.close();
        fs::resize_file(path, state.total_size);
    }

    destination.file.open(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!destination.file.is_open()) {
        throw std::runtime_error("Cannot open destination file " + path);
    }
}

void DownloadEngine::DownloadChunk(TransferState& state, int index, std::mutex& state_mutex,
                                   Destination& destination, const CancellationToken& cancel) {
    ChunkRecord chunk;
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        chunk = state.chunks[static_cast<size_t>(index)];
    }
    const TransferIdentity& id = state.identity;
    const std::string etag = state.fingerprint.etag;

    sink_.OnChunkStart(index, chunk.size);

    auto attempt_download = [&](int /*attempt*/) {
        std::string data = client_.GetObjectRange(
            id.bucket, id.object_key, chunk.start, chunk.end, etag,
            [this, index](std::uint64_t bytes) { sink_.OnChunkProgress(index, bytes); }, &cancel);

        if (data.size() != chunk.size) {
            throw IntegrityError("Chunk " + std::to_string(index) + " returned " + std::to_string(data.size()) +
                                 " bytes, expected " + std::to_string(chunk.size));
        }

        {
            std::lock_guard<std::mutex> lock(destination.mutex);
            destination.file.seekp(static_cast<std::streamoff>(chunk.start), std::ios::beg);
            destination.file.write(data.data(), static_cast<std::streamsize>(data.size()));
            destination.file.flush();
            if (!destination.file) {
                throw std::runtime_error("Failed to write chunk " + std::to_string(index) + " to " +
                                         id.local_path);
            }
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex);
            ChunkRecord& record = state.chunks[static_cast<size_t>(index)];
            record.completed = true;
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
        Logger::Warn("Chunk " + std::to_string(index) + " attempt " + std::to_string(attempt) +
                         " failed: " + error.what(),
                     kComponent);
        sink_.OnChunkError(index, error.what(), attempt);
    };

    retry_.Run(attempt_download, on_error, &cancel);
}

void DownloadEngine::SaveQuietly(const TransferState& state) {
    try {
        store_.Save(state);
    } catch (const std::exception& e) {
        Logger::Error("Failed to persist transfer state for " + state.identity.Describe() + ": " + e.what(),
                      kComponent);
    }
}

TransferResult DownloadEngine::Run(TransferState& state, const CancellationToken& cancel) {
    auto started = std::chrono::steady_clock::now();
    const TransferIdentity& id = state.identity;

    TransferResult result;
    result.total_size = state.total_size;
    result.chunk_count = state.chunks.size();
    result.resumed = state.CompletedChunks() > 0;
    result.etag = state.fingerprint.etag;

    Logger::Info("Starting " + id.Describe() + ": " + std::to_string(state.total_size) + " bytes in " +
                     std::to_string(state.chunks.size()) + " chunks, concurrency " + std::to_string(concurrency_),
                 kComponent);

    std::mutex state_mutex;
    Destination destination;
    try {
        if (cancel.IsCancelled()) {
            throw CancelledError();
        }

        OpenDestination(state, destination);
        state.updated_at = std::chrono::system_clock::now();
        store_.Save(state);

        ChunkScheduler::Outcome outcome = ChunkScheduler::Run(
            state.PendingChunks(), concurrency_, &cancel,
            [&](int index) { DownloadChunk(state, index, state_mutex, destination, cancel); });

        if (outcome.error) {
            result.failed_chunk = outcome.failed_chunk;
            std::rethrow_exception(outcome.error);
        }
        if (outcome.cancelled || !state.IsComplete()) {
            throw CancelledError();
        }

        destination.file.close();
        if (destination.file.fail()) {
            throw std::runtime_error("Failed to close destination file " + id.local_path);
        }
        auto written = fs::file_size(id.local_path);
        if (written != state.total_size || state.BytesTransferred() != state.total_size) {
            throw IntegrityError("Downloaded " + std::to_string(written) + " bytes to " + id.local_path +
                                 ", expected " + std::to_string(state.total_size));
        }

        store_.Delete(id);

        result.success = true;
        result.message = "download completed";
        Logger::Info("Completed " + id.Describe(), kComponent);
    } catch (const CancelledError& e) {
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

    if (!result.success) {
        // Partial file and chunk map stay on disk for resume.
        if (destination.file.is_open()) {
            destination.file.close();
        }
        SaveQuietly(state);
        if (!result.Cancelled()) {
            Logger::Error("Download " + id.Describe() + " failed: " + result.message, kComponent);
        }
    }

    result.bytes_transferred = state.BytesTransferred();
    result.chunks_completed = state.CompletedChunks();
    result.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    sink_.OnTransferComplete(result);
    return result;
}
