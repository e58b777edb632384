#ifndef UPLOAD_ENGINE_HPP
#define UPLOAD_ENGINE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include "config.hpp"
#include "progress_sink.hpp"
#include "retry_policy.hpp"
#include "s3_client.hpp"
#include "transfer_result.hpp"
#include "transfer_state.hpp"
#include "transfer_state_store.hpp"

// Multipart upload: create, upload parts in parallel, complete (or abort on failure).
class UploadEngine {
public:
    static constexpr std::uint64_t kMaxParts = 10000;
    static constexpr int kMaxConcurrency = 10;

    UploadEngine(S3Client& client, TransferStateStore& store, const RetryPolicy& retry, ProgressSink& sink,
                 const Config::UploadConfig& config);

    // Applies the minimum part size and grows the chunk so the part count stays within kMaxParts.
    // A zero request means the configured default.
    std::uint64_t EffectiveChunkSize(std::uint64_t requested, std::uint64_t total_size) const;

    // Returns a resumable persisted state when `resume` is set and it is still valid, otherwise a fresh one.
    // A saved upload created with different metadata is not resumed.
    // Throws ValidationError for bad input or an empty/missing source file.
    TransferState PrepareUpload(const std::string& bucket, const std::string& key, const std::string& local_path,
                                std::uint64_t chunk_size, bool resume, const UploadMetadata& metadata = {});

    TransferResult Run(TransferState& state, const CancellationToken& cancel);

    int Concurrency() const { return concurrency_; }

    static SourceFingerprint StatSource(const std::string& local_path);

private:
    void UploadChunk(TransferState& state, int index, std::mutex& state_mutex, const CancellationToken& cancel);
    void AbortQuietly(const TransferState& state);
    void SaveQuietly(const TransferState& state);

    S3Client& client_;
    TransferStateStore& store_;
    const RetryPolicy& retry_;
    ProgressSink& sink_;
    std::uint64_t default_chunk_size_;
    std::uint64_t min_part_size_;
    int concurrency_;
};

// Deletes expired state records and aborts the multipart uploads they still reference.
// Returns the number of records removed.
std::size_t PurgeExpiredTransfers(TransferStateStore& store, S3Client& client,
                                  std::chrono::system_clock::time_point now);

#endif // UPLOAD_ENGINE_HPP
