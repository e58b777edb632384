#ifndef DOWNLOAD_ENGINE_HPP
#define DOWNLOAD_ENGINE_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include "config.hpp"
#include "progress_sink.hpp"
#include "retry_policy.hpp"
#include "s3_client.hpp"
#include "transfer_result.hpp"
#include "transfer_state.hpp"
#include "transfer_state_store.hpp"

// Parallel ranged download into a preallocated destination file.
class DownloadEngine {
public:
    static constexpr int kMaxConcurrency = 8;

    DownloadEngine(S3Client& client, TransferStateStore& store, const RetryPolicy& retry, ProgressSink& sink,
                   const Config::DownloadConfig& config);

    // Zero means the configured default; never below the minimum chunk size.
    std::uint64_t EffectiveChunkSize(std::uint64_t requested) const;

    // Probes the object with HEAD. With `resume`, returns the persisted state when its
    // fingerprint and age are valid and the partial file is intact; otherwise a fresh one.
    TransferState PrepareDownload(const std::string& bucket, const std::string& key, const std::string& local_path,
                                  std::uint64_t chunk_size, bool resume);

    TransferResult Run(TransferState& state, const CancellationToken& cancel);

    int Concurrency() const { return concurrency_; }

private:
    struct Destination {
        std::fstream file;
        std::mutex mutex;
    };

    void OpenDestination(TransferState& state, Destination& destination);
    void DownloadChunk(TransferState& state, int index, std::mutex& state_mutex, Destination& destination,
                       const CancellationToken& cancel);
    bool PartialFileIntact(const TransferState& state) const;
    void SaveQuietly(const TransferState& state);

    S3Client& client_;
    TransferStateStore& store_;
    const RetryPolicy& retry_;
    ProgressSink& sink_;
    std::uint64_t default_chunk_size_;
    std::uint64_t min_chunk_size_;
    int concurrency_;
};

#endif // DOWNLOAD_ENGINE_HPP
