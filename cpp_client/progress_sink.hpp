#ifndef PROGRESS_SINK_HPP
#define PROGRESS_SINK_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "transfer_result.hpp"

// Receives transfer events. Called from worker threads; implementations must be thread safe.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void OnChunkStart(int chunk_index, std::uint64_t size) = 0;
    virtual void OnChunkProgress(int chunk_index, std::uint64_t bytes_so_far) = 0;
    virtual void OnChunkComplete(int chunk_index, const std::string& remote_tag) = 0;
    virtual void OnChunkError(int chunk_index, const std::string& error, int attempt) = 0;
    virtual void OnTransferComplete(const TransferResult& summary) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void OnChunkStart(int, std::uint64_t) override {}
    void OnChunkProgress(int, std::uint64_t) override {}
    void OnChunkComplete(int, const std::string&) override {}
    void OnChunkError(int, const std::string&, int) override {}
    void OnTransferComplete(const TransferResult&) override {}
};

struct ProgressEvent {
    enum class Type {
        ChunkStart,
        ChunkProgress,
        ChunkComplete,
        ChunkError,
        TransferComplete
    };

    Type type = Type::ChunkStart;
    int chunk_index = -1;
    std::uint64_t bytes = 0;   // chunk size for ChunkStart, bytes so far for ChunkProgress
    std::string detail;        // remote tag or error message
    int attempt = 0;
    TransferResult summary;    // TransferComplete only
};

const char* ProgressEventTypeName(ProgressEvent::Type type);

// Buffers events from workers so a host thread can consume them at its own pace.
class ProgressEventQueue : public ProgressSink {
public:
    void OnChunkStart(int chunk_index, std::uint64_t size) override;
    void OnChunkProgress(int chunk_index, std::uint64_t bytes_so_far) override;
    void OnChunkComplete(int chunk_index, const std::string& remote_tag) override;
    void OnChunkError(int chunk_index, const std::string& error, int attempt) override;
    void OnTransferComplete(const TransferResult& summary) override;

    // Next event, or nullopt if none arrived within `timeout` or the queue is closed and empty.
    std::optional<ProgressEvent> WaitPop(std::chrono::milliseconds timeout);

    std::vector<ProgressEvent> Drain();

    // Wakes waiters; later events are dropped.
    void Close();
    bool IsClosed() const;
    std::size_t Size() const;

private:
    void Push(ProgressEvent event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
};

#endif // PROGRESS_SINK_HPP
