#include "progress_sink.hpp"
#include <iterator>
#include <utility>

const char* ProgressEventTypeName(ProgressEvent::Type type) {
    switch (type) {
        case ProgressEvent::Type::ChunkStart: return "chunk_start";
        case ProgressEvent::Type::ChunkProgress: return "chunk_progress";
        case ProgressEvent::Type::ChunkComplete: return "chunk_complete";
        case ProgressEvent::Type::ChunkError: return "chunk_error";
        case ProgressEvent::Type::TransferComplete: return "transfer_complete";
        default: return "unknown";
    }
}

void ProgressEventQueue::Push(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void ProgressEventQueue::OnChunkStart(int chunk_index, std::uint64_t size) {
    ProgressEvent event;
    event.type = ProgressEvent::Type::ChunkStart;
    event.chunk_index = chunk_index;
    event.bytes = size;
    Push(std::move(event));
}

void ProgressEventQueue::OnChunkProgress(int chunk_index, std::uint64_t bytes_so_far) {
    ProgressEvent event;
    event.type = ProgressEvent::Type::ChunkProgress;
    event.chunk_index = chunk_index;
    event.bytes = bytes_so_far;
    Push(std::move(event));
}

void ProgressEventQueue::OnChunkComplete(int chunk_index, const std::string& remote_tag) {
    ProgressEvent event;
    event.type = ProgressEvent::Type::ChunkComplete;
    event.chunk_index = chunk_index;
    event.detail = remote_tag;
    Push(std::move(event));
}

void ProgressEventQueue::OnChunkError(int chunk_index, const std::string& error, int attempt) {
    ProgressEvent event;
    event.type = ProgressEvent::Type::ChunkError;
    event.chunk_index = chunk_index;
    event.detail = error;
    event.attempt = attempt;
    Push(std::move(event));
}

void ProgressEventQueue::OnTransferComplete(const TransferResult& summary) {
    ProgressEvent event;
    event.type = ProgressEvent::Type::TransferComplete;
    event.bytes = summary.bytes_transferred;
    event.detail = summary.message;
    event.summary = summary;
    Push(std::move(event));
}

std::optional<ProgressEvent> ProgressEventQueue::WaitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressEventQueue::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> drained(std::make_move_iterator(events_.begin()),
                                       std::make_move_iterator(events_.end()));
    events_.clear();
    return drained;
}

void ProgressEventQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressEventQueue::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProgressEventQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
