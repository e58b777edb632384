#include "chunk_scheduler.hpp"
#include "transfer_errors.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace {
bool IsCancellation(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return true;
    } catch (...) {
        return false;
    }
}
} // namespace

ChunkScheduler::Outcome ChunkScheduler::Run(const std::vector<int>& pending, int concurrency,
                                            const CancellationToken* cancel, const Work& work) {
    Outcome outcome;
    if (pending.empty()) {
        return outcome;
    }

    std::atomic<std::size_t> cursor(0);
    std::atomic<std::size_t> run_count(0);
    std::atomic<bool> stop(false);
    std::mutex outcome_mutex;

    auto worker = [&]() {
        while (!stop.load(std::memory_order_acquire)) {
            if (cancel && cancel->IsCancelled()) {
                break;
            }
            std::size_t slot = cursor.fetch_add(1, std::memory_order_relaxed);
            if (slot >= pending.size()) {
                break;
            }

            int index = pending[slot];
            try {
                work(index);
                run_count.fetch_add(1, std::memory_order_relaxed);
            } catch (...) {
                // Handed back to the caller through Outcome::error.
                std::lock_guard<std::mutex> lock(outcome_mutex);
                if (!outcome.error) {
                    outcome.error = std::current_exception();
                    outcome.failed_chunk = index;
                }
                stop.store(true, std::memory_order_release);
            }
        }
    };

    std::size_t thread_count = std::min<std::size_t>(static_cast<std::size_t>(std::max(1, concurrency)),
                                                     pending.size());
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    outcome.chunks_run = run_count.load();
    if (outcome.error) {
        outcome.cancelled = IsCancellation(outcome.error);
    } else if (cancel && cancel->IsCancelled() && outcome.chunks_run < pending.size()) {
        outcome.cancelled = true;
    }
    return outcome;
}
