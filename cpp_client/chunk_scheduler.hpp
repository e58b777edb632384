#ifndef CHUNK_SCHEDULER_HPP
#define CHUNK_SCHEDULER_HPP

#include <exception>
#include <functional>
#include <vector>
#include "http_types.hpp"

// Fork-join worker pool over a list of chunk indices. Each index is claimed by
// exactly one worker; the first failure stops further claims.
class ChunkScheduler {
public:
    struct Outcome {
        int failed_chunk = -1;
        std::exception_ptr error; // null on success
        std::size_t chunks_run = 0;
        bool cancelled = false;

        bool Succeeded() const { return !error && !cancelled; }
    };

    using Work = std::function<void(int chunk_index)>;

    // Starts min(concurrency, pending.size()) threads and joins all of them before returning.
    static Outcome Run(const std::vector<int>& pending, int concurrency, const CancellationToken* cancel,
                       const Work& work);
};

#endif // CHUNK_SCHEDULER_HPP
