#ifndef HTTP_TYPES_HPP
#define HTTP_TYPES_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// Cooperative cancellation flag shared between the host and transfer workers.
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Sleeps for up to `duration`; returns true if cancelled before it elapsed.
    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this]() { return IsCancelled(); });
    }

private:
    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Called with the cumulative number of body bytes moved so far.
using ProgressCallback = std::function<void(std::uint64_t)>;

// Fills up to `max` bytes into `buffer`; returns the count written, 0 at end of body.
using BodyReader = std::function<std::size_t(char* buffer, std::size_t max)>;

struct HttpRequest {
    std::string method;
    std::string path;                          // already URI-encoded, e.g. "/bucket/key"
    std::map<std::string, std::string> query;  // raw (unencoded) query parameters
    std::map<std::string, std::string> headers;
    std::string body;
    const CancellationToken* cancel = nullptr;
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers; // lower-cased names
    std::string body;

    std::string Header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
};

#endif // HTTP_TYPES_HPP
