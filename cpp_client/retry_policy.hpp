#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include "config.hpp"
#include "http_types.hpp"

enum class RetryMode {
    Classified, // only TransportError is retried
    Uniform     // everything except ValidationError and CancelledError
};

RetryMode ParseRetryMode(const std::string& name);

class RetryPolicy {
public:
    using Operation = std::function<void(int attempt)>;
    using ErrorHandler = std::function<void(const std::exception& error, int attempt, bool will_retry)>;

    explicit RetryPolicy(int max_attempts = 3,
                         std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000),
                         RetryMode mode = RetryMode::Classified);

    static RetryPolicy FromConfig(const Config::RetryConfig& config);

    // Attempts are counted from 1.
    bool ShouldRetry(const std::exception& error, int attempt, int max_attempts) const;
    bool ShouldRetry(const std::exception& error, int attempt) const;

    // base * 2^attempt.
    std::chrono::milliseconds BackoffDelay(int attempt) const;

    // Runs `operation` until it succeeds or an error is final. Rethrows the last
    // error; throws CancelledError when cancelled before an attempt or during backoff.
    void Run(const Operation& operation, const ErrorHandler& on_error, const CancellationToken* cancel) const;

    int MaxAttempts() const { return max_attempts_; }
    RetryMode Mode() const { return mode_; }

private:
    int max_attempts_;
    std::chrono::milliseconds base_delay_;
    RetryMode mode_;
};

#endif // RETRY_POLICY_HPP
