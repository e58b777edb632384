#include "retry_policy.hpp"
#include "logger.hpp"
#include "transfer_errors.hpp"
#include <algorithm>
#include <thread>

namespace {
constexpr int kMaxBackoffShift = 16;
}

RetryMode ParseRetryMode(const std::string& name) {
    if (name == "classified") return RetryMode::Classified;
    if (name == "uniform") return RetryMode::Uniform;
    throw ValidationError("Unknown retry mode: " + name);
}

RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds base_delay, RetryMode mode)
    : max_attempts_(std::max(1, max_attempts)), base_delay_(std::max(std::chrono::milliseconds(0), base_delay)),
      mode_(mode) {}

RetryPolicy RetryPolicy::FromConfig(const Config::RetryConfig& config) {
    return RetryPolicy(config.max_retries, std::chrono::milliseconds(config.backoff_base_ms),
                       ParseRetryMode(config.mode));
}

bool RetryPolicy::ShouldRetry(const std::exception& error, int attempt, int max_attempts) const {
    if (attempt >= max_attempts) {
        return false;
    }

    const auto* transfer_error = dynamic_cast<const TransferError*>(&error);
    if (mode_ == RetryMode::Classified) {
        return transfer_error && transfer_error->Kind() == ErrorKind::Transport;
    }

    if (transfer_error) {
        ErrorKind kind = transfer_error->Kind();
        return kind != ErrorKind::Validation && kind != ErrorKind::Cancelled;
    }
    return true;
}

bool RetryPolicy::ShouldRetry(const std::exception& error, int attempt) const {
    return ShouldRetry(error, attempt, max_attempts_);
}

std::chrono::milliseconds RetryPolicy::BackoffDelay(int attempt) const {
    int shift = std::min(std::max(attempt, 0), kMaxBackoffShift);
    return base_delay_ * (1LL << shift);
}

void RetryPolicy::Run(const Operation& operation, const ErrorHandler& on_error,
                      const CancellationToken* cancel) const {
    for (int attempt = 1;; ++attempt) {
        if (cancel && cancel->IsCancelled()) {
            throw CancelledError();
        }

        try {
            operation(attempt);
            return;
        } catch (const std::exception& e) {
            bool will_retry = ShouldRetry(e, attempt);
            if (on_error) {
                on_error(e, attempt, will_retry);
            }
            if (!will_retry) {
                throw;
            }

            auto delay = BackoffDelay(attempt);
            Logger::Warn("Attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts_) +
                             " failed: " + e.what() + "; retrying in " + std::to_string(delay.count()) + " ms",
                         "Retry");
            if (cancel) {
                if (cancel->WaitFor(delay)) {
                    throw CancelledError();
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }
}
