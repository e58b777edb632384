#ifndef TRANSFER_RESULT_HPP
#define TRANSFER_RESULT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "transfer_errors.hpp"

// Outcome of one UploadEngine / DownloadEngine run.
struct TransferResult {
    bool success = false;
    std::optional<ErrorKind> error;
    std::string message;
    int failed_chunk = -1;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_size = 0;
    std::chrono::milliseconds duration{0};
    std::string etag;
    std::string location;
    std::string upload_id;
    bool resumed = false;
    std::size_t chunks_completed = 0;
    std::size_t chunk_count = 0;

    bool Cancelled() const { return error && *error == ErrorKind::Cancelled; }

    nlohmann::json ToJson() const {
        nlohmann::json j;
        j["success"] = success;
        if (error) {
            j["error"] = ErrorKindName(*error);
        } else {
            j["error"] = nullptr;
        }
        j["message"] = message;
        j["failed_chunk"] = failed_chunk;
        j["bytes_transferred"] = bytes_transferred;
        j["total_size"] = total_size;
        j["duration_ms"] = duration.count();
        j["etag"] = etag;
        j["location"] = location;
        j["upload_id"] = upload_id;
        j["resumed"] = resumed;
        j["chunks_completed"] = chunks_completed;
        j["chunk_count"] = chunk_count;
        return j;
    }
};

#endif // TRANSFER_RESULT_HPP
