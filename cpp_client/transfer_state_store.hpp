#ifndef TRANSFER_STATE_STORE_HPP
#define TRANSFER_STATE_STORE_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "transfer_state.hpp"

// Resumable transfer state in SQLite (<directory>/transfers.db), one row per
// (bucket, object_key, local_path, transfer_type).
class TransferStateStore {
public:
    TransferStateStore(const std::string& directory, int max_age_days = 7);
    ~TransferStateStore();

    TransferStateStore(const TransferStateStore&) = delete;
    TransferStateStore& operator=(const TransferStateStore&) = delete;

    void Save(const TransferState& state);

    // Undecodable or inconsistent records are logged and reported as absent.
    std::optional<TransferState> Load(const TransferIdentity& identity);

    void Delete(const TransferIdentity& identity);

    bool IsValid(const TransferState& state, const SourceFingerprint& current,
                 std::chrono::system_clock::time_point now) const;

    // Throws ResumeInvalidError naming the first reason the state cannot be resumed.
    void CheckResumable(const TransferState& state, const SourceFingerprint& current,
                        std::chrono::system_clock::time_point now) const;

    std::vector<TransferState> List();

    // Removes records last updated before now - max age and returns the decodable ones,
    // so the caller can release anything they still reference remotely.
    std::vector<TransferState> PurgeExpired(std::chrono::system_clock::time_point now);

    const std::string& DatabasePath() const { return db_path_; }
    std::chrono::hours MaxAge() const { return max_age_; }

private:
    using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    void Init();
    void Execute(const std::string& sql);
    Statement Prepare(const char* sql);
    void BindIdentity(sqlite3_stmt* stmt, const TransferIdentity& identity);
    std::optional<TransferState> Decode(const std::string& text, const std::string& what) const;
    std::string InvalidReason(const TransferState& state, const SourceFingerprint& current,
                              std::chrono::system_clock::time_point now) const;

    std::string db_path_;
    std::chrono::hours max_age_;
    sqlite3* db_;
    std::mutex mutex_;
};

#endif // TRANSFER_STATE_STORE_HPP
