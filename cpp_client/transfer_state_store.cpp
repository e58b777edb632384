#include "transfer_state_store.hpp"
#include "logger.hpp"
#include "transfer_errors.hpp"
#include <filesystem>
#include <stdexcept>
#include <utility>

TransferStateStore::TransferStateStore(const std::string& directory, int max_age_days)
    : max_age_(std::chrono::hours(24) * max_age_days), db_(nullptr) {
    if (directory.empty()) {
        throw ValidationError("state directory must not be empty");
    }
    if (max_age_days < 1) {
        throw ValidationError("state max age must be at least one day");
    }

    std::filesystem::create_directories(directory);
    db_path_ = (std::filesystem::path(directory) / "transfers.db").string();

    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("Failed to open SQLite database " + db_path_ + ": " + error);
    }
    sqlite3_busy_timeout(db_, 5000);
    Init();
}

TransferStateStore::~TransferStateStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void TransferStateStore::Init() {
    Execute("CREATE TABLE IF NOT EXISTS transfers ("
            "bucket TEXT NOT NULL, "
            "object_key TEXT NOT NULL, "
            "local_path TEXT NOT NULL, "
            "transfer_type TEXT NOT NULL, "
            "state TEXT NOT NULL, "
            "updated_at INTEGER NOT NULL, "
            "PRIMARY KEY (bucket, object_key, local_path, transfer_type));");
}

void TransferStateStore::Execute(const std::string& sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = "SQL error: " + std::string(errMsg ? errMsg : sqlite3_errmsg(db_));
        sqlite3_free(errMsg);
        throw std::runtime_error(error);
    }
}

TransferStateStore::Statement TransferStateStore::Prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return Statement(stmt, &sqlite3_finalize);
}

void TransferStateStore::BindIdentity(sqlite3_stmt* stmt, const TransferIdentity& identity) {
    sqlite3_bind_text(stmt, 1, identity.bucket.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, identity.object_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, identity.local_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, TransferTypeName(identity.type), -1, SQLITE_STATIC);
}

void TransferStateStore::Save(const TransferState& state) {
    std::string text = nlohmann::json(state).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    Execute("BEGIN IMMEDIATE TRANSACTION;");
    try {
        Statement stmt = Prepare(
            "INSERT OR REPLACE INTO transfers "
            "(bucket, object_key, local_path, transfer_type, state, updated_at) VALUES (?, ?, ?, ?, ?, ?);");
        BindIdentity(stmt.get(), state.identity);
        sqlite3_bind_text(stmt.get(), 5, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 6, ToEpochMillis(state.updated_at));

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error("Failed to save transfer state: " + std::string(sqlite3_errmsg(db_)));
        }
        stmt.reset();
        Execute("COMMIT;");
    } catch (const std::exception&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

std::optional<TransferState> TransferStateStore::Decode(const std::string& text, const std::string& what) const {
    try {
        TransferState state = nlohmann::json::parse(text).get<TransferState>();
        if (!state.IsConsistent()) {
            Logger::Warn("Ignoring inconsistent transfer state for " + what, "StateStore");
            return std::nullopt;
        }
        return state;
    } catch (const nlohmann::json::exception& e) {
        Logger::Warn("Ignoring undecodable transfer state for " + what + ": " + e.what(), "StateStore");
    } catch (const ValidationError& e) {
        Logger::Warn("Ignoring undecodable transfer state for " + what + ": " + e.what(), "StateStore");
    }
    return std::nullopt;
}

std::optional<TransferState> TransferStateStore::Load(const TransferIdentity& identity) {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt = Prepare(
            "SELECT state FROM transfers "
            "WHERE bucket = ? AND object_key = ? AND local_path = ? AND transfer_type = ?;");
        BindIdentity(stmt.get(), identity);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            throw std::runtime_error("Failed to load transfer state: " + std::string(sqlite3_errmsg(db_)));
        }
        const unsigned char* data = sqlite3_column_text(stmt.get(), 0);
        int len = sqlite3_column_bytes(stmt.get(), 0);
        if (data) {
            text.assign(reinterpret_cast<const char*>(data), static_cast<size_t>(len));
        }
    }

    auto state = Decode(text, identity.Describe());
    if (state && !(state->identity == identity)) {
        Logger::Warn("Stored transfer state does not match its key: " + identity.Describe(), "StateStore");
        return std::nullopt;
    }
    return state;
}

void TransferStateStore::Delete(const TransferIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt = Prepare(
        "DELETE FROM transfers WHERE bucket = ? AND object_key = ? AND local_path = ? AND transfer_type = ?;");
    BindIdentity(stmt.get(), identity);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("Failed to delete transfer state: " + std::string(sqlite3_errmsg(db_)));
    }
}

std::string TransferStateStore::InvalidReason(const TransferState& state, const SourceFingerprint& current,
                                              std::chrono::system_clock::time_point now) const {
    if (now - state.updated_at > max_age_) {
        return "state is older than " + std::to_string(max_age_.count() / 24) + " days";
    }
    if (state.fingerprint.size != current.size) {
        return "size changed from " + std::to_string(state.fingerprint.size) + " to " +
               std::to_string(current.size);
    }
    if (state.identity.type == TransferType::Upload) {
        if (state.fingerprint.mtime_ns != current.mtime_ns) {
            return "source file was modified";
        }
    } else if (state.fingerprint.etag != current.etag) {
        return "remote ETag changed from " + state.fingerprint.etag + " to " + current.etag;
    }
    return "";
}

bool TransferStateStore::IsValid(const TransferState& state, const SourceFingerprint& current,
                                 std::chrono::system_clock::time_point now) const {
    return InvalidReason(state, current, now).empty();
}

void TransferStateStore::CheckResumable(const TransferState& state, const SourceFingerprint& current,
                                        std::chrono::system_clock::time_point now) const {
    std::string reason = InvalidReason(state, current, now);
    if (!reason.empty()) {
        throw ResumeInvalidError("Cannot resume " + state.identity.Describe() + ": " + reason);
    }
}

std::vector<TransferState> TransferStateStore::List() {
    std::vector<std::pair<std::string, std::string>> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt = Prepare(
            "SELECT bucket || '/' || object_key || ' (' || transfer_type || ')', state FROM transfers "
            "ORDER BY updated_at DESC;");
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            const unsigned char* name = sqlite3_column_text(stmt.get(), 0);
            const unsigned char* data = sqlite3_column_text(stmt.get(), 1);
            int len = sqlite3_column_bytes(stmt.get(), 1);
            rows.emplace_back(name ? reinterpret_cast<const char*>(name) : "",
                              data ? std::string(reinterpret_cast<const char*>(data), static_cast<size_t>(len))
                                   : std::string());
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("Failed to list transfer states: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    std::vector<TransferState> states;
    for (const auto& row : rows) {
        if (auto state = Decode(row.second, row.first)) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

std::vector<TransferState> TransferStateStore::PurgeExpired(std::chrono::system_clock::time_point now) {
    const std::int64_t cutoff = ToEpochMillis(now - max_age_);
    std::vector<std::pair<std::string, std::string>> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Execute("BEGIN IMMEDIATE;");
        try {
            Statement select = Prepare(
                "SELECT bucket || '/' || object_key || ' (' || transfer_type || ')', state FROM transfers "
                "WHERE updated_at < ?;");
            sqlite3_bind_int64(select.get(), 1, cutoff);
            int rc;
            while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
                const unsigned char* name = sqlite3_column_text(select.get(), 0);
                const unsigned char* data = sqlite3_column_text(select.get(), 1);
                int len = sqlite3_column_bytes(select.get(), 1);
                rows.emplace_back(name ? reinterpret_cast<const char*>(name) : "",
                                  data ? std::string(reinterpret_cast<const char*>(data), static_cast<size_t>(len))
                                       : std::string());
            }
            if (rc != SQLITE_DONE) {
                throw std::runtime_error("Failed to read expired transfer states: " +
                                         std::string(sqlite3_errmsg(db_)));
            }

            Statement remove = Prepare("DELETE FROM transfers WHERE updated_at < ?;");
            sqlite3_bind_int64(remove.get(), 1, cutoff);
            if (sqlite3_step(remove.get()) != SQLITE_DONE) {
                throw std::runtime_error("Failed to purge transfer states: " + std::string(sqlite3_errmsg(db_)));
            }
            Execute("COMMIT;");
        } catch (const std::exception&) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
    }

    if (!rows.empty()) {
        Logger::Info("Purged " + std::to_string(rows.size()) + " expired transfer states", "StateStore");
    }
    std::vector<TransferState> purged;
    for (const auto& row : rows) {
        if (auto state = Decode(row.second, row.first)) {
            purged.push_back(std::move(*state));
        }
    }
    return purged;
}
