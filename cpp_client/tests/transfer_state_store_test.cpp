#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sqlite3.h>

#include "test_support.hpp"
#include "transfer_errors.hpp"
#include "transfer_state_store.hpp"

namespace {
using std::chrono::hours;
using Clock = std::chrono::system_clock;

TransferState MakeState(TransferType type, const std::string& key, Clock::time_point updated) {
    TransferIdentity identity{"bucket", key, "/data/" + key, type};
    SourceFingerprint fingerprint;
    fingerprint.size = 5000;
    fingerprint.mtime_ns = 111;
    fingerprint.etag = type == TransferType::Download ? "etag-1" : "";
    TransferState state = NewTransferState(identity, 5000, 2000, fingerprint, updated);
    state.updated_at = updated;
    return state;
}

void ExecRaw(const std::string& db_path, const std::string& sql) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
    EXPECT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
}
} // namespace

class TransferStateStoreTest : public ::testing::Test {
   protected:
    TempDir dir;
    std::unique_ptr<TransferStateStore> store;
    Clock::time_point now = Clock::now();

    void SetUp() override { store = std::make_unique<TransferStateStore>(dir.File("state"), 7); }
};

TEST_F(TransferStateStoreTest, SaveLoadDelete) {
    TransferState state = MakeState(TransferType::Upload, "a.bin", now);
    state.upload_id = "upload-1";
    state.chunks[1].completed = true;
    state.chunks[1].etag = "tag";
    store->Save(state);

    auto loaded = store->Load(state.identity);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->upload_id, "upload-1");
    EXPECT_TRUE(loaded->chunks[1].completed);
    EXPECT_EQ(loaded->chunks[1].etag, "tag");

    // Same key, different direction is a different record.
    TransferIdentity other = state.identity;
    other.type = TransferType::Download;
    EXPECT_FALSE(store->Load(other).has_value());

    store->Delete(state.identity);
    EXPECT_FALSE(store->Load(state.identity).has_value());
}

TEST_F(TransferStateStoreTest, SaveReplacesExistingRecord) {
    TransferState state = MakeState(TransferType::Upload, "a.bin", now);
    store->Save(state);
    state.chunks[0].completed = true;
    store->Save(state);

    EXPECT_EQ(store->List().size(), 1u);
    EXPECT_EQ(store->Load(state.identity)->CompletedChunks(), 1u);
}

TEST_F(TransferStateStoreTest, SurvivesReopen) {
    TransferState state = MakeState(TransferType::Download, "b.bin", now);
    store->Save(state);
    store.reset();

    TransferStateStore reopened(dir.File("state"), 7);
    EXPECT_TRUE(reopened.Load(state.identity).has_value());
}

TEST_F(TransferStateStoreTest, CorruptRecordIsTreatedAsAbsent) {
    TransferState state = MakeState(TransferType::Upload, "c.bin", now);
    store->Save(state);
    ExecRaw(store->DatabasePath(), "UPDATE transfers SET state = '{not json';");

    EXPECT_FALSE(store->Load(state.identity).has_value());
    EXPECT_TRUE(store->List().empty());
}

TEST_F(TransferStateStoreTest, InconsistentRecordIsTreatedAsAbsent) {
    TransferState state = MakeState(TransferType::Upload, "d.bin", now);
    state.chunks.pop_back();
    store->Save(state);
    EXPECT_FALSE(store->Load(state.identity).has_value());
}

TEST_F(TransferStateStoreTest, ValidityForUploads) {
    TransferState state = MakeState(TransferType::Upload, "e.bin", now);
    SourceFingerprint current = state.fingerprint;
    EXPECT_TRUE(store->IsValid(state, current, now));
    EXPECT_NO_THROW(store->CheckResumable(state, current, now));

    SourceFingerprint touched = current;
    touched.mtime_ns += 1;
    EXPECT_FALSE(store->IsValid(state, touched, now));
    EXPECT_THROW(store->CheckResumable(state, touched, now), ResumeInvalidError);

    SourceFingerprint grown = current;
    grown.size += 1;
    EXPECT_FALSE(store->IsValid(state, grown, now));

    // Uploads ignore the remote ETag.
    SourceFingerprint etag_only = current;
    etag_only.etag = "whatever";
    EXPECT_TRUE(store->IsValid(state, etag_only, now));
}

TEST_F(TransferStateStoreTest, ValidityForDownloads) {
    TransferState state = MakeState(TransferType::Download, "f.bin", now);
    SourceFingerprint current = state.fingerprint;
    current.mtime_ns = 999;
    EXPECT_TRUE(store->IsValid(state, current, now));

    current.etag = "etag-2";
    EXPECT_FALSE(store->IsValid(state, current, now));
}

TEST_F(TransferStateStoreTest, ExpiresAfterMaxAge) {
    TransferState state = MakeState(TransferType::Upload, "g.bin", now - hours(24 * 7) + hours(1));
    EXPECT_TRUE(store->IsValid(state, state.fingerprint, now));

    state.updated_at = now - hours(24 * 7) - hours(1);
    EXPECT_FALSE(store->IsValid(state, state.fingerprint, now));
    EXPECT_THROW(store->CheckResumable(state, state.fingerprint, now), ResumeInvalidError);
}

TEST_F(TransferStateStoreTest, ListNewestFirst) {
    store->Save(MakeState(TransferType::Upload, "old.bin", now - hours(3)));
    store->Save(MakeState(TransferType::Download, "new.bin", now));
    store->Save(MakeState(TransferType::Upload, "mid.bin", now - hours(1)));

    auto states = store->List();
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states[0].identity.object_key, "new.bin");
    EXPECT_EQ(states[1].identity.object_key, "mid.bin");
    EXPECT_EQ(states[2].identity.object_key, "old.bin");
}

TEST_F(TransferStateStoreTest, PurgeExpiredRemovesOnlyStaleRecords) {
    store->Save(MakeState(TransferType::Upload, "fresh.bin", now - hours(24)));

    TransferState stale = MakeState(TransferType::Upload, "stale.bin", now - hours(24 * 8));
    stale.upload_id = "u-stale";
    store->Save(stale);

    auto purged = store->PurgeExpired(now);
    ASSERT_EQ(purged.size(), 1u);
    EXPECT_EQ(purged[0].identity.object_key, "stale.bin");
    EXPECT_EQ(purged[0].upload_id, "u-stale");

    auto states = store->List();
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].identity.object_key, "fresh.bin");
    EXPECT_TRUE(store->PurgeExpired(now).empty());
}

TEST(TransferStateStoreConfigTest, RejectsBadArguments) {
    TempDir dir;
    EXPECT_THROW(TransferStateStore("", 7), ValidationError);
    EXPECT_THROW(TransferStateStore(dir.File("x"), 0), ValidationError);
}
