#include <gtest/gtest.h>

#include <chrono>
#include <nlohmann/json.hpp>

#include "transfer_errors.hpp"
#include "transfer_state.hpp"

namespace {
TransferState SampleState() {
    TransferIdentity identity{"bucket", "videos/a.mp4", "/tmp/a.mp4", TransferType::Upload};
    SourceFingerprint fingerprint;
    fingerprint.size = 10000000;
    fingerprint.mtime_ns = 1700000000123456789;
    return NewTransferState(identity, 10000000, 3000000, fingerprint,
                            std::chrono::system_clock::from_time_t(1700000000));
}
} // namespace

TEST(TransferStateTest, PlanChunksCoversWholeRange) {
    auto chunks = PlanChunks(10000000, 3000000);
    ASSERT_EQ(chunks.size(), 4u);

    EXPECT_EQ(chunks[0].start, 0u);
    EXPECT_EQ(chunks[0].end, 2999999u);
    EXPECT_EQ(chunks[1].start, 3000000u);
    EXPECT_EQ(chunks[2].end, 8999999u);
    EXPECT_EQ(chunks[3].start, 9000000u);
    EXPECT_EQ(chunks[3].end, 9999999u);
    EXPECT_EQ(chunks[3].size, 1000000u);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, static_cast<int>(i));
        EXPECT_FALSE(chunks[i].completed);
    }
}

TEST(TransferStateTest, PlanChunksExactMultipleAndSmallInputs) {
    auto exact = PlanChunks(4096, 1024);
    ASSERT_EQ(exact.size(), 4u);
    EXPECT_EQ(exact.back().size, 1024u);

    auto single = PlanChunks(10, 1024);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].end, 9u);

    EXPECT_TRUE(PlanChunks(0, 1024).empty());
    EXPECT_THROW(PlanChunks(100, 0), ValidationError);
}

TEST(TransferStateTest, ProgressAccounting) {
    TransferState state = SampleState();
    EXPECT_EQ(state.BytesTransferred(), 0u);
    EXPECT_FALSE(state.IsComplete());

    state.chunks[1].completed = true;
    state.chunks[3].completed = true;
    state.chunks[3].etag = "abc";

    EXPECT_EQ(state.CompletedChunks(), 2u);
    EXPECT_EQ(state.BytesTransferred(), 4000000u);
    EXPECT_EQ(state.PendingChunks(), (std::vector<int>{0, 2}));

    state.ResetProgress();
    EXPECT_EQ(state.CompletedChunks(), 0u);
    EXPECT_TRUE(state.chunks[3].etag.empty());
}

TEST(TransferStateTest, ConsistencyCheck) {
    TransferState state = SampleState();
    EXPECT_TRUE(state.IsConsistent());

    TransferState missing = state;
    missing.chunks.pop_back();
    EXPECT_FALSE(missing.IsConsistent());

    TransferState gap = state;
    gap.chunks[2].start += 1;
    EXPECT_FALSE(gap.IsConsistent());

    TransferState resized = state;
    resized.total_size += 1;
    EXPECT_FALSE(resized.IsConsistent());
}

TEST(TransferStateTest, JsonRoundTripKeepsProgress) {
    TransferState state = SampleState();
    state.upload_id = "upload-42";
    state.chunks[0].completed = true;
    state.chunks[0].etag = "0cc175b9c0f1b6a831c399e269772661";
    state.chunks[0].completed_at = std::chrono::system_clock::from_time_t(1700000100);
    state.chunks[2].retry_count = 2;
    state.chunks[2].last_error = "HTTP 503";

    nlohmann::json j = state;
    EXPECT_EQ(j["identity"]["transfer_type"], "upload");
    EXPECT_EQ(j["chunks"].size(), 4u);

    TransferState decoded = j.get<TransferState>();
    EXPECT_TRUE(decoded.identity == state.identity);
    EXPECT_EQ(decoded.upload_id, "upload-42");
    EXPECT_EQ(decoded.fingerprint.mtime_ns, state.fingerprint.mtime_ns);
    EXPECT_TRUE(decoded.chunks[0].completed);
    EXPECT_EQ(decoded.chunks[0].etag, state.chunks[0].etag);
    EXPECT_EQ(decoded.chunks[0].completed_at, state.chunks[0].completed_at);
    EXPECT_EQ(decoded.chunks[2].retry_count, 2);
    EXPECT_EQ(decoded.chunks[2].last_error, "HTTP 503");
    EXPECT_EQ(decoded.created_at, state.created_at);
    EXPECT_TRUE(decoded.IsConsistent());
}

TEST(TransferStateTest, UnknownTransferTypeIsRejected) {
    nlohmann::json j = SampleState();
    j["identity"]["transfer_type"] = "sideways";
    EXPECT_THROW(j.get<TransferState>(), ValidationError);
}
