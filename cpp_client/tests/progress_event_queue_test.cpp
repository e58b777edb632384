#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "progress_sink.hpp"

using std::chrono_literals::operator""ms;

TEST(ProgressEventQueueTest, KeepsEventOrder) {
    ProgressEventQueue queue;
    queue.OnChunkStart(0, 100);
    queue.OnChunkProgress(0, 40);
    queue.OnChunkError(0, "HTTP 503", 1);
    queue.OnChunkComplete(0, "etag-0");

    auto events = queue.Drain();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, ProgressEvent::Type::ChunkStart);
    EXPECT_EQ(events[0].bytes, 100u);
    EXPECT_EQ(events[1].bytes, 40u);
    EXPECT_EQ(events[2].detail, "HTTP 503");
    EXPECT_EQ(events[2].attempt, 1);
    EXPECT_EQ(events[3].detail, "etag-0");
    EXPECT_EQ(queue.Size(), 0u);
}

TEST(ProgressEventQueueTest, TransferCompleteCarriesSummary) {
    ProgressEventQueue queue;
    TransferResult result;
    result.success = true;
    result.bytes_transferred = 4096;
    result.message = "upload completed";
    queue.OnTransferComplete(result);

    auto event = queue.WaitPop(10ms);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, ProgressEvent::Type::TransferComplete);
    EXPECT_EQ(event->bytes, 4096u);
    EXPECT_TRUE(event->summary.success);
    EXPECT_STREQ(ProgressEventTypeName(event->type), "transfer_complete");
}

TEST(ProgressEventQueueTest, WaitPopTimesOut) {
    ProgressEventQueue queue;
    EXPECT_FALSE(queue.WaitPop(5ms).has_value());
}

TEST(ProgressEventQueueTest, WaitPopWakesForProducer) {
    ProgressEventQueue queue;
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.OnChunkComplete(3, "tag");
    });
    auto event = queue.WaitPop(std::chrono::milliseconds(5000));
    producer.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->chunk_index, 3);
}

TEST(ProgressEventQueueTest, CloseDropsLaterEvents) {
    ProgressEventQueue queue;
    queue.OnChunkStart(0, 1);
    queue.Close();
    queue.OnChunkStart(1, 1);

    EXPECT_TRUE(queue.IsClosed());
    auto first = queue.WaitPop(5ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->chunk_index, 0);
    EXPECT_FALSE(queue.WaitPop(5ms).has_value());
}
