#include <gtest/gtest.h>
#include <terminal/history_buffer.hpp>
#include <core/log.hpp>
#include <atomic>
#include <thread>

class HistoryBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_enabled(false);
    }

    HistoryBuffer history;
};

TEST_F(HistoryBufferTest, StartsEmpty) {
    EXPECT_EQ(history.size(), 0u);
    EXPECT_EQ(history.byte_count(), 0u);
    EXPECT_TRUE(history.replay().empty());
    EXPECT_FALSE(history.last_prompt_offset().has_value());
}

TEST_F(HistoryBufferTest, SequenceAndOffsets) {
    EXPECT_EQ(history.append("[a@b ~]$ ", 0u), 0u);
    EXPECT_EQ(history.append("ls\r\n"), 1u);
    EXPECT_EQ(history.append("x\r\n[a@b ~]$ ", 16u), 2u);

    auto chunks = history.replay();
    ASSERT_EQ(chunks.size(), 3u);
    for (std::size_t i = 0; i < chunks.size(); i++) {
        EXPECT_EQ(chunks[i].sequence, i);
    }
    EXPECT_EQ(chunks[0].offset, 0u);
    EXPECT_EQ(chunks[1].offset, 9u);
    EXPECT_EQ(chunks[2].offset, 13u);
    EXPECT_TRUE(chunks[0].prompt_boundary);
    EXPECT_FALSE(chunks[1].prompt_boundary);
    EXPECT_TRUE(chunks[2].prompt_boundary);
    EXPECT_EQ(chunks[2].prompt_offset, 16u);
    EXPECT_EQ(history.byte_count(), 25u);
}

TEST_F(HistoryBufferTest, EmptyAppendIgnored) {
    EXPECT_FALSE(history.append("").has_value());
    EXPECT_EQ(history.size(), 0u);
}

TEST_F(HistoryBufferTest, BytesKeptVerbatim) {
    history.append("a\r\n");
    history.append("b\r\r\n\x1b[0m");
    EXPECT_EQ(history.concatenated(), "a\r\nb\r\r\n\x1b[0m");
}

TEST_F(HistoryBufferTest, RepeatedBoundaryNotRecorded) {
    history.append("[a@b ~]$ ", 0u);
    history.append("[a@b ~]$ ", 0u);
    auto chunks = history.replay();
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_TRUE(chunks[0].prompt_boundary);
    EXPECT_FALSE(chunks[1].prompt_boundary);
    EXPECT_EQ(history.last_prompt_offset(), 0u);
}

TEST_F(HistoryBufferTest, ReplayFrom) {
    for (int i = 0; i < 5; i++) history.append(std::to_string(i));
    auto tail = history.replay_from(3);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].sequence, 3u);
    EXPECT_EQ(tail[1].data, "4");
    EXPECT_TRUE(history.replay_from(5).empty());
}

TEST_F(HistoryBufferTest, ListenersRunBeforeAppendReturns) {
    std::vector<uint64_t> seen;
    history.add_listener([&](const OutputChunk& c) { seen.push_back(c.sequence); });

    history.append("one");
    ASSERT_EQ(seen.size(), 1u);
    history.append("two");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], 1u);
}

TEST_F(HistoryBufferTest, RemovedListenerStopsReceiving) {
    int calls = 0;
    auto id = history.add_listener([&](const OutputChunk&) { calls++; });
    history.append("a");
    history.remove_listener(id);
    history.append("b");
    EXPECT_EQ(calls, 1);
}

TEST_F(HistoryBufferTest, ConcurrentAppendsStayGapFree) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([this] {
            for (int i = 0; i < 250; i++) history.append("x");
        });
    }
    for (auto& w : writers) w.join();

    auto chunks = history.replay();
    ASSERT_EQ(chunks.size(), 1000u);
    for (std::size_t i = 0; i < chunks.size(); i++) {
        EXPECT_EQ(chunks[i].sequence, i);
        EXPECT_EQ(chunks[i].offset, i);
    }
}
