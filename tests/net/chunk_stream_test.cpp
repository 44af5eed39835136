#include "dsync/net/chunk_stream.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using dsync::ErrorKind;
using dsync::Outcome;
using dsync::ProgressEvent;
using dsync::net::stream_file_chunks;

class ChunkStreamTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = dsync::testing::create_temp_dir("dsync_chunk_stream_test"); }
    void TearDown() override { dsync::testing::remove_temp_dir(root_); }

    fs::path make_file(const std::string& name, std::size_t size) {
        std::string content;
        content.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            content.push_back(static_cast<char>('a' + i % 26));
        }
        dsync::testing::write_file(root_ / name, content);
        return root_ / name;
    }

    fs::path root_;
};

TEST_F(ChunkStreamTest, DeliversWholeFileInOrder) {
    const fs::path file = make_file("payload.bin", 20000);
    std::string received;
    std::vector<ProgressEvent> progress;

    auto sent = stream_file_chunks(
        file, 8192,
        [&](const char* data, std::size_t size) -> Outcome<void> {
            received.append(data, size);
            return dsync::succeed();
        },
        [&](const ProgressEvent& e) { progress.push_back(e); },
        dsync::CancellationToken{});

    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.value(), 20000u);
    EXPECT_EQ(received, dsync::testing::read_file(file));

    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress[0].bytes_sent, 8192u);
    EXPECT_EQ(progress[1].bytes_sent, 16384u);
    EXPECT_EQ(progress[2].bytes_sent, 20000u);
    for (const auto& e : progress) {
        EXPECT_EQ(e.total_bytes, 20000u);
    }
    EXPECT_DOUBLE_EQ(progress.back().fraction(), 1.0);
}

TEST_F(ChunkStreamTest, ProgressOnlyCoversCompletedWrites) {
    const fs::path file = make_file("payload.bin", 10000);
    std::uint64_t written = 0;
    std::vector<std::uint64_t> reported;

    auto sent = stream_file_chunks(
        file, 4096,
        [&](const char*, std::size_t size) -> Outcome<void> {
            if (written >= 4096) {
                return dsync::fail(ErrorKind::UploadError, "write rejected");
            }
            written += size;
            return dsync::succeed();
        },
        [&](const ProgressEvent& e) {
            EXPECT_LE(e.bytes_sent, written);
            reported.push_back(e.bytes_sent);
        },
        dsync::CancellationToken{});

    ASSERT_TRUE(sent.is_error());
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], 4096u);
}

TEST_F(ChunkStreamTest, EmptyFileSendsNothing) {
    const fs::path file = make_file("empty.bin", 0);
    int writes = 0;
    int events = 0;

    auto sent = stream_file_chunks(
        file, 4096,
        [&](const char*, std::size_t) -> Outcome<void> { ++writes; return dsync::succeed(); },
        [&](const ProgressEvent&) { ++events; },
        dsync::CancellationToken{});

    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.value(), 0u);
    EXPECT_EQ(writes, 0);
    EXPECT_EQ(events, 0);
}

TEST_F(ChunkStreamTest, WriterErrorStopsTheStream) {
    const fs::path file = make_file("payload.bin", 10000);
    int writes = 0;

    auto sent = stream_file_chunks(
        file, 1000,
        [&](const char*, std::size_t) -> Outcome<void> {
            if (++writes == 3) {
                return dsync::fail(ErrorKind::UploadError, "SFTP write failed");
            }
            return dsync::succeed();
        },
        {}, dsync::CancellationToken{});

    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::UploadError);
    EXPECT_TRUE(sent.error().transient);
    EXPECT_EQ(writes, 3);
}

TEST_F(ChunkStreamTest, CancellationIsObservedBetweenChunks) {
    const fs::path file = make_file("payload.bin", 10000);
    dsync::CancellationToken cancel;
    int writes = 0;

    auto sent = stream_file_chunks(
        file, 1000,
        [&](const char*, std::size_t) -> Outcome<void> { ++writes; return dsync::succeed(); },
        [&](const ProgressEvent& e) {
            if (e.bytes_sent >= 2000) {
                cancel.cancel();
            }
        },
        cancel);

    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(writes, 2);
}

TEST_F(ChunkStreamTest, MissingSourceIsPermanentUploadError) {
    auto sent = stream_file_chunks(
        root_ / "missing.bin", 1000,
        [](const char*, std::size_t) -> Outcome<void> { return dsync::succeed(); },
        {}, dsync::CancellationToken{});

    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind, ErrorKind::UploadError);
    EXPECT_FALSE(sent.error().transient);
}
