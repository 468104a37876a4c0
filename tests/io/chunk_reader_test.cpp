#include "drop/io/chunk_reader.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using drop::Bytes;
using drop::io::ChunkClaimReader;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("drop_chunk_reader_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

fs::path write_pattern_file(const fs::path& dir, const std::string& name, std::size_t size) {
    const fs::path path = dir / name;
    std::ofstream out(path, std::ios::binary);
    for (std::size_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(i % 251));
    }
    return path;
}

} // namespace

TEST(ChunkClaimReaderTest, OpenMissingFileFailsWithIoError) {
    auto reader = ChunkClaimReader::open("/nonexistent/drop/file.bin");
    ASSERT_TRUE(reader.is_error());
    EXPECT_EQ(reader.error().kind, drop::ErrorKind::IoError);
}

TEST(ChunkClaimReaderTest, SequentialClaimsCoverTheFileInOrder) {
    const auto dir = create_temp_dir();
    const auto path = write_pattern_file(dir, "data.bin", 1000);

    auto opened = ChunkClaimReader::open(path);
    ASSERT_TRUE(opened.is_ok());
    auto& reader = *opened.value();
    EXPECT_EQ(reader.len(), 1000u);

    std::vector<std::size_t> sizes;
    Bytes all;
    while (true) {
        auto chunk = reader.claim_chunk(300);
        if (chunk.empty()) {
            break;
        }
        sizes.push_back(chunk.size());
        all.insert(all.end(), chunk.begin(), chunk.end());
    }

    EXPECT_EQ(sizes, (std::vector<std::size_t>{300, 300, 300, 100}));
    ASSERT_EQ(all.size(), 1000u);
    for (std::size_t i = 0; i < all.size(); ++i) {
        ASSERT_EQ(all[i], static_cast<std::uint8_t>(i % 251));
    }
    EXPECT_TRUE(reader.is_finished());

    fs::remove_all(dir);
}

TEST(ChunkClaimReaderTest, StaysEmptyOnceExhausted) {
    const auto dir = create_temp_dir();
    const auto path = write_pattern_file(dir, "small.bin", 10);

    auto reader = std::move(ChunkClaimReader::open(path).value());
    EXPECT_EQ(reader->claim_chunk(64).size(), 10u);
    EXPECT_TRUE(reader->claim_chunk(64).empty());
    EXPECT_TRUE(reader->claim_chunk(1).empty());
    EXPECT_FALSE(reader->read_byte().has_value());

    fs::remove_all(dir);
}

TEST(ChunkClaimReaderTest, EmptyFileYieldsNothing) {
    const auto dir = create_temp_dir();
    const auto path = write_pattern_file(dir, "empty.bin", 0);

    auto reader = std::move(ChunkClaimReader::open(path).value());
    EXPECT_EQ(reader->len(), 0u);
    EXPECT_TRUE(reader->claim_chunk(16).empty());
    EXPECT_TRUE(reader->is_finished());

    fs::remove_all(dir);
}

TEST(ChunkClaimReaderTest, ConcurrentClaimsAreDisjointAndComplete) {
    const auto dir = create_temp_dir();
    const std::size_t size = 256 * 1024 + 17;
    const auto path = write_pattern_file(dir, "large.bin", size);

    auto reader = std::move(ChunkClaimReader::open(path).value());

    std::mutex mutex;
    std::set<std::uint64_t> offsets;
    std::atomic<std::uint64_t> total{0};
    std::atomic<bool> content_ok{true};

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&]() {
            while (true) {
                auto chunk = reader->claim(4096);
                if (chunk.data.empty()) {
                    break;
                }
                for (std::size_t j = 0; j < chunk.data.size(); ++j) {
                    if (chunk.data[j] != static_cast<std::uint8_t>((chunk.offset + j) % 251)) {
                        content_ok = false;
                    }
                }
                total += chunk.data.size();
                std::lock_guard lock(mutex);
                EXPECT_TRUE(offsets.insert(chunk.offset).second);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(total.load(), size);
    EXPECT_TRUE(content_ok.load());
    EXPECT_EQ(offsets.size(), (size + 4095) / 4096);

    fs::remove_all(dir);
}

TEST(ChunkClaimReaderTest, ReadByteStreamsTheFile) {
    const auto dir = create_temp_dir();
    const auto path = write_pattern_file(dir, "bytes.bin", 5);

    auto reader = std::move(ChunkClaimReader::open(path).value());
    for (std::uint8_t expected = 0; expected < 5; ++expected) {
        auto byte = reader->read_byte();
        ASSERT_TRUE(byte.has_value());
        EXPECT_EQ(*byte, expected);
    }
    EXPECT_FALSE(reader->read_byte().has_value());
    EXPECT_TRUE(reader->claim_chunk(4).empty());

    fs::remove_all(dir);
}
