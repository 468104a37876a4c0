#pragma once

#include "drop/core/bytes.hpp"
#include "drop/core/result.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>

namespace drop::io {

/**
 * @brief A claimed range: where it starts and what it holds
 */
struct ClaimedChunk {
    std::uint64_t offset = 0;
    Bytes data;   ///< Empty once the reader is finished
};

/**
 * @brief Lets many workers pull successive, disjoint byte ranges of one file
 *
 * claim_chunk() reserves the next range with a single fetch-and-add on the
 * shared position counter, then reads it through its own file handle, so
 * concurrent callers never share a handle or a lock. read_byte() is a
 * sequential alternative for stream-style consumers.
 *
 * Both modes share one finished flag. Once set (end of file, or any I/O
 * error) it is never cleared and every later call returns no data: callers
 * observe end-of-data, not an error.
 */
class ChunkClaimReader {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Open a reader over a regular file
     *
     * The length is read eagerly; an unreadable path fails with IoError.
     */
    static Result<std::unique_ptr<ChunkClaimReader>> open(const std::filesystem::path& path);

    ChunkClaimReader(PrivateTag, std::filesystem::path path, std::uint64_t size);

    ChunkClaimReader(const ChunkClaimReader&) = delete;
    ChunkClaimReader& operator=(const ChunkClaimReader&) = delete;

    /**
     * @brief Reserve and read the next requested_size bytes
     *
     * Returns at most requested_size bytes; empty once the file is
     * exhausted or after an I/O error.
     *
     * THREAD SAFE: Yes
     */
    Bytes claim_chunk(std::uint64_t requested_size);

    /**
     * @brief Same as claim_chunk() but also reports the claimed offset
     *
     * Used when ranges are forwarded out of order and the consumer has to
     * place each one itself.
     */
    ClaimedChunk claim(std::uint64_t requested_size);

    /**
     * @brief Read one byte through a lazily opened shared handle
     *
     * nullopt at end of file or on error.
     */
    std::optional<std::uint8_t> read_byte();

    std::uint64_t len() const noexcept { return size_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    bool is_finished() const noexcept { return finished_.load(std::memory_order_acquire); }

private:
    void mark_finished() noexcept { finished_.store(true, std::memory_order_release); }

    std::filesystem::path path_;
    std::uint64_t size_ = 0;
    std::atomic<std::uint64_t> position_{0};
    std::atomic<bool> finished_{false};

    std::mutex byte_mutex_;
    std::unique_ptr<std::ifstream> byte_stream_;  ///< Only touched by read_byte()
};

} // namespace drop::io
