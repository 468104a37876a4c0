#pragma once

#include "drop/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace drop::io {

/**
 * @brief Lands arriving byte ranges in a partially written staging file
 *
 * Ranges may arrive in any order; each is written at its own offset. The
 * staging file only becomes visible at its destination through finalize().
 * A writer destroyed without finalize() removes its staging file.
 */
class ChunkWriter {
public:
    ChunkWriter() = default;
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    /**
     * @brief Create (or truncate) the staging file, creating parent directories
     */
    Result<void> open(const std::filesystem::path& staging_path);

    Result<void> write_at(std::uint64_t offset, const std::uint8_t* data, std::size_t length);

    /**
     * @brief Flush, close and rename the staging file to destination
     */
    Result<void> finalize(const std::filesystem::path& destination);

    /**
     * @brief Close and delete the staging file
     */
    void discard();

    bool is_open() const noexcept { return file_.is_open(); }
    std::uint64_t bytes_written() const noexcept { return bytes_written_; }
    const std::filesystem::path& staging_path() const noexcept { return staging_path_; }

    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

private:
    std::filesystem::path staging_path_;
    std::fstream file_;
    std::uint64_t bytes_written_ = 0;
};

} // namespace drop::io
