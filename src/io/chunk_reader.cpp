#include "drop/io/chunk_reader.hpp"

#include <algorithm>
#include <system_error>

namespace drop::io {
namespace fs = std::filesystem;

ChunkClaimReader::ChunkClaimReader(PrivateTag, fs::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<ChunkClaimReader>> ChunkClaimReader::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::unique_ptr<ChunkClaimReader>>(ErrorKind::IoError,
                                                      "Not a readable regular file: " + path.string());
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::unique_ptr<ChunkClaimReader>>(ErrorKind::IoError,
                                                      "Failed to get file size of " + path.string() + ": " + ec.message());
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        return Err<std::unique_ptr<ChunkClaimReader>>(ErrorKind::IoError,
                                                      "Failed to open source file: " + path.string());
    }

    return Ok(std::make_unique<ChunkClaimReader>(PrivateTag{}, path, static_cast<std::uint64_t>(size)));
}

Bytes ChunkClaimReader::claim_chunk(std::uint64_t requested_size) {
    return claim(requested_size).data;
}

ClaimedChunk ChunkClaimReader::claim(std::uint64_t requested_size) {
    if (is_finished() || requested_size == 0) {
        return {};
    }

    // Atomically claim the next range
    const std::uint64_t start = position_.fetch_add(requested_size, std::memory_order_acq_rel);
    if (start >= size_) {
        mark_finished();
        return {};
    }

    const std::uint64_t to_read = std::min(requested_size, size_ - start);

    // Independent handle per claim, never shared across threads
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        mark_finished();
        return {};
    }

    input.seekg(static_cast<std::streamoff>(start));
    if (!input) {
        mark_finished();
        return {};
    }

    Bytes buffer(static_cast<std::size_t>(to_read));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
    if (static_cast<std::uint64_t>(input.gcount()) != to_read) {
        mark_finished();
        return {};
    }

    if (start + to_read >= size_) {
        mark_finished();
    }
    return ClaimedChunk{start, std::move(buffer)};
}

std::optional<std::uint8_t> ChunkClaimReader::read_byte() {
    if (is_finished()) {
        return std::nullopt;
    }

    std::lock_guard lock(byte_mutex_);
    if (!byte_stream_) {
        byte_stream_ = std::make_unique<std::ifstream>(path_, std::ios::binary);
        if (!*byte_stream_) {
            byte_stream_.reset();
            mark_finished();
            return std::nullopt;
        }
    }

    char byte = 0;
    if (!byte_stream_->get(byte)) {
        byte_stream_.reset();
        mark_finished();
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(byte);
}

} // namespace drop::io
