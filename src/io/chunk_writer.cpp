#include "drop/io/chunk_writer.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace drop::io {
namespace fs = std::filesystem;

ChunkWriter::~ChunkWriter() {
    if (file_.is_open()) {
        discard();
    }
}

Result<void> ChunkWriter::open(const fs::path& staging_path) {
    if (file_.is_open()) {
        return Err<void>(make_error(ErrorKind::IoError, "writer already open: " + staging_path_.string()));
    }
    if (auto res = ensure_parent_exists(staging_path); res.is_error()) {
        return res;
    }

    {
        std::ofstream create(staging_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<void>(make_error(ErrorKind::IoError,
                                        "Failed to create staging file: " + staging_path.string()));
        }
    }

    file_.open(staging_path, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_) {
        return Err<void>(make_error(ErrorKind::IoError,
                                    "Failed to open staging file: " + staging_path.string()));
    }

    staging_path_ = staging_path;
    bytes_written_ = 0;
    return Ok();
}

Result<void> ChunkWriter::write_at(std::uint64_t offset, const std::uint8_t* data, std::size_t length) {
    if (!file_.is_open()) {
        return Err<void>(make_error(ErrorKind::IoError, "write to a closed staging file"));
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!file_) {
        return Err<void>(make_error(ErrorKind::IoError,
                                    "Failed to write " + std::to_string(length) + " bytes at offset " +
                                    std::to_string(offset) + " of " + staging_path_.string()));
    }

    bytes_written_ += length;
    return Ok();
}

Result<void> ChunkWriter::finalize(const fs::path& destination) {
    if (!file_.is_open()) {
        return Err<void>(make_error(ErrorKind::IoError, "finalize on a closed staging file"));
    }

    file_.flush();
    const bool flushed = static_cast<bool>(file_);
    file_.close();
    if (!flushed) {
        discard();
        return Err<void>(make_error(ErrorKind::IoError, "Failed to flush " + staging_path_.string()));
    }

    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        discard();
        return res;
    }

    std::error_code ec;
    fs::rename(staging_path_, destination, ec);
    if (ec) {
        discard();
        return Err<void>(make_error(ErrorKind::IoError,
                                    "Failed to move staging file to " + destination.string() + ": " + ec.message()));
    }
    staging_path_.clear();
    return Ok();
}

void ChunkWriter::discard() {
    if (file_.is_open()) {
        file_.close();
    }
    if (staging_path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(staging_path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", staging_path_.string(), ec.message());
    }
    staging_path_.clear();
}

Result<void> ChunkWriter::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(make_error(ErrorKind::IoError, "Failed to create directory: " + parent.string()));
    }
    return Ok();
}

} // namespace drop::io
