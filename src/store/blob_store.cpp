#include "drop/store/blob_store.hpp"

#include "drop/collection/metadata.hpp"
#include "drop/io/chunk_reader.hpp"
#include "drop/io/chunk_writer.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <mutex>
#include <system_error>

namespace drop::store {
namespace fs = std::filesystem;

BlobStore::BlobStore(fs::path root) : root_(std::move(root)) {}

Result<Hash> BlobStore::import_file(const fs::path& path, std::size_t chunk_size) {
    auto reader = io::ChunkClaimReader::open(path);
    if (reader.is_error()) {
        return Err<Hash>(ErrorKind::ImportError, reader.error().message);
    }

    Hasher hasher;
    std::uint64_t total = 0;
    while (true) {
        auto chunk = reader.value()->claim_chunk(chunk_size);
        if (chunk.empty()) {
            break;
        }
        hasher.update(chunk);
        total += chunk.size();
    }

    const std::uint64_t expected = reader.value()->len();
    if (total != expected) {
        return Err<Hash>(ErrorKind::ImportError,
                         "Read " + std::to_string(total) + " of " + std::to_string(expected) +
                         " bytes from " + path.string());
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    const Hash hash = hasher.finish();
    {
        std::unique_lock lock(mutex_);
        auto& entry = blobs_[hash];
        if (entry.file.empty() && !entry.is_inline()) {
            entry.size = expected;
            entry.file = std::move(absolute);
        }
    }

    spdlog::debug("[Store] Imported {} ({} bytes) as {}", path.string(), expected, hash.to_hex());
    return Ok(hash);
}

Hash BlobStore::insert_bytes(Bytes data) {
    const Hash hash = hash_bytes(data);

    std::unique_lock lock(mutex_);
    auto& entry = blobs_[hash];
    entry.size = data.size();
    entry.file.clear();
    entry.inline_data = std::move(data);
    return hash;
}

void BlobStore::insert_file(const Hash& hash, const fs::path& path, std::uint64_t size) {
    std::unique_lock lock(mutex_);
    auto& entry = blobs_[hash];
    if (entry.is_inline()) {
        return;
    }
    entry.size = size;
    entry.file = path;
}

bool BlobStore::contains(const Hash& hash) const {
    std::shared_lock lock(mutex_);
    return blobs_.find(hash) != blobs_.end();
}

std::optional<BlobEntry> BlobStore::entry(const Hash& hash) const {
    std::shared_lock lock(mutex_);
    auto it = blobs_.find(hash);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> BlobStore::size_of(const Hash& hash) const {
    std::shared_lock lock(mutex_);
    auto it = blobs_.find(hash);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second.size;
}

Result<Bytes> BlobStore::read_to_bytes(const Hash& hash) const {
    auto found = entry(hash);
    if (!found) {
        return Err<Bytes>(ErrorKind::DownloadError, "Blob not found: " + hash.to_hex());
    }
    if (found->is_inline()) {
        return Ok(std::move(*found->inline_data));
    }

    std::ifstream input(found->file, std::ios::binary);
    if (!input) {
        return Err<Bytes>(ErrorKind::DownloadError, "Failed to open blob file: " + found->file.string());
    }
    Bytes data(static_cast<std::size_t>(found->size));
    input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::uint64_t>(input.gcount()) != found->size) {
        return Err<Bytes>(ErrorKind::DownloadError, "Short read from blob file: " + found->file.string());
    }
    return Ok(std::move(data));
}

Result<collection::Collection> BlobStore::get_collection(const Hash& hash) const {
    auto raw_sequence = read_to_bytes(hash);
    if (raw_sequence.is_error()) {
        return Err<collection::Collection>(raw_sequence.error());
    }
    auto sequence = collection::decode_hash_sequence(raw_sequence.value());
    if (sequence.is_error()) {
        return Err<collection::Collection>(sequence.error());
    }

    const auto& hashes = sequence.value();
    auto raw_metadata = read_to_bytes(hashes.front());
    if (raw_metadata.is_error()) {
        return Err<collection::Collection>(raw_metadata.error());
    }
    auto metadata = collection::CollectionMetadata::from_bytes(raw_metadata.value());
    if (metadata.is_error()) {
        return Err<collection::Collection>(metadata.error());
    }
    if (auto check = metadata.value().validate_against_hash_sequence_length(hashes.size()); check.is_error()) {
        return Err<collection::Collection>(check.error());
    }

    collection::Collection result;
    result.reserve(metadata.value().file_count());
    const auto& names = metadata.value().names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        const Hash& file_hash = hashes[i + 1];
        auto size = size_of(file_hash);
        if (!size) {
            return Err<collection::Collection>(ErrorKind::DownloadError,
                                               "Blob of " + names[i] + " (" + file_hash.to_hex() +
                                               ") is not present locally");
        }
        result.push_back(collection::CollectionEntry{names[i], file_hash, *size});
    }
    return Ok(std::move(result));
}

Result<void> BlobStore::export_blob(const Hash& hash, const fs::path& destination) const {
    auto found = entry(hash);
    if (!found) {
        return Err<void>(make_error(ErrorKind::IoError, "Cannot export missing blob " + hash.to_hex()));
    }
    if (auto res = io::ChunkWriter::ensure_parent_exists(destination); res.is_error()) {
        return res;
    }

    if (found->is_inline()) {
        std::ofstream output(destination, std::ios::binary | std::ios::trunc);
        output.write(reinterpret_cast<const char*>(found->inline_data->data()),
                     static_cast<std::streamsize>(found->inline_data->size()));
        if (!output) {
            return Err<void>(make_error(ErrorKind::IoError, "Failed to write " + destination.string()));
        }
        return Ok();
    }

    std::error_code ec;
    fs::copy_file(found->file, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<void>(make_error(ErrorKind::IoError,
                                    "Failed to export " + hash.to_hex() + " to " + destination.string() +
                                    ": " + ec.message()));
    }
    return Ok();
}

fs::path BlobStore::blob_path(const Hash& hash) const {
    return root_ / "blobs" / hash.to_hex();
}

fs::path BlobStore::partial_path(const Hash& hash) {
    const auto n = partial_counter_.fetch_add(1, std::memory_order_relaxed);
    return root_ / "partial" / (hash.to_hex() + "." + std::to_string(n));
}

std::size_t BlobStore::blob_count() const {
    std::shared_lock lock(mutex_);
    return blobs_.size();
}

} // namespace drop::store
