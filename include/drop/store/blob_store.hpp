#pragma once

/**
 * @file blob_store.hpp
 * @brief Content-addressed blob storage behind LocalEngine
 *
 * Blobs are keyed by their Hash and live in one of two places:
 * - inline: small structural blobs (hash sequences, metadata records) kept
 *   as bytes in memory
 * - file-backed: imported files stay where they are and are referenced by
 *   path; received files are written under <root>/blobs/<hex>
 *
 * Partially received blobs are staged under <root>/partial/ and only
 * registered once finalized and verified, so contains() never reports a
 * blob that is still arriving.
 *
 * THREAD SAFETY PATTERN:
 * - Lookups take a shared_lock (provider workers and fetcher read concurrently)
 * - Insertions take a unique_lock
 */

#include "drop/collection/collection.hpp"
#include "drop/core/bytes.hpp"
#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace drop::store {

struct BlobEntry {
    std::uint64_t size = 0;
    std::optional<Bytes> inline_data;   ///< Set for in-memory blobs
    std::filesystem::path file;         ///< Set for file-backed blobs

    bool is_inline() const noexcept { return inline_data.has_value(); }
};

class BlobStore {
public:
    /**
     * @brief Store rooted at root (blobs/ and partial/ are created lazily)
     */
    explicit BlobStore(std::filesystem::path root);

    BlobStore(const BlobStore&) = delete;
    BlobStore& operator=(const BlobStore&) = delete;

    /**
     * @brief Hash a local file and register it by reference
     *
     * The file is read sequentially through a ChunkClaimReader in
     * chunk_size pieces. Fails with ImportError if it cannot be opened or is
     * shorter than its reported length.
     */
    Result<Hash> import_file(const std::filesystem::path& path, std::size_t chunk_size);

    /**
     * @brief Register an in-memory blob, returning its hash
     */
    Hash insert_bytes(Bytes data);

    /**
     * @brief Register a verified file already stored at path
     */
    void insert_file(const Hash& hash, const std::filesystem::path& path, std::uint64_t size);

    bool contains(const Hash& hash) const;

    std::optional<BlobEntry> entry(const Hash& hash) const;

    std::optional<std::uint64_t> size_of(const Hash& hash) const;

    /**
     * @brief Whole blob as bytes; DownloadError if absent or unreadable
     */
    Result<Bytes> read_to_bytes(const Hash& hash) const;

    /**
     * @brief Resolve a hash-sequence blob into named, sized entries
     *
     * Reads the sequence, decodes the metadata at position 0 and checks its
     * name count. Every file blob must be present locally; a missing one
     * fails with DownloadError naming the file.
     */
    Result<collection::Collection> get_collection(const Hash& hash) const;

    /**
     * @brief Copy a blob to destination, replacing any existing file
     */
    Result<void> export_blob(const Hash& hash, const std::filesystem::path& destination) const;

    /**
     * @brief Final location for a received blob
     */
    std::filesystem::path blob_path(const Hash& hash) const;

    /**
     * @brief Unique staging location for a blob being received
     */
    std::filesystem::path partial_path(const Hash& hash);

    const std::filesystem::path& root() const noexcept { return root_; }

    std::size_t blob_count() const;

private:
    std::filesystem::path root_;

    std::unordered_map<Hash, BlobEntry> blobs_;
    mutable std::shared_mutex mutex_;

    std::atomic<std::uint64_t> partial_counter_{0};
};

} // namespace drop::store
