#pragma once

/**
 * @file engine.hpp
 * @brief Seams between the transfer core and the content-addressed engine
 *
 * BlobSource is everything the progress reconciler needs: read a blob, list
 * a collection, check local presence. TransferEngine adds ingestion,
 * sharing and downloading. LocalEngine (local_engine.hpp) is the shipped
 * implementation; tests substitute their own.
 */

#include "drop/collection/collection.hpp"
#include "drop/core/bytes.hpp"
#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"
#include "drop/engine/download_event.hpp"
#include "drop/transport/locator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace drop::engine {

class BlobSource {
public:
    virtual ~BlobSource() = default;

    virtual Result<Bytes> read_to_bytes(const Hash& hash) const = 0;

    /**
     * @brief Resolve a hash sequence into its ordered {name, hash, size} list
     */
    virtual Result<collection::Collection> get_collection(const Hash& hash) const = 0;

    /**
     * @brief True if the complete blob is present locally
     */
    virtual bool has_blob(const Hash& hash) const = 0;
};

/**
 * @brief Ordered stream of download events
 *
 * next() waits up to `wait` for the next event. An empty optional means
 * either a timeout or the end of the stream; finished() tells them apart
 * and becomes true only once every produced event has been consumed.
 * Transport failures surface as DownloadError from next().
 */
class EventStream {
public:
    virtual ~EventStream() = default;

    virtual Result<std::optional<DownloadEvent>> next(std::chrono::milliseconds wait) = 0;

    virtual bool finished() const = 0;

    /**
     * @brief Stop producing events and release the connection
     *
     * Idempotent. Does not wait for an in-flight network read to return.
     */
    virtual void close() = 0;
};

class TransferEngine : public BlobSource {
public:
    /**
     * @brief Ingest a local file, returning its content hash
     */
    virtual Result<Hash> import(const std::filesystem::path& path) = 0;

    /**
     * @brief Store metadata + hash sequence for the ordered (name, hash) pairs
     *
     * Returns the hash of the hash-sequence blob (the collection hash).
     */
    virtual Result<Hash> create_collection(const std::vector<std::pair<std::string, Hash>>& entries) = 0;

    /**
     * @brief Make a collection downloadable; returns the locator for tickets
     */
    virtual Result<std::string> share(const Hash& collection_hash, std::uint8_t confirmation) = 0;

    /**
     * @brief Refuse new requests for a collection and abort in-flight serving
     */
    virtual void unshare(const Hash& collection_hash) = 0;

    virtual Result<std::unique_ptr<EventStream>> download_hash_sequence(const Hash& collection_hash,
                                                                        const transport::PeerLocator& peer,
                                                                        std::uint8_t confirmation) = 0;

    /**
     * @brief Write a complete local blob to destination
     */
    virtual Result<void> export_blob(const Hash& hash, const std::filesystem::path& destination) = 0;
};

} // namespace drop::engine
