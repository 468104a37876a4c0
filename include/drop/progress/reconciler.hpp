#pragma once

/**
 * @file reconciler.hpp
 * @brief Folds download events into a named per-file progress table
 *
 * The transport identifies items by numeric id and content hash; users want
 * file names. The reconciler resolves one into the other through the hash
 * sequence and its metadata, keeps the table, and pushes a full Snapshot to
 * the ProgressChannel after every change.
 *
 * HOW IT WORKS:
 * 1. HashSequenceFound: load the sequence and metadata from the BlobSource
 * 2. ItemFound: hash -> first unclaimed position -> name, append a row
 * 3. Progress / ItemDone / LocalFound: update rows
 * 4. AllDone: rebuild the table from the store listing (ground truth)
 *
 * If the stream ends without AllDone, the store listing is used only when
 * every blob of the collection is present locally; otherwise the download
 * failed.
 */

#include "drop/collection/collection.hpp"
#include "drop/collection/metadata.hpp"
#include "drop/core/cancellation.hpp"
#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"
#include "drop/engine/engine.hpp"
#include "drop/progress/channel.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace drop::progress {

class ProgressReconciler {
public:
    enum class Step {
        Continue,
        Done
    };

    /**
     * @param source  Where sequence, metadata and listing are read from
     * @param collection  Hash of the collection being downloaded
     * @param channel  Snapshot sink, may be null
     */
    ProgressReconciler(const engine::BlobSource& source, const Hash& collection, ProgressChannel* channel);

    /**
     * @brief Apply one event
     *
     * Returns Done after AllDone. Errors are fatal for the download.
     */
    Result<Step> apply(const engine::DownloadEvent& event);

    /**
     * @brief Resolve the final listing when the stream ended without AllDone
     */
    Result<collection::Collection> finish_without_all_done();

    /**
     * @brief Drive a stream to completion
     *
     * Waits up to poll_interval per next() call, checking token before every
     * wait and after every event. Cancellation closes the stream and
     * returns Cancelled.
     */
    Result<collection::Collection> run(engine::EventStream& stream,
                                       const CancellationToken& token,
                                       std::chrono::milliseconds poll_interval);

    const Snapshot& files() const noexcept { return files_; }

    /// Authoritative listing, filled once the download has ended successfully
    const collection::Collection& listing() const noexcept { return listing_; }

    std::size_t snapshots_emitted() const noexcept { return snapshots_emitted_; }

private:
    Result<Step> handle(const engine::Connected& event);
    Result<Step> handle(const engine::HashSequenceFound& event);
    Result<Step> handle(const engine::ItemFound& event);
    Result<Step> handle(const engine::Progress& event);
    Result<Step> handle(const engine::ItemDone& event);
    Result<Step> handle(const engine::LocalFound& event);
    Result<Step> handle(const engine::AllDone& event);

    Result<void> adopt_listing();
    void emit();

    const engine::BlobSource& source_;
    Hash collection_;
    ProgressChannel* channel_;

    std::optional<collection::HashSequence> hash_sequence_;
    std::optional<collection::CollectionMetadata> metadata_;

    Snapshot files_;
    std::vector<std::size_t> positions_;                     ///< Sequence position of each row
    std::vector<bool> claimed_;                              ///< Per sequence position
    std::unordered_map<std::uint64_t, std::size_t> id_to_row_;

    collection::Collection listing_;
    std::size_t snapshots_emitted_ = 0;
    bool send_failure_logged_ = false;
};

} // namespace drop::progress
