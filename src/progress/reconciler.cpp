#include "drop/progress/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace drop::progress {

using Step = ProgressReconciler::Step;

ProgressReconciler::ProgressReconciler(const engine::BlobSource& source, const Hash& collection,
                                       ProgressChannel* channel)
    : source_(source)
    , collection_(collection)
    , channel_(channel) {}

Result<Step> ProgressReconciler::apply(const engine::DownloadEvent& event) {
    return std::visit([this](const auto& e) { return handle(e); }, event);
}

Result<Step> ProgressReconciler::handle(const engine::Connected& event) {
    spdlog::debug("[Receive] Connected to {}", event.remote);
    return Ok(Step::Continue);
}

Result<Step> ProgressReconciler::handle(const engine::HashSequenceFound& event) {
    auto raw_sequence = source_.read_to_bytes(event.hash);
    if (raw_sequence.is_error()) {
        return Err<Step>(ErrorKind::DownloadError, raw_sequence.error().message);
    }
    auto sequence = collection::decode_hash_sequence(raw_sequence.value());
    if (sequence.is_error()) {
        return Err<Step>(sequence.error());
    }

    auto raw_metadata = source_.read_to_bytes(sequence.value().front());
    if (raw_metadata.is_error()) {
        return Err<Step>(ErrorKind::DownloadError, raw_metadata.error().message);
    }
    auto metadata = collection::CollectionMetadata::from_bytes(raw_metadata.value());
    if (metadata.is_error()) {
        return Err<Step>(metadata.error());
    }
    if (auto check = metadata.value().validate_against_hash_sequence_length(sequence.value().size());
        check.is_error()) {
        return Err<Step>(check.error());
    }

    claimed_.assign(sequence.value().size(), false);
    hash_sequence_ = std::move(sequence.value());
    metadata_ = std::move(metadata.value());

    spdlog::debug("[Receive] Collection {} lists {} files", event.hash.to_hex(), metadata_->file_count());
    return Ok(Step::Continue);
}

Result<Step> ProgressReconciler::handle(const engine::ItemFound& event) {
    if (!hash_sequence_ || !metadata_) {
        return Err<Step>(ErrorKind::DownloadError,
                         "Item " + std::to_string(event.id) + " announced before the hash sequence");
    }

    if (auto known = id_to_row_.find(event.id); known != id_to_row_.end()) {
        const std::size_t row = known->second;
        if ((*hash_sequence_)[positions_[row]] != event.hash) {
            return Err<Step>(ErrorKind::DownloadError,
                             "Item id " + std::to_string(event.id) + " reused for different content");
        }
        files_[row].total = event.size;
        files_[row].transferred = std::min(files_[row].transferred, event.size);
        emit();
        return Ok(Step::Continue);
    }

    const auto& sequence = *hash_sequence_;
    const auto first = std::find(sequence.begin(), sequence.end(), event.hash);
    if (first == sequence.end()) {
        return Err<Step>(ErrorKind::DownloadError,
                         "Item " + event.hash.to_hex() + " is not part of collection " + collection_.to_hex());
    }

    // Metadata blob travels as an item on some transports
    if (first == sequence.begin() && std::count(sequence.begin(), sequence.end(), event.hash) == 1) {
        return Ok(Step::Continue);
    }

    std::optional<std::size_t> position;
    for (std::size_t p = 1; p < sequence.size(); ++p) {
        if (sequence[p] == event.hash && !claimed_[p]) {
            position = p;
            break;
        }
    }
    if (!position) {
        return Err<Step>(ErrorKind::DownloadError,
                         "More items than collection entries for " + event.hash.to_hex());
    }

    claimed_[*position] = true;
    id_to_row_[event.id] = files_.size();
    positions_.push_back(*position);
    files_.push_back(FileTransfer{metadata_->names()[*position - 1], 0, event.size});

    emit();
    return Ok(Step::Continue);
}

Result<Step> ProgressReconciler::handle(const engine::Progress& event) {
    if (auto it = id_to_row_.find(event.id); it != id_to_row_.end()) {
        auto& file = files_[it->second];
        file.transferred = std::max(file.transferred, std::min(event.offset, file.total));
    }
    emit();
    return Ok(Step::Continue);
}

Result<Step> ProgressReconciler::handle(const engine::ItemDone& event) {
    if (auto it = id_to_row_.find(event.id); it != id_to_row_.end()) {
        auto& file = files_[it->second];
        file.transferred = file.total;
    }
    emit();
    return Ok(Step::Continue);
}

Result<Step> ProgressReconciler::handle(const engine::LocalFound& event) {
    if (hash_sequence_) {
        for (std::size_t row = 0; row < files_.size(); ++row) {
            if ((*hash_sequence_)[positions_[row]] == event.hash) {
                files_[row].total = event.size;
                files_[row].transferred = event.size;
            }
        }
    }
    emit();
    return Ok(Step::Continue);
}

Result<Step> ProgressReconciler::handle(const engine::AllDone& event) {
    if (auto res = adopt_listing(); res.is_error()) {
        return Err<Step>(res.error());
    }
    spdlog::debug("[Receive] All blobs received: {} bytes in {} ms", event.bytes_read, event.elapsed.count());
    return Ok(Step::Done);
}

Result<void> ProgressReconciler::adopt_listing() {
    auto listing = source_.get_collection(collection_);
    if (listing.is_error()) {
        if (listing.error().is_metadata_error()) {
            return Err<void>(listing.error());
        }
        return Err<void>(make_error(ErrorKind::DownloadError, listing.error().message));
    }

    listing_ = std::move(listing.value());
    files_.clear();
    files_.reserve(listing_.size());
    for (const auto& entry : listing_) {
        files_.push_back(FileTransfer{entry.name, entry.size, entry.size});
    }
    emit();
    return Ok();
}

Result<collection::Collection> ProgressReconciler::finish_without_all_done() {
    const std::string incomplete = "Stream closed before the collection was complete";

    if (!source_.has_blob(collection_)) {
        return Err<collection::Collection>(ErrorKind::DownloadError, incomplete);
    }

    auto listing = source_.get_collection(collection_);
    if (listing.is_error()) {
        return Err<collection::Collection>(ErrorKind::DownloadError, incomplete + ": " + listing.error().message);
    }
    for (const auto& entry : listing.value()) {
        if (!source_.has_blob(entry.hash)) {
            return Err<collection::Collection>(ErrorKind::DownloadError,
                                               incomplete + ": " + entry.name + " is missing");
        }
    }

    spdlog::debug("[Receive] Stream ended without a completion event, collection is complete locally");
    if (auto res = adopt_listing(); res.is_error()) {
        return Err<collection::Collection>(res.error());
    }
    return Ok(listing_);
}

Result<collection::Collection> ProgressReconciler::run(engine::EventStream& stream,
                                                       const CancellationToken& token,
                                                       std::chrono::milliseconds poll_interval) {
    const auto cancelled = [&stream]() {
        stream.close();
        return Err<collection::Collection>(ErrorKind::Cancelled, "Transfer cancelled");
    };

    while (true) {
        if (token.is_cancelled()) {
            return cancelled();
        }

        auto next = stream.next(poll_interval);
        if (next.is_error()) {
            stream.close();
            return Err<collection::Collection>(next.error());
        }

        if (!next.value()) {
            if (stream.finished()) {
                return finish_without_all_done();
            }
            continue;  // Poll timeout
        }

        if (token.is_cancelled()) {
            return cancelled();
        }

        auto step = apply(*next.value());
        if (step.is_error()) {
            stream.close();
            return Err<collection::Collection>(step.error());
        }
        if (step.value() == Step::Done) {
            stream.close();
            return Ok(listing_);
        }
    }
}

void ProgressReconciler::emit() {
    ++snapshots_emitted_;
    if (!channel_) {
        return;
    }
    if (auto sent = channel_->send(files_); sent.is_error() && !send_failure_logged_) {
        send_failure_logged_ = true;
        spdlog::warn("[Receive] Progress consumer is gone, snapshots are dropped: {}", sent.error().message);
    }
}

} // namespace drop::progress
