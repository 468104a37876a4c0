#include "drop/session/receive_session.hpp"

#include "drop/collection/collection.hpp"
#include "drop/progress/reconciler.hpp"
#include "drop/ticket/ticket.hpp"
#include "drop/transport/locator.hpp"

#include <spdlog/spdlog.h>

namespace drop::session {
namespace fs = std::filesystem;

ReceiveSession::ReceiveSession(engine::TransferEngine& engine, const Config& config, events::EventBus* bus)
    : TransferSession(next_session_id(SessionKind::Receive), SessionKind::Receive, bus)
    , engine_(engine)
    , config_(config) {}

Result<std::vector<ReceivedFile>> ReceiveSession::receive(const std::string& ticket_text,
                                                          const fs::path& output_dir,
                                                          progress::ProgressChannel* progress) {
    using Files = std::vector<ReceivedFile>;

    if (is_cancelled()) {
        return Err<Files>(ErrorKind::Cancelled, "Receive cancelled");
    }
    if (state() != SessionState::Created) {
        return Err<Files>(ErrorKind::InvalidState, "Receive session already used");
    }
    if (auto res = transition_to(SessionState::Negotiating); res.is_error()) {
        return Err<Files>(ErrorKind::Cancelled, "Receive cancelled");
    }

    auto decoded = ticket::decode(ticket_text);
    if (decoded.is_error()) {
        return fail(decoded.error());
    }
    auto locator = transport::PeerLocator::decode(decoded.value().locator);
    if (locator.is_error()) {
        return fail(locator.error());
    }
    if (locator.value().format != transport::BlobFormat::HashSeq) {
        return fail(make_error(ErrorKind::UnsupportedFormat, "Ticket does not name a file collection"));
    }

    const Hash collection_hash = locator.value().collection;
    spdlog::info("[Receive] {} fetching {} from {}:{}", session_id(), collection_hash.to_hex(),
                 locator.value().host, locator.value().port);

    auto stream = engine_.download_hash_sequence(collection_hash, locator.value(), decoded.value().confirmation);
    if (stream.is_error()) {
        return fail(stream.error());
    }

    engine::EventStream* events = nullptr;
    {
        std::lock_guard lock(stream_mutex_);
        stream_ = std::move(stream.value());
        events = stream_.get();
    }

    if (auto res = transition_to(SessionState::Active); res.is_error()) {
        events->close();
        return Err<Files>(ErrorKind::Cancelled, "Receive cancelled");
    }

    progress::ProgressReconciler reconciler(engine_, collection_hash, progress);
    auto listing = reconciler.run(*events, cancellation_token(), config_.poll_interval);
    if (listing.is_error()) {
        if (listing.error().kind == ErrorKind::Cancelled || is_cancelled()) {
            return Err<Files>(ErrorKind::Cancelled, "Receive cancelled");
        }
        return fail(listing.error());
    }

    auto files = export_files(listing.value(), output_dir);
    if (files.is_error()) {
        if (files.error().kind == ErrorKind::Cancelled) {
            return files;
        }
        return fail(files.error());
    }

    if (auto res = transition_to(SessionState::Completed); res.is_error()) {
        return Err<Files>(ErrorKind::Cancelled, "Receive cancelled");
    }

    spdlog::info("[Receive] {} received {} files into {}", session_id(), files.value().size(), output_dir.string());
    return files;
}

Result<std::vector<ReceivedFile>> ReceiveSession::export_files(const collection::Collection& listing,
                                                               const fs::path& output_dir) {
    using Files = std::vector<ReceivedFile>;

    for (const auto& entry : listing) {
        if (auto valid = collection::validate_file_name(entry.name); valid.is_error()) {
            return Err<Files>(valid.error());
        }
    }

    Files files;
    files.reserve(listing.size());
    for (const auto& entry : listing) {
        if (is_cancelled()) {
            return Err<Files>(ErrorKind::Cancelled, "Receive cancelled");
        }

        const fs::path destination = output_dir / entry.name;
        if (auto res = engine_.export_blob(entry.hash, destination); res.is_error()) {
            return Err<Files>(res.error());
        }
        files.push_back(ReceivedFile{entry.name, entry.hash, destination, entry.size});
    }
    return Ok(std::move(files));
}

Result<std::vector<ReceivedFile>> ReceiveSession::fail(Error error) {
    spdlog::error("[Receive] {} failed: {}", session_id(), error.to_string());
    if (auto res = mark_failed(error.to_string()); res.is_error()) {
        spdlog::debug("[Receive] {}: {}", session_id(), res.error().message);
    }
    return Err<std::vector<ReceivedFile>>(std::move(error));
}

void ReceiveSession::on_cancel() {
    std::lock_guard lock(stream_mutex_);
    if (stream_) {
        stream_->close();
    }
}

} // namespace drop::session
