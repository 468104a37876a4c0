#include "drop/session/send_session.hpp"

#include "drop/collection/collection.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <set>
#include <system_error>
#include <thread>

namespace drop::session {
namespace fs = std::filesystem;

namespace {

std::uint8_t random_confirmation() {
    std::random_device device;
    std::uniform_int_distribution<int> distribution(0, 255);
    return static_cast<std::uint8_t>(distribution(device));
}

} // namespace

std::shared_ptr<SendSession> SendSession::create(engine::TransferEngine& engine,
                                                 events::EventBus& bus,
                                                 const Config& config) {
    return std::make_shared<SendSession>(PrivateTag{}, engine, bus, config);
}

SendSession::SendSession(PrivateTag, engine::TransferEngine& engine, events::EventBus& bus, const Config& config)
    : TransferSession(next_session_id(SessionKind::Send), SessionKind::Send, &bus)
    , engine_(engine)
    , bus_(bus)
    , config_(config) {}

SendSession::~SendSession() {
    unsubscribe();
    if (state() == SessionState::Active) {
        if (auto collection = collection_hash()) {
            engine_.unshare(*collection);
        }
    }
}

Result<ticket::Ticket> SendSession::start(const std::vector<fs::path>& paths, progress::ProgressChannel* progress) {
    if (state() != SessionState::Created) {
        return Err<ticket::Ticket>(ErrorKind::InvalidState, "Send session already started");
    }

    auto fail = [this](Error error) {
        {
            std::lock_guard lock(progress_mutex_);
            failure_ = error;
        }
        if (auto res = mark_failed(error.to_string()); res.is_error()) {
            spdlog::debug("[Send] {}: {}", session_id(), res.error().message);
        }
        return Err<ticket::Ticket>(std::move(error));
    };

    auto entries = import_files(paths);
    if (entries.is_error()) {
        return fail(entries.error());
    }
    if (is_cancelled()) {
        return Err<ticket::Ticket>(ErrorKind::Cancelled, "Send cancelled");
    }

    auto root = engine_.create_collection(entries.value());
    if (root.is_error()) {
        return fail(root.error());
    }
    auto listing = engine_.get_collection(root.value());
    if (listing.is_error()) {
        return fail(listing.error());
    }

    {
        std::lock_guard lock(progress_mutex_);
        collection_ = root.value();
        channel_ = progress;
        files_.clear();
        for (const auto& entry : listing.value()) {
            files_.push_back(progress::FileTransfer{entry.name, 0, entry.size});
        }
    }

    subscribe();

    const std::uint8_t confirmation = random_confirmation();
    auto locator = engine_.share(root.value(), confirmation);
    if (locator.is_error()) {
        return fail(locator.error());
    }

    if (auto res = transition_to(SessionState::Active); res.is_error()) {
        engine_.unshare(root.value());
        return Err<ticket::Ticket>(ErrorKind::Cancelled, "Send cancelled");
    }

    {
        std::lock_guard lock(progress_mutex_);
        emit_locked();
    }

    ticket::Ticket ticket{locator.value(), confirmation};
    spdlog::info("[Send] {} sharing {} files as {}", session_id(), entries.value().size(), root.value().to_hex());
    return Ok(std::move(ticket));
}

Result<std::vector<std::pair<std::string, Hash>>> SendSession::import_files(const std::vector<fs::path>& paths) {
    using Entries = std::vector<std::pair<std::string, Hash>>;

    if (paths.empty()) {
        return Err<Entries>(ErrorKind::ImportError, "No files to send");
    }

    // Validate everything before touching the store
    std::set<std::string> names;
    for (const auto& path : paths) {
        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            return Err<Entries>(ErrorKind::ImportError, "File not found: " + path.string());
        }
        if (!fs::is_regular_file(status)) {
            return Err<Entries>(ErrorKind::ImportError, "Not a regular file: " + path.string());
        }

        const std::string name = path.filename().string();
        if (auto valid = collection::validate_file_name(name); valid.is_error()) {
            return Err<Entries>(ErrorKind::ImportError, valid.error().message);
        }
        if (!names.insert(name).second) {
            return Err<Entries>(ErrorKind::ImportError, "Two files are named " + name);
        }
    }

    Entries entries;
    entries.reserve(paths.size());
    for (const auto& path : paths) {
        auto hash = engine_.import(path);
        if (hash.is_error()) {
            return Err<Entries>(ErrorKind::ImportError, hash.error().message);
        }
        entries.emplace_back(path.filename().string(), hash.value());
    }
    return Ok(std::move(entries));
}

Result<void> SendSession::wait() const {
    while (true) {
        const auto current = info();
        switch (current.state) {
            case SessionState::Completed:
                return Ok();
            case SessionState::Cancelled:
                return Err<void>(make_error(ErrorKind::Cancelled, "Send cancelled"));
            case SessionState::Failed: {
                std::lock_guard lock(progress_mutex_);
                return Err<void>(failure_ ? *failure_ : make_error(ErrorKind::NodeError, current.last_error));
            }
            default:
                break;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

std::optional<Hash> SendSession::collection_hash() const {
    std::lock_guard lock(progress_mutex_);
    return collection_;
}

progress::Snapshot SendSession::snapshot() const {
    std::lock_guard lock(progress_mutex_);
    return files_;
}

void SendSession::on_cancel() {
    if (auto collection = collection_hash()) {
        engine_.unshare(*collection);
        spdlog::info("[Send] {} cancelled, {} no longer shared", session_id(), collection->to_hex());
    }
}

void SendSession::subscribe() {
    std::weak_ptr<SendSession> weak = weak_from_this();

    chunk_served_subscription_ = bus_.subscribe<events::ChunkServedEvent>(
        [weak](const events::ChunkServedEvent& event) {
            if (auto self = weak.lock()) {
                self->on_chunk_served(event);
            }
        });

    completed_subscription_ = bus_.subscribe<events::TransferCompletedEvent>(
        [weak](const events::TransferCompletedEvent& event) {
            if (auto self = weak.lock()) {
                self->on_transfer_completed(event);
            }
        });

    subscribed_ = true;
}

void SendSession::unsubscribe() {
    if (!subscribed_) {
        return;
    }
    bus_.unsubscribe<events::ChunkServedEvent>(chunk_served_subscription_);
    bus_.unsubscribe<events::TransferCompletedEvent>(completed_subscription_);
    subscribed_ = false;
}

void SendSession::on_chunk_served(const events::ChunkServedEvent& event) {
    std::lock_guard lock(progress_mutex_);
    if (!collection_ || event.collection != *collection_) {
        return;
    }
    if (event.index == 0 || event.index > files_.size()) {
        return;  // Metadata blob
    }

    auto& file = files_[event.index - 1];
    file.transferred = std::max(file.transferred, std::min(event.bytes_served, file.total));
    emit_locked();
}

void SendSession::on_transfer_completed(const events::TransferCompletedEvent& event) {
    {
        std::lock_guard lock(progress_mutex_);
        if (!collection_ || event.collection != *collection_) {
            return;
        }
        for (auto& file : files_) {
            file.transferred = file.total;
        }
        emit_locked();
    }

    if (auto res = transition_to(SessionState::Completed); res.is_error()) {
        spdlog::debug("[Send] {} not completed: {}", session_id(), res.error().message);
        return;
    }
    engine_.unshare(event.collection);
    spdlog::info("[Send] {} delivered {} bytes in {} ms",
                 session_id(), event.bytes_sent, event.duration.count());
}

void SendSession::emit_locked() {
    if (!channel_) {
        return;
    }
    if (auto sent = channel_->send(files_); sent.is_error() && !send_failure_logged_) {
        send_failure_logged_ = true;
        spdlog::warn("[Send] Progress consumer is gone, snapshots are dropped: {}", sent.error().message);
    }
}

} // namespace drop::session
