#pragma once

#include "drop/core/config.hpp"
#include "drop/core/hash.hpp"
#include "drop/engine/engine.hpp"
#include "drop/events/event_bus.hpp"
#include "drop/events/events.hpp"
#include "drop/progress/channel.hpp"
#include "drop/session/transfer_session.hpp"
#include "drop/ticket/ticket.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace drop::session {

/**
 * @brief Offers a set of local files to one receiver
 *
 * start() validates every path before anything is exposed on the network,
 * imports the files, builds the collection, shares it and returns the
 * ticket. From then on the provider's events drive the session: chunk
 * events update the sender-side progress table, a completed transfer of
 * this collection completes the session.
 *
 * Always owned through a shared_ptr (see create()) because bus handlers
 * hold a weak reference to it.
 */
class SendSession : public TransferSession, public std::enable_shared_from_this<SendSession> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::shared_ptr<SendSession> create(engine::TransferEngine& engine,
                                               events::EventBus& bus,
                                               const Config& config);

    SendSession(PrivateTag, engine::TransferEngine& engine, events::EventBus& bus, const Config& config);

    ~SendSession() override;

    /**
     * @brief Import, share, and return the ticket for paths
     *
     * ImportError for an empty list, a missing path, a path that is not a
     * regular file, or two files with the same name.
     */
    Result<ticket::Ticket> start(const std::vector<std::filesystem::path>& paths,
                                 progress::ProgressChannel* progress = nullptr);

    /**
     * @brief Block until the session reaches a terminal state
     *
     * Polls every Config::poll_interval. Returns Cancelled when cancelled
     * and the original failure when failed.
     */
    Result<void> wait() const;

    std::optional<Hash> collection_hash() const;

    progress::Snapshot snapshot() const;

protected:
    void on_cancel() override;

private:
    Result<std::vector<std::pair<std::string, Hash>>> import_files(const std::vector<std::filesystem::path>& paths);
    void subscribe();
    void unsubscribe();

    void on_chunk_served(const events::ChunkServedEvent& event);
    void on_transfer_completed(const events::TransferCompletedEvent& event);
    void emit_locked();

    engine::TransferEngine& engine_;
    events::EventBus& bus_;
    Config config_;

    mutable std::mutex progress_mutex_;
    std::optional<Hash> collection_;
    progress::Snapshot files_;
    progress::ProgressChannel* channel_ = nullptr;
    bool send_failure_logged_ = false;
    std::optional<Error> failure_;

    std::size_t chunk_served_subscription_ = 0;
    std::size_t completed_subscription_ = 0;
    bool subscribed_ = false;
};

} // namespace drop::session
