/**
 * @file components.hpp
 * @brief Event-driven components attached to a node's EventBus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * // Provider and session events are now logged
 */

#pragma once

#include "drop/events/event_bus.hpp"
#include "drop/events/events.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace drop::events {

/**
 * @brief Logs provider and session events with spdlog
 *
 * Chunk events are logged at trace level only; everything else at info.
 * Unsubscribes on destruction so the bus may outlive the component.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        peer_connected_ = bus_.subscribe<PeerConnectedEvent>([this](const PeerConnectedEvent& e) {
            on_peer_connected(e);
        });

        transfer_started_ = bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        chunk_served_ = bus_.subscribe<ChunkServedEvent>([this](const ChunkServedEvent& e) {
            on_chunk_served(e);
        });

        blob_served_ = bus_.subscribe<BlobServedEvent>([this](const BlobServedEvent& e) {
            on_blob_served(e);
        });

        transfer_completed_ = bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        transfer_aborted_ = bus_.subscribe<TransferAbortedEvent>([this](const TransferAbortedEvent& e) {
            on_transfer_aborted(e);
        });

        session_started_ = bus_.subscribe<SessionStartedEvent>([this](const SessionStartedEvent& e) {
            on_session_started(e);
        });

        session_finished_ = bus_.subscribe<SessionFinishedEvent>([this](const SessionFinishedEvent& e) {
            on_session_finished(e);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<PeerConnectedEvent>(peer_connected_);
        bus_.unsubscribe<TransferStartedEvent>(transfer_started_);
        bus_.unsubscribe<ChunkServedEvent>(chunk_served_);
        bus_.unsubscribe<BlobServedEvent>(blob_served_);
        bus_.unsubscribe<TransferCompletedEvent>(transfer_completed_);
        bus_.unsubscribe<TransferAbortedEvent>(transfer_aborted_);
        bus_.unsubscribe<SessionStartedEvent>(session_started_);
        bus_.unsubscribe<SessionFinishedEvent>(session_finished_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_peer_connected(const PeerConnectedEvent& e) {
        spdlog::info("[PeerConnected] connection={} remote={}", e.connection_id, e.remote_endpoint);
    }

    void on_transfer_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] connection={} collection={} blobs={}",
            e.connection_id,
            e.collection.to_hex(),
            e.blob_count);
    }

    void on_chunk_served(const ChunkServedEvent& e) {
        spdlog::trace("[ChunkServed] connection={} index={} served={}/{}",
            e.connection_id,
            e.index,
            e.bytes_served,
            e.blob_size);
    }

    void on_blob_served(const BlobServedEvent& e) {
        spdlog::info("[BlobServed] connection={} index={} hash={} size={}",
            e.connection_id,
            e.index,
            e.hash.to_hex(),
            e.size);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] connection={} collection={} bytes={} duration={}ms",
            e.connection_id,
            e.collection.to_hex(),
            e.bytes_sent,
            e.duration.count());
    }

    void on_transfer_aborted(const TransferAbortedEvent& e) {
        spdlog::warn("[TransferAborted] connection={} collection={} reason={}",
            e.connection_id,
            e.collection.to_hex(),
            e.reason);
    }

    void on_session_started(const SessionStartedEvent& e) {
        spdlog::info("[SessionStarted] id={} kind={}", e.session_id, e.kind);
    }

    void on_session_finished(const SessionFinishedEvent& e) {
        if (e.error_message.empty()) {
            spdlog::info("[SessionFinished] id={} kind={} state={}", e.session_id, e.kind, e.state);
        } else {
            spdlog::warn("[SessionFinished] id={} kind={} state={} error={}",
                e.session_id, e.kind, e.state, e.error_message);
        }
    }

    EventBus& bus_;
    size_t peer_connected_ = 0;
    size_t transfer_started_ = 0;
    size_t chunk_served_ = 0;
    size_t blob_served_ = 0;
    size_t transfer_completed_ = 0;
    size_t transfer_aborted_ = 0;
    size_t session_started_ = 0;
    size_t session_finished_ = 0;
};

} // namespace drop::events
