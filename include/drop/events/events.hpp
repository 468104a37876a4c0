/**
 * @file events.hpp
 * @brief Event types published on the EventBus
 *
 * NAMING CONVENTION:
 * - Events are past-tense: PeerConnectedEvent, BlobServedEvent
 *
 * Provider events describe what the sending side observes on the wire.
 * Session events describe lifecycle changes of send/receive sessions.
 * Neither carries the receive-side progress table: that travels as
 * snapshots through progress::ProgressChannel.
 */

#pragma once

#include "drop/core/hash.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace drop::events {

// ════════════════════════════════════════════════════════
// Provider Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a peer opens a connection to the provider
 *
 * WHO EMITS: transport::Provider (accept handler)
 * WHO SUBSCRIBES: LoggerComponent
 */
struct PeerConnectedEvent {
    std::uint64_t connection_id = 0;
    std::string remote_endpoint;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once a request has been validated and serving begins
 */
struct TransferStartedEvent {
    std::uint64_t connection_id = 0;
    Hash collection;
    std::size_t blob_count = 0;   ///< Children of the hash sequence (metadata included)
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after every chunk written to a peer
 *
 * WHO SUBSCRIBES: SendSession (sender-side progress table)
 */
struct ChunkServedEvent {
    std::uint64_t connection_id = 0;
    Hash collection;
    std::size_t index = 0;           ///< Position in the hash sequence (0 = metadata)
    std::uint64_t bytes_served = 0;  ///< Cumulative bytes of this blob sent so far
    std::uint64_t blob_size = 0;
};

/**
 * @brief Emitted when one child blob has been fully written
 */
struct BlobServedEvent {
    std::uint64_t connection_id = 0;
    Hash collection;
    std::size_t index = 0;
    Hash hash;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a peer has received the whole collection
 *
 * WHO SUBSCRIBES: SendSession (completion), LoggerComponent
 */
struct TransferCompletedEvent {
    std::uint64_t connection_id = 0;
    Hash collection;
    std::uint64_t bytes_sent = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when serving stops before the collection was complete
 */
struct TransferAbortedEvent {
    std::uint64_t connection_id = 0;
    Hash collection;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct SessionStartedEvent {
    std::string session_id;
    std::string kind;   // "send" or "receive"
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionFinishedEvent {
    std::string session_id;
    std::string kind;
    std::string state;  // "completed", "cancelled", "failed"
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace drop::events
