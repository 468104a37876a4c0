#pragma once

/**
 * @file channel.hpp
 * @brief Progress table rows and the sink that carries snapshots to consumers
 *
 * EXAMPLE:
 * ProgressChannel channel;
 * std::thread ui([&] {
 *     while (auto snapshot = channel.receive()) {
 *         render(*snapshot);
 *     }
 * });
 * session.receive(ticket, out_dir, &channel);
 * channel.close();
 * ui.join();
 */

#include "drop/core/result.hpp"
#include "drop/events/event_queue.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace drop::progress {

struct FileTransfer {
    std::string name;
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;

    bool complete() const noexcept { return transferred == total; }

    bool operator==(const FileTransfer& other) const {
        return name == other.name && transferred == other.transferred && total == other.total;
    }
    bool operator!=(const FileTransfer& other) const { return !(*this == other); }
};

/// Full copy of the progress table at one instant
using Snapshot = std::vector<FileTransfer>;

nlohmann::json to_json(const FileTransfer& file);
nlohmann::json to_json(const Snapshot& snapshot);

/**
 * @brief Unbounded snapshot channel between one producer and its consumers
 *
 * send() never blocks. close() may be called by either side: afterwards
 * send() fails with SendError while snapshots already queued can still be
 * received.
 */
class ProgressChannel {
public:
    ProgressChannel() = default;

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    Result<void> send(Snapshot snapshot) {
        if (!queue_.push(std::move(snapshot))) {
            return Err<void>(make_error(ErrorKind::SendError, "progress channel closed"));
        }
        return Ok();
    }

    /**
     * @brief Block until a snapshot arrives; nullopt once closed and drained
     */
    std::optional<Snapshot> receive() { return queue_.pop(); }

    std::optional<Snapshot> try_receive() { return queue_.try_pop(); }

    template<typename Rep, typename Period>
    std::optional<Snapshot> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.pop_for(timeout);
    }

    void close() { queue_.shutdown(); }

    bool is_closed() const { return queue_.is_shutdown(); }

    std::size_t pending() const { return queue_.size(); }

private:
    events::ThreadSafeQueue<Snapshot> queue_;
};

} // namespace drop::progress
