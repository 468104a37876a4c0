#pragma once

#include "drop/core/config.hpp"
#include "drop/core/error.hpp"
#include "drop/engine/engine.hpp"
#include "drop/events/event_queue.hpp"
#include "drop/io/chunk_writer.hpp"
#include "drop/store/blob_store.hpp"
#include "drop/transport/locator.hpp"
#include "drop/transport/wire.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

namespace drop::transport {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Downloads one hash sequence from a provider on a background thread
 *
 * The thread connects, sends the request, and turns response frames into
 * DownloadEvents pushed onto a ThreadSafeQueue. next() pops from that queue,
 * so the consumer never touches the socket.
 *
 * Received blobs are verified before they reach the store:
 * - structural blobs (sequence, metadata) are hashed in memory
 * - file blobs are staged under <store>/partial/, re-read and hashed, then
 *   moved to <store>/blobs/<hex>
 * A hash mismatch ends the stream with DownloadError.
 *
 * Files already in the store produce ItemFound + LocalFound and their
 * chunks are discarded.
 */
class DownloadStream : public engine::EventStream {
public:
    DownloadStream(store::BlobStore& store, PeerLocator peer, std::uint8_t confirmation, const Config& config);
    ~DownloadStream() override;

    DownloadStream(const DownloadStream&) = delete;
    DownloadStream& operator=(const DownloadStream&) = delete;

    /**
     * @brief Spawn the download thread (call once)
     */
    void start();

    Result<std::optional<engine::DownloadEvent>> next(std::chrono::milliseconds wait) override;
    bool finished() const override;
    void close() override;

private:
    using Item = std::variant<engine::DownloadEvent, Error>;

    /// Blob currently being received
    struct Incoming {
        std::size_t position = 0;           ///< 0 = sequence blob, 1 = metadata, 2.. = files
        Hash hash;
        std::uint64_t size = 0;
        std::uint64_t received = 0;
        std::uint64_t item_id = 0;          ///< 0 for structural blobs
        bool local = false;
        Bytes buffer;                       ///< Structural blobs only
        std::unique_ptr<io::ChunkWriter> writer;
    };

    void run();
    Result<void> download(tcp::socket& socket);

    Result<void> on_blob_header(const FrameHeader& header);
    Result<void> on_chunk(const FrameHeader& header, const Bytes& payload);
    Result<void> on_blob_end(const FrameHeader& header);
    Result<void> finish_structural_blob();
    Result<void> finish_file_blob();

    void emit(engine::DownloadEvent event);

    store::BlobStore& store_;
    PeerLocator peer_;
    std::uint8_t confirmation_;
    Config config_;

    events::ThreadSafeQueue<Item> queue_;
    std::thread worker_;
    std::atomic<bool> closed_{false};

    std::mutex socket_mutex_;
    tcp::socket* socket_ = nullptr;   ///< Live only while run() owns a connected socket

    // Download thread state
    std::optional<Incoming> current_;
    std::size_t next_position_ = 0;
    Bytes sequence_bytes_;
    collection::HashSequence sequence_;
    std::uint64_t bytes_read_ = 0;
    std::chrono::steady_clock::time_point started_;
};

} // namespace drop::transport
