#pragma once

#include "drop/core/config.hpp"
#include "drop/core/hash.hpp"
#include "drop/core/result.hpp"
#include "drop/events/event_bus.hpp"
#include "drop/store/blob_store.hpp"
#include "drop/transport/wire.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace drop::transport {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class Provider;

/**
 * @brief One peer connection on the serving side
 *
 * Lifecycle:
 * 1. Created when a connection is accepted
 * 2. start() reads the fixed-size request asynchronously on the io_context
 * 3. serve() runs on the provider's serving pool and writes every frame with
 *    blocking writes; file blobs are split across serve_workers threads that
 *    claim chunks from one ChunkClaimReader
 * 4. Destroyed when the last shared_ptr (pool task or handler) lets go
 *
 * Frame writes are serialized by write_mutex_ so chunk frames from
 * different workers never interleave on the socket.
 */
class ProviderConnection : public std::enable_shared_from_this<ProviderConnection> {
public:
    ProviderConnection(tcp::socket socket, Provider& provider, std::uint64_t id);

    void start();

    /**
     * @brief Shut the socket down so blocked writes return
     *
     * Safe to call from any thread.
     */
    void abort();

    std::uint64_t id() const noexcept { return id_; }
    std::optional<Hash> collection() const;
    bool is_done() const noexcept { return done_.load(); }

private:
    void do_read_request();
    void serve();

    Result<void> send_inline_blob(const Hash& hash, const Bytes& data);
    Result<void> send_file_blob(std::size_t index, const Hash& hash, const store::BlobEntry& entry);
    Result<void> write_frame(const FrameHeader& header, const std::uint8_t* payload = nullptr);
    void send_error(const std::string& reason);
    void report_abort(const std::string& reason);

    bool should_stop() const;

    tcp::socket socket_;
    Provider& provider_;
    std::uint64_t id_;
    std::string remote_;

    std::array<std::uint8_t, Request::kSize> request_buffer_{};
    Request request_;
    std::atomic<bool> has_request_{false};
    std::atomic<std::uint64_t> collection_value_{0};

    std::mutex write_mutex_;
    std::atomic<bool> aborted_{false};
    std::atomic<bool> done_{false};
    std::uint64_t bytes_sent_ = 0;   ///< Guarded by write_mutex_
};

/**
 * @brief Serves shared collections to peers over TCP
 *
 * Architecture follows the event-driven server pattern:
 * - Async accept on the caller's io_context
 * - Per-connection objects kept alive with enable_shared_from_this
 * - Blocking serving work moved off the event loop onto a thread pool
 *
 * A connection is only served if its collection is currently shared and
 * the request carries the matching confirmation byte. unshare() refuses
 * future requests and aborts connections still serving that collection.
 *
 * Events (PeerConnected, TransferStarted, ChunkServed, BlobServed,
 * TransferCompleted, TransferAborted) go to the EventBus from serving
 * threads, never while a provider lock is held.
 */
class Provider {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Bind and start listening
     *
     * Fails with NodeError if the address cannot be bound. io_context must
     * outlive the provider.
     */
    static Result<std::unique_ptr<Provider>> create(asio::io_context& io_context,
                                                    store::BlobStore& store,
                                                    events::EventBus& bus,
                                                    const Config& config);

    Provider(PrivateTag, tcp::acceptor acceptor, store::BlobStore& store, events::EventBus& bus,
             const Config& config);

    ~Provider();

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    void share(const Hash& collection, std::uint8_t confirmation);

    void unshare(const Hash& collection);

    std::optional<std::uint8_t> confirmation_for(const Hash& collection) const;

    bool is_shared(const Hash& collection) const { return confirmation_for(collection).has_value(); }

    /**
     * @brief Stop accepting, abort live connections, wait for serving to end
     *
     * Idempotent.
     */
    void stop();

    bool is_stopping() const noexcept { return stopping_.load(); }

    std::uint16_t port() const noexcept { return port_; }

private:
    friend class ProviderConnection;

    void do_accept();

    void register_connection(const std::shared_ptr<ProviderConnection>& connection);
    void unregister_connection(std::uint64_t id);

    tcp::acceptor acceptor_;
    store::BlobStore& store_;
    events::EventBus& bus_;
    Config config_;
    std::uint16_t port_ = 0;

    asio::thread_pool serving_pool_;

    mutable std::mutex mutex_;
    std::unordered_map<Hash, std::uint8_t> shared_;
    std::unordered_map<std::uint64_t, std::weak_ptr<ProviderConnection>> connections_;

    std::atomic<std::uint64_t> next_connection_id_{1};
    std::atomic<bool> stopping_{false};
};

} // namespace drop::transport
