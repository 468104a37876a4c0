#include "drop/transport/provider.hpp"

#include "drop/collection/collection.hpp"
#include "drop/events/events.hpp"
#include "drop/io/chunk_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace drop::transport {

// ──────────────────────────────────────────────────────────
// ProviderConnection Implementation
// ──────────────────────────────────────────────────────────

ProviderConnection::ProviderConnection(tcp::socket socket, Provider& provider, std::uint64_t id)
    : socket_(std::move(socket))
    , provider_(provider)
    , id_(id) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void ProviderConnection::start() {
    provider_.bus_.emit(events::PeerConnectedEvent{id_, remote_});
    do_read_request();
}

void ProviderConnection::do_read_request() {
    auto self = shared_from_this();  // Keep connection alive during async operation

    asio::async_read(
        socket_,
        asio::buffer(request_buffer_),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("[Provider] Connection {}: request read failed: {}", id_, ec.message());
                }
                provider_.unregister_connection(id_);
                return;
            }
            if (provider_.is_stopping()) {
                provider_.unregister_connection(id_);
                return;
            }

            auto request = Request::decode(request_buffer_.data(), bytes_transferred);
            if (request.is_error()) {
                asio::post(provider_.serving_pool_, [this, self, error = request.error()]() {
                    send_error(error.message);
                    report_abort(error.message);
                });
                return;
            }

            request_ = request.value();
            collection_value_.store(request_.collection.value);
            has_request_.store(true);

            // Serving blocks on disk and socket writes: keep it off the event loop
            asio::post(provider_.serving_pool_, [this, self]() { serve(); });
        }
    );
}

std::optional<Hash> ProviderConnection::collection() const {
    if (!has_request_.load()) {
        return std::nullopt;
    }
    return Hash{collection_value_.load()};
}

void ProviderConnection::abort() {
    aborted_.store(true);
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

bool ProviderConnection::should_stop() const {
    return aborted_.load() || provider_.is_stopping() || !provider_.is_shared(request_.collection);
}

void ProviderConnection::serve() {
    const Hash& collection_hash = request_.collection;

    auto confirmation = provider_.confirmation_for(collection_hash);
    if (!confirmation) {
        const std::string reason = "Collection " + collection_hash.to_hex() + " is not shared";
        send_error(reason);
        report_abort(reason);
        return;
    }
    if (request_.format != BlobFormat::HashSeq) {
        const std::string reason = "Only hash sequence requests are served";
        send_error(reason);
        report_abort(reason);
        return;
    }
    if (*confirmation != request_.confirmation) {
        const std::string reason = "Confirmation mismatch";
        send_error(reason);
        report_abort(reason);
        return;
    }

    auto root = provider_.store_.read_to_bytes(collection_hash);
    if (root.is_error()) {
        send_error(root.error().message);
        report_abort(root.error().message);
        return;
    }
    auto sequence = collection::decode_hash_sequence(root.value());
    if (sequence.is_error()) {
        send_error(sequence.error().message);
        report_abort(sequence.error().message);
        return;
    }

    const auto started = std::chrono::steady_clock::now();
    provider_.bus_.emit(events::TransferStartedEvent{id_, collection_hash, sequence.value().size()});

    if (auto res = send_inline_blob(collection_hash, root.value()); res.is_error()) {
        report_abort(res.error().message);
        return;
    }

    const auto& hashes = sequence.value();
    for (std::size_t index = 0; index < hashes.size(); ++index) {
        if (should_stop()) {
            send_error("Transfer aborted by provider");
            report_abort("collection unshared or provider stopping");
            return;
        }

        auto blob = provider_.store_.entry(hashes[index]);
        if (!blob) {
            const std::string reason = "Blob " + hashes[index].to_hex() + " is missing from the store";
            send_error(reason);
            report_abort(reason);
            return;
        }

        auto sent = blob->is_inline() ? send_inline_blob(hashes[index], *blob->inline_data)
                                      : send_file_blob(index, hashes[index], *blob);
        if (sent.is_error()) {
            send_error(sent.error().message);
            report_abort(sent.error().message);
            return;
        }

        provider_.bus_.emit(events::BlobServedEvent{id_, collection_hash, index, hashes[index], blob->size});
    }

    std::uint64_t total = 0;
    {
        std::lock_guard lock(write_mutex_);
        total = bytes_sent_;
    }
    FrameHeader done{FrameType::Done, collection_hash, total, 0};
    if (auto res = write_frame(done); res.is_error()) {
        report_abort(res.error().message);
        return;
    }

    done_.store(true);
    provider_.unregister_connection(id_);

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    provider_.bus_.emit(events::TransferCompletedEvent{id_, collection_hash, total, elapsed});
}

Result<void> ProviderConnection::send_inline_blob(const Hash& hash, const Bytes& data) {
    const std::size_t chunk_size = std::min<std::size_t>(provider_.config_.chunk_size, FrameHeader::kMaxPayload);

    if (auto res = write_frame(FrameHeader{FrameType::BlobHeader, hash, data.size(), 0}); res.is_error()) {
        return res;
    }
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        const auto length = static_cast<std::uint32_t>(std::min(chunk_size, data.size() - offset));
        FrameHeader chunk{FrameType::Chunk, hash, offset, length};
        if (auto res = write_frame(chunk, data.data() + offset); res.is_error()) {
            return res;
        }
    }
    return write_frame(FrameHeader{FrameType::BlobEnd, hash, data.size(), 0});
}

Result<void> ProviderConnection::send_file_blob(std::size_t index, const Hash& hash, const store::BlobEntry& entry) {
    auto reader = io::ChunkClaimReader::open(entry.file);
    if (reader.is_error()) {
        return Err<void>(reader.error());
    }
    auto& source = *reader.value();
    if (source.len() != entry.size) {
        return Err<void>(make_error(ErrorKind::IoError,
                                    entry.file.string() + " changed size since it was imported"));
    }

    if (auto res = write_frame(FrameHeader{FrameType::BlobHeader, hash, entry.size, 0}); res.is_error()) {
        return res;
    }

    const std::size_t chunk_size = std::min<std::size_t>(provider_.config_.chunk_size, FrameHeader::kMaxPayload);
    const std::uint64_t chunk_count = (entry.size + chunk_size - 1) / chunk_size;
    const std::size_t worker_count = static_cast<std::size_t>(
        std::max<std::uint64_t>(1, std::min<std::uint64_t>(provider_.config_.serve_workers, chunk_count)));

    std::atomic<std::uint64_t> served{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::optional<Error> first_error;

    {
        asio::thread_pool workers(worker_count);
        for (std::size_t w = 0; w < worker_count; ++w) {
            asio::post(workers, [&]() {
                while (!failed.load() && !should_stop()) {
                    auto chunk = source.claim(chunk_size);
                    if (chunk.data.empty()) {
                        break;
                    }

                    const auto length = static_cast<std::uint32_t>(chunk.data.size());
                    auto res = write_frame(FrameHeader{FrameType::Chunk, hash, chunk.offset, length},
                                           chunk.data.data());
                    if (res.is_error()) {
                        std::lock_guard lock(error_mutex);
                        if (!first_error) {
                            first_error = res.error();
                        }
                        failed.store(true);
                        break;
                    }

                    const auto total = served.fetch_add(length) + length;
                    provider_.bus_.emit(events::ChunkServedEvent{id_, request_.collection, index, total, entry.size});
                }
            });
        }
        workers.join();
    }

    if (first_error) {
        return Err<void>(*first_error);
    }
    if (should_stop()) {
        return Err<void>(make_error(ErrorKind::Cancelled, "Transfer aborted by provider"));
    }
    if (served.load() != entry.size) {
        return Err<void>(make_error(ErrorKind::IoError,
                                    "Read " + std::to_string(served.load()) + " of " +
                                    std::to_string(entry.size) + " bytes from " + entry.file.string()));
    }

    return write_frame(FrameHeader{FrameType::BlobEnd, hash, entry.size, 0});
}

Result<void> ProviderConnection::write_frame(const FrameHeader& header, const std::uint8_t* payload) {
    std::lock_guard lock(write_mutex_);
    if (aborted_.load()) {
        return Err<void>(make_error(ErrorKind::Cancelled, "Connection aborted"));
    }

    const Bytes head = header.encode();
    std::array<asio::const_buffer, 2> buffers{
        asio::buffer(head),
        asio::buffer(payload, payload ? header.payload_length : 0)
    };

    boost::system::error_code ec;
    asio::write(socket_, buffers, ec);
    if (ec) {
        return Err<void>(make_error(ErrorKind::IoError, "Write to " + remote_ + " failed: " + ec.message()));
    }

    if (header.type == FrameType::Chunk) {
        bytes_sent_ += header.payload_length;
    }
    return Ok();
}

void ProviderConnection::send_error(const std::string& reason) {
    FrameHeader header{FrameType::Error, Hash{}, 0, static_cast<std::uint32_t>(reason.size())};
    auto res = write_frame(header, reinterpret_cast<const std::uint8_t*>(reason.data()));
    if (res.is_error()) {
        spdlog::debug("[Provider] Connection {}: could not deliver error frame: {}", id_, res.error().message);
    }
}

void ProviderConnection::report_abort(const std::string& reason) {
    provider_.unregister_connection(id_);
    abort();
    provider_.bus_.emit(events::TransferAbortedEvent{id_, request_.collection, reason});
}

// ──────────────────────────────────────────────────────────
// Provider Implementation
// ──────────────────────────────────────────────────────────

Result<std::unique_ptr<Provider>> Provider::create(asio::io_context& io_context,
                                                   store::BlobStore& store,
                                                   events::EventBus& bus,
                                                   const Config& config) {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(config.bind_address, ec);
    if (ec) {
        return Err<std::unique_ptr<Provider>>(ErrorKind::NodeError,
                                              "Invalid bind address '" + config.bind_address + "': " + ec.message());
    }

    const tcp::endpoint endpoint(address, config.port);
    tcp::acceptor acceptor(io_context);

    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return Err<std::unique_ptr<Provider>>(ErrorKind::NodeError,
                                              "Failed to listen on " + config.bind_address + ":" +
                                              std::to_string(config.port) + ": " + ec.message());
    }

    auto provider = std::make_unique<Provider>(PrivateTag{}, std::move(acceptor), store, bus, config);
    spdlog::info("[Provider] Listening on {}:{}", config.bind_address, provider->port());

    provider->do_accept();
    return Ok(std::move(provider));
}

Provider::Provider(PrivateTag, tcp::acceptor acceptor, store::BlobStore& store, events::EventBus& bus,
                   const Config& config)
    : acceptor_(std::move(acceptor))
    , store_(store)
    , bus_(bus)
    , config_(config)
    , serving_pool_(std::max<std::size_t>(2, config.serve_workers)) {
    boost::system::error_code ec;
    port_ = acceptor_.local_endpoint(ec).port();
}

Provider::~Provider() {
    stop();
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void Provider::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted || stopping_.load()) {
                    return;
                }
                spdlog::error("[Provider] Accept error: {}", ec.message());
                do_accept();
                return;
            }
            if (stopping_.load()) {
                return;  // Socket closes as it goes out of scope
            }

            auto connection = std::make_shared<ProviderConnection>(
                std::move(socket), *this, next_connection_id_.fetch_add(1));
            register_connection(connection);
            connection->start();

            // Accept next connection
            do_accept();
        }
    );
}

void Provider::share(const Hash& collection, std::uint8_t confirmation) {
    std::lock_guard lock(mutex_);
    shared_[collection] = confirmation;
    spdlog::debug("[Provider] Sharing collection {}", collection.to_hex());
}

void Provider::unshare(const Hash& collection) {
    std::vector<std::shared_ptr<ProviderConnection>> to_abort;
    {
        std::lock_guard lock(mutex_);
        shared_.erase(collection);
        for (const auto& [id, weak] : connections_) {
            auto connection = weak.lock();
            if (connection && !connection->is_done() && connection->collection() == collection) {
                to_abort.push_back(std::move(connection));
            }
        }
    }

    for (auto& connection : to_abort) {
        spdlog::debug("[Provider] Aborting connection {} serving unshared collection {}",
                      connection->id(), collection.to_hex());
        connection->abort();
    }
}

std::optional<std::uint8_t> Provider::confirmation_for(const Hash& collection) const {
    std::lock_guard lock(mutex_);
    auto it = shared_.find(collection);
    if (it == shared_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Provider::stop() {
    if (stopping_.exchange(true)) {
        return;
    }

    std::vector<std::shared_ptr<ProviderConnection>> live;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, weak] : connections_) {
            if (auto connection = weak.lock()) {
                live.push_back(std::move(connection));
            }
        }
    }
    for (auto& connection : live) {
        connection->abort();
    }
    live.clear();

    serving_pool_.join();
    spdlog::debug("[Provider] Port {} stopped", port_);
}

void Provider::register_connection(const std::shared_ptr<ProviderConnection>& connection) {
    std::lock_guard lock(mutex_);
    connections_[connection->id()] = connection;
}

void Provider::unregister_connection(std::uint64_t id) {
    std::lock_guard lock(mutex_);
    connections_.erase(id);
}

} // namespace drop::transport
