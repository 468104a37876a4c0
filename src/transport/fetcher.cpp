#include "drop/transport/fetcher.hpp"

#include "drop/io/chunk_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <system_error>

namespace drop::transport {
namespace fs = std::filesystem;

namespace {

// Sequence and metadata blobs are held in memory while they arrive
constexpr std::uint64_t kMaxStructuralBlobSize = 64 * 1024 * 1024;

Error download_error(const std::string& message) {
    return make_error(ErrorKind::DownloadError, message);
}

} // namespace

DownloadStream::DownloadStream(store::BlobStore& store, PeerLocator peer, std::uint8_t confirmation,
                               const Config& config)
    : store_(store)
    , peer_(std::move(peer))
    , confirmation_(confirmation)
    , config_(config) {}

DownloadStream::~DownloadStream() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DownloadStream::start() {
    worker_ = std::thread([this]() { run(); });
}

Result<std::optional<engine::DownloadEvent>> DownloadStream::next(std::chrono::milliseconds wait) {
    auto item = queue_.pop_for(wait);
    if (!item) {
        return Ok(std::optional<engine::DownloadEvent>{});
    }
    if (const auto* error = std::get_if<Error>(&*item)) {
        return Err<std::optional<engine::DownloadEvent>>(*error);
    }
    return Ok(std::optional<engine::DownloadEvent>(std::get<engine::DownloadEvent>(std::move(*item))));
}

bool DownloadStream::finished() const {
    return queue_.drained();
}

void DownloadStream::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(socket_mutex_);
        if (socket_) {
            boost::system::error_code ec;
            socket_->shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    queue_.shutdown();
}

void DownloadStream::emit(engine::DownloadEvent event) {
    if (!queue_.push(Item{std::move(event)})) {
        // Consumer went away; stop reading from the peer
        closed_.store(true);
    }
}

void DownloadStream::run() {
    started_ = std::chrono::steady_clock::now();

    asio::io_context io_context;
    tcp::socket socket(io_context);

    auto result = download(socket);
    if (result.is_error() && !closed_.load()) {
        spdlog::debug("[Fetch] Download of {} from {}:{} failed: {}",
                      peer_.collection.to_hex(), peer_.host, peer_.port, result.error().message);
        if (!queue_.push(Item{result.error()})) {
            spdlog::debug("[Fetch] Download error dropped, stream already closed");
        }
    }

    {
        std::lock_guard lock(socket_mutex_);
        socket_ = nullptr;
    }
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);

    current_.reset();   // Discards any half-written staging file
    queue_.shutdown();
}

Result<void> DownloadStream::download(tcp::socket& socket) {
    boost::system::error_code ec;

    tcp::resolver resolver(socket.get_executor());
    auto endpoints = resolver.resolve(peer_.host, std::to_string(peer_.port), ec);
    if (ec) {
        return Err<void>(download_error("Failed to resolve " + peer_.host + ": " + ec.message()));
    }

    {
        std::lock_guard lock(socket_mutex_);
        if (closed_.load()) {
            return Ok();
        }
        socket_ = &socket;
    }

    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<void>(download_error("Failed to connect to " + peer_.host + ":" +
                                        std::to_string(peer_.port) + ": " + ec.message()));
    }

    Request request;
    request.format = BlobFormat::HashSeq;
    request.collection = peer_.collection;
    request.confirmation = confirmation_;
    const Bytes encoded = request.encode();
    asio::write(socket, asio::buffer(encoded), ec);
    if (ec) {
        return Err<void>(download_error("Failed to send request: " + ec.message()));
    }

    emit(engine::Connected{peer_.host + ":" + std::to_string(peer_.port)});

    Bytes head(FrameHeader::kSize);
    Bytes payload;
    while (!closed_.load()) {
        asio::read(socket, asio::buffer(head), ec);
        if (ec) {
            if (closed_.load()) {
                return Ok();
            }
            if (ec == asio::error::eof && !current_) {
                spdlog::debug("[Fetch] Provider closed the connection between blobs");
                return Ok();
            }
            return Err<void>(download_error("Connection to provider lost: " + ec.message()));
        }

        auto header = FrameHeader::decode(head.data(), head.size());
        if (header.is_error()) {
            return Err<void>(header.error());
        }

        payload.resize(header.value().payload_length);
        if (!payload.empty()) {
            asio::read(socket, asio::buffer(payload), ec);
            if (ec) {
                if (closed_.load()) {
                    return Ok();
                }
                return Err<void>(download_error("Connection to provider lost: " + ec.message()));
            }
        }

        Result<void> handled;
        switch (header.value().type) {
            case FrameType::BlobHeader:
                handled = on_blob_header(header.value());
                break;
            case FrameType::Chunk:
                handled = on_chunk(header.value(), payload);
                break;
            case FrameType::BlobEnd:
                handled = on_blob_end(header.value());
                break;
            case FrameType::Done: {
                if (current_ || next_position_ != sequence_.size() + 1) {
                    return Err<void>(download_error("Provider finished before every blob was sent"));
                }
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started_);
                emit(engine::AllDone{bytes_read_, elapsed});
                return Ok();
            }
            case FrameType::Error:
                return Err<void>(download_error("Provider refused the transfer: " +
                                                std::string(payload.begin(), payload.end())));
        }
        if (handled.is_error()) {
            return handled;
        }
    }
    return Ok();
}

Result<void> DownloadStream::on_blob_header(const FrameHeader& header) {
    if (current_) {
        return Err<void>(download_error("Blob " + header.hash.to_hex() + " started while " +
                                        current_->hash.to_hex() + " is still in progress"));
    }

    const std::size_t position = next_position_;
    Hash expected = peer_.collection;
    if (position > 0) {
        if (position - 1 >= sequence_.size()) {
            return Err<void>(download_error("Provider sent more blobs than the hash sequence lists"));
        }
        expected = sequence_[position - 1];
    }
    if (header.hash != expected) {
        return Err<void>(download_error("Unexpected blob " + header.hash.to_hex() + ", wanted " +
                                        expected.to_hex()));
    }

    Incoming incoming;
    incoming.position = position;
    incoming.hash = header.hash;
    incoming.size = header.value;

    if (position <= 1) {
        if (incoming.size > kMaxStructuralBlobSize) {
            return Err<void>(download_error("Structural blob of " + std::to_string(incoming.size) +
                                            " bytes is too large"));
        }
        incoming.buffer.resize(static_cast<std::size_t>(incoming.size));
    } else {
        incoming.item_id = position - 1;
        if (store_.contains(incoming.hash)) {
            incoming.local = true;
            emit(engine::ItemFound{incoming.item_id, incoming.hash, incoming.size});
            emit(engine::LocalFound{incoming.hash, incoming.size});
        } else {
            incoming.writer = std::make_unique<io::ChunkWriter>();
            if (auto res = incoming.writer->open(store_.partial_path(incoming.hash)); res.is_error()) {
                return Err<void>(download_error(res.error().message));
            }
            emit(engine::ItemFound{incoming.item_id, incoming.hash, incoming.size});
        }
    }

    current_ = std::move(incoming);
    return Ok();
}

Result<void> DownloadStream::on_chunk(const FrameHeader& header, const Bytes& payload) {
    if (!current_ || header.hash != current_->hash) {
        return Err<void>(download_error("Chunk for unexpected blob " + header.hash.to_hex()));
    }
    if (header.value > current_->size || payload.size() > current_->size - header.value) {
        return Err<void>(download_error("Chunk at offset " + std::to_string(header.value) +
                                        " runs past the end of " + current_->hash.to_hex()));
    }

    bytes_read_ += payload.size();
    if (current_->local) {
        return Ok();
    }

    if (current_->position <= 1) {
        std::memcpy(current_->buffer.data() + header.value, payload.data(), payload.size());
    } else if (auto res = current_->writer->write_at(header.value, payload.data(), payload.size());
               res.is_error()) {
        return Err<void>(download_error(res.error().message));
    }

    current_->received += payload.size();
    if (current_->item_id != 0) {
        emit(engine::Progress{current_->item_id, current_->received});
    }
    return Ok();
}

Result<void> DownloadStream::on_blob_end(const FrameHeader& header) {
    if (!current_ || header.hash != current_->hash) {
        return Err<void>(download_error("End of unexpected blob " + header.hash.to_hex()));
    }
    if (!current_->local && current_->received != current_->size) {
        return Err<void>(download_error("Blob " + current_->hash.to_hex() + " ended after " +
                                        std::to_string(current_->received) + " of " +
                                        std::to_string(current_->size) + " bytes"));
    }

    auto finished = current_->position <= 1 ? finish_structural_blob() : finish_file_blob();
    if (finished.is_error()) {
        return finished;
    }

    current_.reset();
    ++next_position_;
    return Ok();
}

Result<void> DownloadStream::finish_structural_blob() {
    if (hash_bytes(current_->buffer) != current_->hash) {
        return Err<void>(download_error("Hash mismatch for blob " + current_->hash.to_hex()));
    }

    if (current_->position == 0) {
        auto sequence = collection::decode_hash_sequence(current_->buffer);
        if (sequence.is_error()) {
            return Err<void>(sequence.error());
        }
        sequence_ = std::move(sequence.value());
        sequence_bytes_ = std::move(current_->buffer);
        return Ok();
    }

    store_.insert_bytes(std::move(sequence_bytes_));
    store_.insert_bytes(std::move(current_->buffer));
    emit(engine::HashSequenceFound{peer_.collection});
    return Ok();
}

Result<void> DownloadStream::finish_file_blob() {
    if (current_->local) {
        emit(engine::ItemDone{current_->item_id});
        return Ok();
    }

    const fs::path destination = store_.blob_path(current_->hash);
    if (auto res = current_->writer->finalize(destination); res.is_error()) {
        return Err<void>(download_error(res.error().message));
    }

    auto reader = io::ChunkClaimReader::open(destination);
    if (reader.is_error()) {
        return Err<void>(download_error(reader.error().message));
    }
    Hasher hasher;
    std::uint64_t verified = 0;
    while (true) {
        auto chunk = reader.value()->claim_chunk(config_.chunk_size);
        if (chunk.empty()) {
            break;
        }
        hasher.update(chunk);
        verified += chunk.size();
    }

    if (verified != current_->size || hasher.finish() != current_->hash) {
        std::error_code ec;
        fs::remove(destination, ec);
        return Err<void>(download_error("Hash mismatch for blob " + current_->hash.to_hex()));
    }

    store_.insert_file(current_->hash, destination, current_->size);
    emit(engine::ItemDone{current_->item_id});
    return Ok();
}

} // namespace drop::transport
