#include "drop/engine/local_engine.hpp"

#include "drop/collection/metadata.hpp"
#include "drop/ticket/ticket.hpp"
#include "drop/transport/fetcher.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace drop::engine {
namespace fs = std::filesystem;

namespace {

fs::path make_temp_store_dir(std::error_code& ec) {
    const fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return {};
    }

    std::random_device device;
    std::mt19937_64 generator(device());
    std::ostringstream name;
    name << "drop-store-" << std::hex << std::setw(16) << std::setfill('0') << generator();
    return base / name.str();
}

} // namespace

Result<std::unique_ptr<LocalEngine>> LocalEngine::create(const Config& config, events::EventBus& bus) {
    fs::path store_dir = config.store_dir;
    const bool owns_store_dir = store_dir.empty();
    if (owns_store_dir) {
        std::error_code ec;
        store_dir = make_temp_store_dir(ec);
        if (ec) {
            return Err<std::unique_ptr<LocalEngine>>(ErrorKind::NodeError,
                                                     "No temporary directory available: " + ec.message());
        }
    }

    std::error_code ec;
    fs::create_directories(store_dir, ec);
    if (ec) {
        return Err<std::unique_ptr<LocalEngine>>(ErrorKind::NodeError,
                                                 "Failed to create store directory " + store_dir.string() +
                                                 ": " + ec.message());
    }

    spdlog::debug("[Engine] Store at {}", store_dir.string());
    return Ok(std::make_unique<LocalEngine>(PrivateTag{}, config, bus, store_dir, owns_store_dir));
}

LocalEngine::LocalEngine(PrivateTag, const Config& config, events::EventBus& bus, fs::path store_dir,
                         bool owns_store_dir)
    : config_(config)
    , bus_(bus)
    , store_dir_(std::move(store_dir))
    , owns_store_dir_(owns_store_dir)
    , store_(store_dir_) {}

LocalEngine::~LocalEngine() {
    // Serving threads may call back into unshare() while they wind down
    transport::Provider* provider = nullptr;
    {
        std::lock_guard lock(provider_mutex_);
        provider = provider_.get();
    }
    if (provider) {
        provider->stop();
    }

    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    if (owns_store_dir_) {
        std::error_code ec;
        fs::remove_all(store_dir_, ec);
        if (ec) {
            spdlog::warn("[Engine] Failed to remove store directory {}: {}", store_dir_.string(), ec.message());
        }
    }
}

Result<transport::Provider*> LocalEngine::ensure_provider() {
    std::lock_guard lock(provider_mutex_);
    if (provider_) {
        return Ok(provider_.get());
    }

    auto provider = transport::Provider::create(io_context_, store_, bus_, config_);
    if (provider.is_error()) {
        return Err<transport::Provider*>(provider.error());
    }
    provider_ = std::move(provider.value());

    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    io_thread_ = std::thread([this]() {
        io_context_.run();
    });

    return Ok(provider_.get());
}

std::optional<std::uint16_t> LocalEngine::listening_port() const {
    std::lock_guard lock(provider_mutex_);
    if (!provider_) {
        return std::nullopt;
    }
    return provider_->port();
}

Result<Bytes> LocalEngine::read_to_bytes(const Hash& hash) const {
    return store_.read_to_bytes(hash);
}

Result<collection::Collection> LocalEngine::get_collection(const Hash& hash) const {
    return store_.get_collection(hash);
}

bool LocalEngine::has_blob(const Hash& hash) const {
    return store_.contains(hash);
}

Result<Hash> LocalEngine::import(const fs::path& path) {
    return store_.import_file(path, config_.chunk_size);
}

Result<Hash> LocalEngine::create_collection(const std::vector<std::pair<std::string, Hash>>& entries) {
    if (entries.empty()) {
        return Err<Hash>(ErrorKind::ImportError, "A collection needs at least one file");
    }

    std::vector<std::string> names;
    collection::HashSequence sequence;
    names.reserve(entries.size());
    sequence.reserve(entries.size() + 1);
    sequence.push_back(Hash{});  // Metadata hash, filled in below

    for (const auto& [name, hash] : entries) {
        if (!store_.contains(hash)) {
            return Err<Hash>(ErrorKind::ImportError, "File " + name + " has not been imported");
        }
        names.push_back(name);
        sequence.push_back(hash);
    }

    sequence.front() = store_.insert_bytes(collection::CollectionMetadata(std::move(names)).to_bytes());
    const Hash root = store_.insert_bytes(collection::encode_hash_sequence(sequence));

    spdlog::debug("[Engine] Created collection {} with {} files", root.to_hex(), entries.size());
    return Ok(root);
}

Result<std::string> LocalEngine::share(const Hash& collection_hash, std::uint8_t confirmation) {
    auto listing = store_.get_collection(collection_hash);
    if (listing.is_error()) {
        return Err<std::string>(ErrorKind::NodeError,
                                "Cannot share " + collection_hash.to_hex() + ": " + listing.error().message);
    }

    auto provider = ensure_provider();
    if (provider.is_error()) {
        return Err<std::string>(provider.error());
    }

    transport::PeerLocator locator;
    locator.host = config_.effective_advertise_address();
    locator.port = provider.value()->port();
    locator.collection = collection_hash;
    locator.format = transport::BlobFormat::HashSeq;

    std::string encoded = locator.encode();
    if (!ticket::is_valid_locator(encoded)) {
        return Err<std::string>(ErrorKind::NodeError,
                                "Advertised address '" + locator.host + "' does not fit in a ticket");
    }

    provider.value()->share(collection_hash, confirmation);
    spdlog::info("[Engine] Sharing {} ({} files) on port {}",
                 collection_hash.to_hex(), listing.value().size(), locator.port);
    return Ok(std::move(encoded));
}

void LocalEngine::unshare(const Hash& collection_hash) {
    transport::Provider* provider = nullptr;
    {
        std::lock_guard lock(provider_mutex_);
        provider = provider_.get();
    }
    if (provider) {
        provider->unshare(collection_hash);
    }
}

Result<std::unique_ptr<EventStream>> LocalEngine::download_hash_sequence(const Hash& collection_hash,
                                                                         const transport::PeerLocator& peer,
                                                                         std::uint8_t confirmation) {
    if (peer.format != transport::BlobFormat::HashSeq) {
        return Err<std::unique_ptr<EventStream>>(ErrorKind::UnsupportedFormat,
                                                 "Only hash sequence downloads are supported");
    }

    transport::PeerLocator target = peer;
    target.collection = collection_hash;

    auto stream = std::make_unique<transport::DownloadStream>(store_, std::move(target), confirmation, config_);
    stream->start();
    return Ok(std::unique_ptr<EventStream>(std::move(stream)));
}

Result<void> LocalEngine::export_blob(const Hash& hash, const fs::path& destination) {
    return store_.export_blob(hash, destination);
}

} // namespace drop::engine
