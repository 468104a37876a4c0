#pragma once

#include "drop/core/config.hpp"
#include "drop/engine/engine.hpp"
#include "drop/events/event_bus.hpp"
#include "drop/store/blob_store.hpp"
#include "drop/transport/provider.hpp"

#include <boost/asio.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace drop::engine {

/**
 * @brief TransferEngine backed by a BlobStore and a TCP provider
 *
 * The provider is started lazily on the first share(); until then the
 * engine opens no sockets, so receive-only nodes never listen.
 *
 * Threads:
 * - one io_context thread for async accept and request reads
 * - the provider's serving pool
 * - one thread per active DownloadStream
 *
 * When Config::store_dir is empty a private temporary directory is used
 * and removed on destruction.
 */
class LocalEngine : public TransferEngine {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static Result<std::unique_ptr<LocalEngine>> create(const Config& config, events::EventBus& bus);

    LocalEngine(PrivateTag, const Config& config, events::EventBus& bus, std::filesystem::path store_dir,
                bool owns_store_dir);

    ~LocalEngine() override;

    LocalEngine(const LocalEngine&) = delete;
    LocalEngine& operator=(const LocalEngine&) = delete;

    // BlobSource
    Result<Bytes> read_to_bytes(const Hash& hash) const override;
    Result<collection::Collection> get_collection(const Hash& hash) const override;
    bool has_blob(const Hash& hash) const override;

    // TransferEngine
    Result<Hash> import(const std::filesystem::path& path) override;
    Result<Hash> create_collection(const std::vector<std::pair<std::string, Hash>>& entries) override;
    Result<std::string> share(const Hash& collection_hash, std::uint8_t confirmation) override;
    void unshare(const Hash& collection_hash) override;
    Result<std::unique_ptr<EventStream>> download_hash_sequence(const Hash& collection_hash,
                                                                const transport::PeerLocator& peer,
                                                                std::uint8_t confirmation) override;
    Result<void> export_blob(const Hash& hash, const std::filesystem::path& destination) override;

    /**
     * @brief Listening port, nullopt until the provider has started
     */
    std::optional<std::uint16_t> listening_port() const;

    store::BlobStore& store() noexcept { return store_; }

private:
    Result<transport::Provider*> ensure_provider();

    Config config_;
    events::EventBus& bus_;
    std::filesystem::path store_dir_;
    bool owns_store_dir_;
    store::BlobStore store_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;

    mutable std::mutex provider_mutex_;
    std::unique_ptr<transport::Provider> provider_;
};

} // namespace drop::engine
