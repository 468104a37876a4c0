#pragma once

#include "drop/core/config.hpp"
#include "drop/core/hash.hpp"
#include "drop/engine/engine.hpp"
#include "drop/events/event_bus.hpp"
#include "drop/progress/channel.hpp"
#include "drop/session/transfer_session.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace drop::session {

struct ReceivedFile {
    std::string name;
    Hash hash;
    std::filesystem::path path;
    std::uint64_t size = 0;
};

/**
 * @brief Downloads the collection named by a ticket into a directory
 *
 * receive() runs on the calling thread:
 *   Negotiating: decode ticket and locator, check format, open the download
 *   Active:      reconcile events into snapshots until the stream ends
 *   then:        export every file to output_dir/<name>
 *
 * cancel() from another thread closes the download; receive() then returns
 * Cancelled and the session never reports Completed.
 */
class ReceiveSession : public TransferSession {
public:
    ReceiveSession(engine::TransferEngine& engine, const Config& config, events::EventBus* bus = nullptr);

    Result<std::vector<ReceivedFile>> receive(const std::string& ticket_text,
                                              const std::filesystem::path& output_dir,
                                              progress::ProgressChannel* progress = nullptr);

protected:
    void on_cancel() override;

private:
    Result<std::vector<ReceivedFile>> fail(Error error);
    Result<std::vector<ReceivedFile>> export_files(const collection::Collection& listing,
                                                   const std::filesystem::path& output_dir);

    engine::TransferEngine& engine_;
    Config config_;

    std::mutex stream_mutex_;
    std::unique_ptr<engine::EventStream> stream_;
};

} // namespace drop::session
