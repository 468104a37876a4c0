#include "drop/node.hpp"
#include "drop/progress/channel.hpp"
#include "drop/ticket/ticket.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using drop::ErrorKind;
using drop::Node;
using drop::progress::ProgressChannel;
using drop::progress::Snapshot;
using drop::session::SessionState;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("drop_loopback_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::string pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + 7) % 256);
    }
    return data;
}

drop::Config node_config() {
    drop::Config config;
    config.bind_address = "127.0.0.1";
    config.chunk_size = 16 * 1024;
    config.serve_workers = 3;
    config.poll_interval = std::chrono::milliseconds(10);
    config.log_level = "warn";
    return config;
}

std::vector<Snapshot> drain(ProgressChannel& channel) {
    std::vector<Snapshot> snapshots;
    while (auto snapshot = channel.try_receive()) {
        snapshots.push_back(std::move(*snapshot));
    }
    return snapshots;
}

} // namespace

class LoopbackTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir();
        fs::create_directories(dir_ / "outbox");

        auto sender = Node::create(node_config());
        ASSERT_TRUE(sender.is_ok()) << sender.error().to_string();
        sender_ = std::move(sender.value());

        auto receiver = Node::create(node_config());
        ASSERT_TRUE(receiver.is_ok()) << receiver.error().to_string();
        receiver_ = std::move(receiver.value());
    }

    void TearDown() override {
        receiver_.reset();
        sender_.reset();
        fs::remove_all(dir_);
    }

    fs::path dir_;
    std::unique_ptr<Node> sender_;
    std::unique_ptr<Node> receiver_;
};

TEST_F(LoopbackTransferTest, DeliversEveryFileWithItsName) {
    const std::string large = pattern(200 * 1024 + 123);
    const std::string small = "hello, drop";
    const auto first = write_file(dir_ / "outbox" / "large image.bin", large);
    const auto second = write_file(dir_ / "outbox" / "note.txt", small);
    const auto empty = write_file(dir_ / "outbox" / "empty.dat", "");

    ProgressChannel send_progress;
    auto send = sender_->create_send_session();
    auto ticket = send->start({first, second, empty}, &send_progress);
    ASSERT_TRUE(ticket.is_ok()) << ticket.error().to_string();
    EXPECT_TRUE(drop::ticket::is_valid_ticket(ticket.value().to_string()));
    EXPECT_EQ(send->state(), SessionState::Active);

    ProgressChannel receive_progress;
    auto receive = receiver_->create_receive_session();
    auto files = receive->receive(ticket.value().to_string(), dir_ / "inbox", &receive_progress);
    ASSERT_TRUE(files.is_ok()) << files.error().to_string();
    EXPECT_EQ(receive->state(), SessionState::Completed);
    EXPECT_TRUE(receive->is_finished());

    ASSERT_EQ(files.value().size(), 3u);
    EXPECT_EQ(files.value()[0].name, "large image.bin");
    EXPECT_EQ(files.value()[0].size, large.size());
    EXPECT_EQ(files.value()[2].name, "empty.dat");

    EXPECT_EQ(read_file(dir_ / "inbox" / "large image.bin"), large);
    EXPECT_EQ(read_file(dir_ / "inbox" / "note.txt"), small);
    EXPECT_TRUE(fs::exists(dir_ / "inbox" / "empty.dat"));
    EXPECT_EQ(fs::file_size(dir_ / "inbox" / "empty.dat"), 0u);

    const auto snapshots = drain(receive_progress);
    ASSERT_FALSE(snapshots.empty());
    const auto& last = snapshots.back();
    ASSERT_EQ(last.size(), 3u);
    for (const auto& file : last) {
        EXPECT_TRUE(file.complete()) << file.name;
    }

    auto sent = send->wait();
    ASSERT_TRUE(sent.is_ok()) << sent.error().to_string();
    EXPECT_EQ(send->state(), SessionState::Completed);
    for (const auto& file : send->snapshot()) {
        EXPECT_TRUE(file.complete()) << file.name;
    }
    EXPECT_FALSE(drain(send_progress).empty());
}

TEST_F(LoopbackTransferTest, WrongConfirmationIsRefused) {
    const auto file = write_file(dir_ / "outbox" / "secret.txt", "top secret");

    auto send = sender_->create_send_session();
    auto ticket = send->start({file});
    ASSERT_TRUE(ticket.is_ok()) << ticket.error().to_string();

    const auto forged = drop::ticket::encode(ticket.value().locator,
                                             static_cast<std::uint8_t>(ticket.value().confirmation + 1));

    auto receive = receiver_->create_receive_session();
    auto files = receive->receive(forged, dir_ / "inbox");
    ASSERT_TRUE(files.is_error());
    EXPECT_EQ(files.error().kind, ErrorKind::DownloadError);
    EXPECT_EQ(receive->state(), SessionState::Failed);
    EXPECT_FALSE(fs::exists(dir_ / "inbox" / "secret.txt"));

    send->cancel();
    EXPECT_EQ(send->wait().error().kind, ErrorKind::Cancelled);
}

TEST_F(LoopbackTransferTest, CancelledSenderStopsServing) {
    const auto file = write_file(dir_ / "outbox" / "data.bin", pattern(4096));

    auto send = sender_->create_send_session();
    auto ticket = send->start({file});
    ASSERT_TRUE(ticket.is_ok()) << ticket.error().to_string();

    send->cancel();
    EXPECT_TRUE(send->is_cancelled());

    auto receive = receiver_->create_receive_session();
    auto files = receive->receive(ticket.value().to_string(), dir_ / "inbox");
    ASSERT_TRUE(files.is_error());
    EXPECT_EQ(files.error().kind, ErrorKind::DownloadError);
}

TEST_F(LoopbackTransferTest, SenderRejectsBadFileListsBeforeSharing) {
    const auto file = write_file(dir_ / "outbox" / "a.txt", "a");
    fs::create_directories(dir_ / "other");
    const auto duplicate = write_file(dir_ / "other" / "a.txt", "different a");

    const std::vector<std::vector<fs::path>> bad_lists = {
        {},
        {dir_ / "outbox" / "missing.txt"},
        {dir_ / "outbox"},
        {file, duplicate},
    };

    for (const auto& paths : bad_lists) {
        auto send = sender_->create_send_session();
        auto ticket = send->start(paths);
        ASSERT_TRUE(ticket.is_error());
        EXPECT_EQ(ticket.error().kind, ErrorKind::ImportError);
        EXPECT_EQ(send->state(), SessionState::Failed);

        auto waited = send->wait();
        ASSERT_TRUE(waited.is_error());
        EXPECT_EQ(waited.error().kind, ErrorKind::ImportError);
    }
    EXPECT_FALSE(sender_->engine().listening_port().has_value());
}
