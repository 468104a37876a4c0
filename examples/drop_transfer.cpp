#include "drop/core/config.hpp"
#include "drop/node.hpp"
#include "drop/progress/channel.hpp"
#include "drop/ticket/ticket.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::atomic<bool> g_interrupted{false};

void handle_signal(int) {
    g_interrupted.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [options] send <file>...\n"
              << "  " << program << " [options] receive <ticket> <output-dir>\n"
              << "\nOptions:\n"
              << "  -c, --config <file>   JSON configuration\n"
              << "  -b, --bind <address>  Address to listen on when sending\n"
              << "  -p, --port <port>     Port to listen on when sending\n";
}

std::string describe(const drop::progress::Snapshot& snapshot) {
    std::string line;
    for (const auto& file : snapshot) {
        if (!line.empty()) {
            line += "  ";
        }
        const auto percent = file.total == 0 ? 100 : file.transferred * 100 / file.total;
        line += file.name + " " + std::to_string(percent) + "%";
    }
    return line;
}

// Prints snapshots until the channel is closed and drained
std::thread start_progress_printer(drop::progress::ProgressChannel& channel) {
    return std::thread([&channel]() {
        while (auto snapshot = channel.receive()) {
            std::cerr << "\r" << describe(*snapshot) << std::flush;
        }
        std::cerr << std::endl;
    });
}

// Cancels the session once Ctrl+C was pressed; stops when done is set
std::thread start_interrupt_watcher(drop::session::TransferSession& session, const std::atomic<bool>& done) {
    return std::thread([&session, &done]() {
        while (!done.load()) {
            if (g_interrupted.load()) {
                spdlog::warn("Interrupted, cancelling {}", session.session_id());
                session.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
}

int run_send(drop::Node& node, const std::vector<fs::path>& paths) {
    auto session = node.create_send_session();
    drop::progress::ProgressChannel channel;

    auto ticket = session->start(paths, &channel);
    if (ticket.is_error()) {
        spdlog::error("{}", ticket.error().to_string());
        return 1;
    }

    std::cout << "Ticket: " << ticket.value().to_string() << "\n"
              << "Confirmation: " << static_cast<int>(ticket.value().confirmation) << std::endl;

    std::atomic<bool> done{false};
    auto printer = start_progress_printer(channel);
    auto watcher = start_interrupt_watcher(*session, done);

    auto result = session->wait();
    done.store(true);
    watcher.join();
    channel.close();
    printer.join();

    if (result.is_error()) {
        spdlog::error("{}", result.error().to_string());
        return result.error().kind == drop::ErrorKind::Cancelled ? 130 : 1;
    }
    spdlog::info("Transfer complete");
    return 0;
}

int run_receive(drop::Node& node, const std::string& ticket, const fs::path& output_dir) {
    if (!drop::ticket::is_valid_ticket(ticket)) {
        spdlog::error("Not a valid ticket: {}", ticket);
        return 1;
    }

    auto session = node.create_receive_session();
    drop::progress::ProgressChannel channel;

    std::atomic<bool> done{false};
    auto printer = start_progress_printer(channel);
    auto watcher = start_interrupt_watcher(*session, done);

    auto files = session->receive(ticket, output_dir, &channel);
    done.store(true);
    watcher.join();
    channel.close();
    printer.join();

    if (files.is_error()) {
        spdlog::error("{}", files.error().to_string());
        return files.error().kind == drop::ErrorKind::Cancelled ? 130 : 1;
    }

    json summary = json::array();
    for (const auto& file : files.value()) {
        summary.push_back({
            {"name", file.name},
            {"hash", file.hash.to_hex()},
            {"size", file.size},
            {"path", file.path.string()}
        });
    }
    std::cout << summary.dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    drop::Config config;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            auto loaded = drop::load_config(argv[++i]);
            if (loaded.is_error()) {
                std::cerr << loaded.error().to_string() << std::endl;
                return 1;
            }
            config = loaded.value();
        } else if ((arg == "-b" || arg == "--bind") && i + 1 < argc) {
            config.bind_address = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = static_cast<std::uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    drop::apply_env_overrides(config);

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto node = drop::Node::create(config);
    if (node.is_error()) {
        spdlog::error("{}", node.error().to_string());
        return 1;
    }

    const std::string& command = positional.front();
    if (command == "send" && positional.size() >= 2) {
        std::vector<fs::path> paths(positional.begin() + 1, positional.end());
        return run_send(*node.value(), paths);
    }
    if (command == "receive" && positional.size() == 3) {
        return run_receive(*node.value(), positional[1], positional[2]);
    }

    print_usage(argv[0]);
    return 1;
}
