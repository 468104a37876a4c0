#pragma once

/**
 * @file node.hpp
 * @brief Entry point: one engine, one event bus, one logging component
 *
 * EXAMPLE:
 * auto node = drop::Node::create(config);
 * auto sender = node.value()->create_send_session();
 * auto ticket = sender->start({"/tmp/report.pdf"});
 *
 * Sessions keep references to the node's engine and bus; destroy them
 * before the node.
 */

#include "drop/core/config.hpp"
#include "drop/core/result.hpp"
#include "drop/engine/local_engine.hpp"
#include "drop/events/components.hpp"
#include "drop/events/event_bus.hpp"
#include "drop/session/receive_session.hpp"
#include "drop/session/send_session.hpp"

#include <memory>

namespace drop {

class Node {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Configure logging and create the engine
     *
     * NodeError when the engine's store directory cannot be created.
     */
    static Result<std::unique_ptr<Node>> create(Config config);

    Node(PrivateTag, Config config);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    std::shared_ptr<session::SendSession> create_send_session();
    std::unique_ptr<session::ReceiveSession> create_receive_session();

    engine::LocalEngine& engine() noexcept { return *engine_; }
    events::EventBus& bus() noexcept { return bus_; }
    const Config& config() const noexcept { return config_; }

private:
    Config config_;
    events::EventBus bus_;
    events::LoggerComponent logger_;
    std::unique_ptr<engine::LocalEngine> engine_;
};

} // namespace drop
