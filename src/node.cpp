#include "drop/node.hpp"

#include "drop/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace drop {

Result<std::unique_ptr<Node>> Node::create(Config config) {
    configure_logging(config);

    auto node = std::make_unique<Node>(PrivateTag{}, std::move(config));
    auto engine = engine::LocalEngine::create(node->config_, node->bus_);
    if (engine.is_error()) {
        return Err<std::unique_ptr<Node>>(engine.error());
    }
    node->engine_ = std::move(engine.value());

    spdlog::debug("[Node] Ready (bind {}, chunk size {}, {} serve workers)",
                  node->config_.bind_address, node->config_.chunk_size, node->config_.serve_workers);
    return Ok(std::move(node));
}

Node::Node(PrivateTag, Config config)
    : config_(std::move(config))
    , logger_(bus_) {}

std::shared_ptr<session::SendSession> Node::create_send_session() {
    return session::SendSession::create(*engine_, bus_, config_);
}

std::unique_ptr<session::ReceiveSession> Node::create_receive_session() {
    return std::make_unique<session::ReceiveSession>(*engine_, config_, &bus_);
}

} // namespace drop
