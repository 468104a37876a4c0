#pragma once

#include "drop/core/cancellation.hpp"
#include "drop/core/result.hpp"
#include "drop/events/event_bus.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace drop::session {

enum class SessionState {
    Created,
    Negotiating,
    Active,
    Completed,
    Cancelled,
    Failed
};

enum class SessionKind {
    Send,
    Receive
};

const char* session_state_name(SessionState state) noexcept;
const char* session_kind_name(SessionKind kind) noexcept;

struct SessionInfo {
    std::string session_id;
    SessionKind kind = SessionKind::Send;
    SessionState state = SessionState::Created;
    std::chrono::system_clock::time_point created_at{};
    std::string last_error;
};

/**
 * @brief Lifecycle shared by send and receive sessions
 *
 * Created -> Negotiating -> Active -> {Completed | Cancelled | Failed}
 * A sender may go Created -> Active directly. Terminal states are final and
 * any state may move to Failed or Cancelled.
 *
 * All members are safe to call from any thread. cancel() sets the token
 * that the session's loops poll, then runs the subclass hook.
 */
class TransferSession {
public:
    virtual ~TransferSession() = default;

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] SessionKind kind() const noexcept { return kind_; }
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] SessionInfo info() const;

    /// Completed or Failed
    [[nodiscard]] bool is_finished() const noexcept { return finished_.load(); }
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Request cancellation; no-op once terminal
     */
    void cancel();

    [[nodiscard]] const CancellationToken& cancellation_token() const noexcept { return token_; }

protected:
    TransferSession(std::string session_id, SessionKind kind, events::EventBus* bus);

    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);

    /// Runs after the state has become Cancelled, outside the session lock
    virtual void on_cancel() {}

    events::EventBus* bus() const noexcept { return bus_; }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;
    void publish_finished(SessionState state, const std::string& error_message);

    const std::string session_id_;
    const SessionKind kind_;
    events::EventBus* bus_;

    mutable std::mutex mutex_;
    SessionInfo info_;
    CancellationToken token_;
    std::atomic<bool> finished_{false};
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Generate a process-unique id such as "send-3"
 */
std::string next_session_id(SessionKind kind);

} // namespace drop::session
