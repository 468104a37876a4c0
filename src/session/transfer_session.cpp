#include "drop/session/transfer_session.hpp"

#include "drop/events/events.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace drop::session {
namespace {

bool is_terminal(SessionState state) {
    return state == SessionState::Completed || state == SessionState::Cancelled || state == SessionState::Failed;
}

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Created, {SessionState::Negotiating, SessionState::Active}},
        {SessionState::Negotiating, {SessionState::Active}},
        {SessionState::Active, {SessionState::Completed}},
    };

    if (target == SessionState::Failed || target == SessionState::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

std::atomic<std::uint64_t> session_counter{0};

} // namespace

const char* session_state_name(SessionState state) noexcept {
    switch (state) {
        case SessionState::Created:     return "created";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Active:      return "active";
        case SessionState::Completed:   return "completed";
        case SessionState::Cancelled:   return "cancelled";
        case SessionState::Failed:      return "failed";
    }
    return "unknown";
}

const char* session_kind_name(SessionKind kind) noexcept {
    return kind == SessionKind::Send ? "send" : "receive";
}

std::string next_session_id(SessionKind kind) {
    return std::string(session_kind_name(kind)) + "-" + std::to_string(++session_counter);
}

TransferSession::TransferSession(std::string session_id, SessionKind kind, events::EventBus* bus)
    : session_id_(std::move(session_id))
    , kind_(kind)
    , bus_(bus) {
    info_.session_id = session_id_;
    info_.kind = kind_;
    info_.state = SessionState::Created;
    info_.created_at = std::chrono::system_clock::now();
}

SessionState TransferSession::state() const {
    std::lock_guard lock(mutex_);
    return info_.state;
}

SessionInfo TransferSession::info() const {
    std::lock_guard lock(mutex_);
    return info_;
}

void TransferSession::cancel() {
    {
        std::lock_guard lock(mutex_);
        if (is_terminal(info_.state)) {
            return;
        }
        token_.cancel();
        info_.state = SessionState::Cancelled;
        cancelled_.store(true);
    }

    on_cancel();
    publish_finished(SessionState::Cancelled, {});
}

Result<void> TransferSession::transition_to(SessionState next_state) {
    {
        std::lock_guard lock(mutex_);
        if (info_.state == next_state) {
            return Ok();
        }

        if (!can_transition(next_state)) {
            return Err<void>(make_error(ErrorKind::InvalidState,
                                        std::string("Illegal session state transition from ") +
                                        session_state_name(info_.state) + " to " +
                                        session_state_name(next_state)));
        }

        info_.state = next_state;
        if (next_state != SessionState::Failed) {
            info_.last_error.clear();
        }
        if (next_state == SessionState::Completed || next_state == SessionState::Failed) {
            finished_.store(true);
        }
        if (next_state == SessionState::Cancelled) {
            token_.cancel();
            cancelled_.store(true);
        }
    }

    if (next_state == SessionState::Active && bus_) {
        bus_->emit(events::SessionStartedEvent{session_id_, session_kind_name(kind_)});
    }
    if (is_terminal(next_state)) {
        std::string error_message;
        {
            std::lock_guard lock(mutex_);
            error_message = info_.last_error;
        }
        publish_finished(next_state, error_message);
    }
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    {
        std::lock_guard lock(mutex_);
        if (is_terminal(info_.state)) {
            return Err<void>(make_error(ErrorKind::InvalidState,
                                        std::string("Session already ") + session_state_name(info_.state)));
        }
        info_.last_error = std::move(error_message);
    }
    return transition_to(SessionState::Failed);
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (is_terminal(info_.state)) {
        return false;
    }

    return is_progressive(info_.state, target);
}

void TransferSession::publish_finished(SessionState state, const std::string& error_message) {
    if (!bus_) {
        return;
    }
    bus_->emit(events::SessionFinishedEvent{session_id_, session_kind_name(kind_),
                                            session_state_name(state), error_message});
}

} // namespace drop::session
