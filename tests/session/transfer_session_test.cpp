#include "drop/session/transfer_session.hpp"

#include "drop/events/event_bus.hpp"
#include "drop/events/events.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using drop::ErrorKind;
using drop::session::SessionKind;
using drop::session::SessionState;
using drop::session::TransferSession;

namespace {

class TestSession : public TransferSession {
public:
    explicit TestSession(drop::events::EventBus* bus = nullptr)
        : TransferSession(drop::session::next_session_id(SessionKind::Receive), SessionKind::Receive, bus) {}

    using TransferSession::mark_failed;
    using TransferSession::transition_to;

    int cancel_hook_calls = 0;

protected:
    void on_cancel() override { ++cancel_hook_calls; }
};

} // namespace

TEST(TransferSessionTest, StartsCreatedWithUniqueIds) {
    TestSession first;
    TestSession second;

    EXPECT_EQ(first.state(), SessionState::Created);
    EXPECT_NE(first.session_id(), second.session_id());
    EXPECT_EQ(first.session_id().rfind("receive-", 0), 0u);
    EXPECT_FALSE(first.is_finished());
    EXPECT_FALSE(first.is_cancelled());
}

TEST(TransferSessionTest, EnforcesTransitionOrder) {
    TestSession session;

    EXPECT_TRUE(session.transition_to(SessionState::Negotiating).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Active).is_ok());

    auto backwards = session.transition_to(SessionState::Negotiating);
    ASSERT_TRUE(backwards.is_error());
    EXPECT_EQ(backwards.error().kind, ErrorKind::InvalidState);

    EXPECT_TRUE(session.transition_to(SessionState::Completed).is_ok());
    EXPECT_TRUE(session.is_finished());

    EXPECT_TRUE(session.transition_to(SessionState::Failed).is_error());
    EXPECT_EQ(session.state(), SessionState::Completed);
}

TEST(TransferSessionTest, CreatedCannotJumpToCompleted) {
    TestSession session;
    EXPECT_TRUE(session.transition_to(SessionState::Completed).is_error());
    EXPECT_TRUE(session.transition_to(SessionState::Active).is_ok());
}

TEST(TransferSessionTest, FailureRecordsErrorAndIsFinal) {
    TestSession session;
    ASSERT_TRUE(session.transition_to(SessionState::Negotiating).is_ok());

    ASSERT_TRUE(session.mark_failed("connection refused").is_ok());
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.info().last_error, "connection refused");
    EXPECT_TRUE(session.is_finished());

    EXPECT_TRUE(session.transition_to(SessionState::Failed).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Active).is_error());
    EXPECT_TRUE(session.mark_failed("again").is_error());

    session.cancel();
    EXPECT_FALSE(session.is_cancelled());
    EXPECT_EQ(session.cancel_hook_calls, 0);
}

TEST(TransferSessionTest, CancelIsIdempotentAndSticky) {
    TestSession session;
    ASSERT_TRUE(session.transition_to(SessionState::Active).is_ok());

    session.cancel();
    session.cancel();

    EXPECT_EQ(session.state(), SessionState::Cancelled);
    EXPECT_TRUE(session.is_cancelled());
    EXPECT_TRUE(session.cancellation_token().is_cancelled());
    EXPECT_EQ(session.cancel_hook_calls, 1);

    EXPECT_TRUE(session.transition_to(SessionState::Completed).is_error());
    EXPECT_TRUE(session.is_cancelled());
}

TEST(TransferSessionTest, PublishesLifecycleEvents) {
    drop::events::EventBus bus;
    std::vector<std::string> started;
    std::vector<std::string> finished;

    bus.subscribe<drop::events::SessionStartedEvent>([&](const drop::events::SessionStartedEvent& e) {
        started.push_back(e.kind);
    });
    bus.subscribe<drop::events::SessionFinishedEvent>([&](const drop::events::SessionFinishedEvent& e) {
        finished.push_back(e.state + ":" + e.error_message);
    });

    TestSession completed(&bus);
    ASSERT_TRUE(completed.transition_to(SessionState::Active).is_ok());
    ASSERT_TRUE(completed.transition_to(SessionState::Completed).is_ok());

    TestSession failed(&bus);
    ASSERT_TRUE(failed.mark_failed("boom").is_ok());

    TestSession cancelled(&bus);
    cancelled.cancel();

    EXPECT_EQ(started, (std::vector<std::string>{"receive"}));
    EXPECT_EQ(finished, (std::vector<std::string>{"completed:", "failed:boom", "cancelled:"}));
}

TEST(TransferSessionTest, StateNamesAreLowercase) {
    EXPECT_STREQ(drop::session::session_state_name(SessionState::Negotiating), "negotiating");
    EXPECT_STREQ(drop::session::session_kind_name(SessionKind::Send), "send");
}
