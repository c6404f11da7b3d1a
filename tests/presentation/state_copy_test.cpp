#include <gtest/gtest.h>
#include <liveview/presentation/state_copy.hpp>

#include <set>

namespace liveview::presentation::test {

using session::SessionState;

TEST(StateCopyTest, EveryStateHasDistinctTitle) {
    const SessionState states[] = {SessionState::Idle,       SessionState::Requesting, SessionState::Waiting,
                                   SessionState::Connecting, SessionState::Streaming,  SessionState::Ended,
                                   SessionState::Error};
    std::set<std::string_view> titles;
    for (auto state : states) {
        auto copy = copyFor(state);
        EXPECT_FALSE(copy.title.empty());
        EXPECT_FALSE(copy.description.empty());
        titles.insert(copy.title);
    }
    EXPECT_EQ(titles.size(), 7u);
}

TEST(StateCopyTest, KnownWording) {
    EXPECT_EQ(copyFor(SessionState::Idle).title, "Standby");
    EXPECT_EQ(copyFor(SessionState::Streaming).title, "Live");
    EXPECT_EQ(copyFor(SessionState::Waiting).description, "Agent desktop is preparing the live stream.");
    EXPECT_EQ(copyFor(SessionState::Error).description, "Unable to establish the live session.");
}

TEST(StateCopyTest, FeedLabelFallsBackToPosition) {
    session::Feed labelled{"t1", std::string("Left monitor"), nullptr};
    session::Feed unlabelled{"t2", std::nullopt, nullptr};
    session::Feed blank{"t3", std::string(""), nullptr};

    EXPECT_EQ(feedDisplayLabel(labelled, 0), "Left monitor");
    EXPECT_EQ(feedDisplayLabel(unlabelled, 1), "Screen 2");
    EXPECT_EQ(feedDisplayLabel(blank, 2), "Screen 3");
}

TEST(StateCopyTest, ErrorReplacesDescription) {
    session::SessionSnapshot snap;
    snap.state = SessionState::Error;
    snap.error = "connection timed out";

    auto text = describe(snap);
    EXPECT_EQ(text.title, "Error");
    EXPECT_EQ(text.body, "connection timed out");
}

TEST(StateCopyTest, DescribeWithoutError) {
    session::SessionSnapshot snap;
    snap.state = SessionState::Ended;

    auto text = describe(snap);
    EXPECT_EQ(text.title, "Session Ended");
    EXPECT_EQ(text.body, "The live stream has ended.");
}

} // namespace liveview::presentation::test
