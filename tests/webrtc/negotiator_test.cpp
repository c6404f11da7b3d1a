#include <gtest/gtest.h>
#include <liveview/webrtc/negotiator.hpp>

#include "support/fake_peer_connection.hpp"

namespace liveview::webrtc::test {

using liveview::test::FakeMediaTrack;
using liveview::test::FakePeerConnection;

class NegotiatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pc = std::make_unique<FakePeerConnection>();
        pc_ = pc.get();
        negotiator_ = std::make_unique<Negotiator>(loop_, std::move(pc));
    }

    static IceCandidate candidate(const std::string& id, const std::string& text) {
        return IceCandidate{id, text, std::string("0"), 0};
    }

    core::EventLoop loop_;
    FakePeerConnection* pc_ = nullptr;
    std::unique_ptr<Negotiator> negotiator_;
};

TEST_F(NegotiatorTest, RequiresConnection) {
    EXPECT_THROW({ Negotiator broken(loop_, nullptr); }, core::NegotiationError);
}

TEST_F(NegotiatorTest, AnswerRequiresRemoteOffer) {
    EXPECT_THROW(negotiator_->createAnswer(), core::NegotiationError);

    negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"});
    auto answer = negotiator_->createAnswer();
    EXPECT_EQ(answer.type, SdpType::Answer);
    EXPECT_FALSE(answer.sdp.empty());
    EXPECT_EQ(pc_->record().answers, 1);
}

TEST_F(NegotiatorTest, RemoteDescriptionFailuresThrow) {
    EXPECT_THROW(negotiator_->applyRemoteDescription({SdpType::Offer, ""}), core::NegotiationError);

    pc_->fail_remote_description = true;
    EXPECT_THROW(negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"}), core::NegotiationError);
    EXPECT_FALSE(negotiator_->hasRemoteDescription());
}

TEST_F(NegotiatorTest, BackendFailuresBecomeNegotiationErrors) {
    pc_->fail_offer = true;
    EXPECT_THROW(negotiator_->createOffer(), core::NegotiationError);

    negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"});
    pc_->fail_answer = true;
    EXPECT_THROW(negotiator_->createAnswer(), core::NegotiationError);
}

// Kandidat remote ditahan sampai remote description terpasang
TEST_F(NegotiatorTest, EarlyRemoteCandidatesAreBuffered) {
    negotiator_->addRemoteCandidate(candidate("c1", "candidate:1"));
    negotiator_->addRemoteCandidate(candidate("c2", "candidate:2"));
    EXPECT_EQ(negotiator_->pendingRemoteCandidates(), 2u);
    EXPECT_TRUE(pc_->record().remote_candidates.empty());

    negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"});
    EXPECT_EQ(negotiator_->pendingRemoteCandidates(), 0u);
    ASSERT_EQ(pc_->record().remote_candidates.size(), 2u);
    EXPECT_EQ(pc_->record().remote_candidates[0].id, "c1");
    EXPECT_EQ(pc_->record().remote_candidates[1].id, "c2");
}

TEST_F(NegotiatorTest, DuplicateCandidateIdsDropped) {
    negotiator_->addRemoteCandidate(candidate("c1", "candidate:1"));
    negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"});
    negotiator_->addRemoteCandidate(candidate("c1", "candidate:1"));
    negotiator_->addRemoteCandidate(candidate("c2", "candidate:2"));
    negotiator_->addRemoteCandidate(candidate("c2", "candidate:2"));

    EXPECT_EQ(pc_->record().remote_candidates.size(), 2u);
}

TEST_F(NegotiatorTest, RejectedCandidateIsNotFatal) {
    negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"});
    pc_->reject_candidate = "candidate:bad";

    EXPECT_NO_THROW(negotiator_->addRemoteCandidate(candidate("x", "candidate:bad")));
    negotiator_->addRemoteCandidate(candidate("y", "candidate:good"));
    ASSERT_EQ(pc_->record().remote_candidates.size(), 1u);
    EXPECT_EQ(pc_->record().remote_candidates[0].id, "y");
}

TEST_F(NegotiatorTest, LocalCandidatesWaitForRemoteDescription) {
    std::vector<std::string> sent;
    negotiator_->onLocalCandidate([&](const IceCandidate& c) { sent.push_back(c.candidate); });

    pc_->simulateLocalCandidate("candidate:local-1");
    loop_.processAll();
    EXPECT_TRUE(sent.empty());
    EXPECT_EQ(negotiator_->pendingLocalCandidates(), 1u);

    negotiator_->applyRemoteDescription({SdpType::Offer, "v=0\r\n"});
    EXPECT_EQ(sent, (std::vector<std::string>{"candidate:local-1"}));

    pc_->simulateLocalCandidate("candidate:local-2");
    loop_.processAll();
    EXPECT_EQ(sent.size(), 2u);
}

TEST_F(NegotiatorTest, CallbacksDeliveredOnLoopInOrder) {
    std::vector<std::string> events;
    negotiator_->onTrack([&](MediaTrackPtr, const std::string& id) { events.push_back("track:" + id); });
    negotiator_->onTrackEnded([&](const std::string& id) { events.push_back("ended:" + id); });
    negotiator_->onStateChange([&](PeerConnectionState s) { events.push_back(peerConnectionStateString(s)); });

    pc_->simulateTrack(std::make_shared<FakeMediaTrack>("t1"));
    pc_->simulateState(PeerConnectionState::Connected);
    pc_->simulateTrackEnded("t1");
    EXPECT_TRUE(events.empty());

    loop_.processAll();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], "track:t1");
    EXPECT_EQ(events[1], peerConnectionStateString(PeerConnectionState::Connected));
    EXPECT_EQ(events[2], "ended:t1");
}

TEST_F(NegotiatorTest, NothingDeliveredAfterClose) {
    int callbacks = 0;
    negotiator_->onTrack([&](MediaTrackPtr, const std::string&) { ++callbacks; });
    negotiator_->onStateChange([&](PeerConnectionState) { ++callbacks; });

    // Sudah antri di loop sebelum close
    pc_->simulateTrack(std::make_shared<FakeMediaTrack>("t1"));
    negotiator_->close();
    negotiator_->close();
    pc_->simulateState(PeerConnectionState::Failed);
    loop_.processAll();

    EXPECT_EQ(callbacks, 0);
    EXPECT_TRUE(negotiator_->isClosed());
    EXPECT_EQ(pc_->record().closes, 1);
    EXPECT_THROW(negotiator_->createOffer(), core::NegotiationError);
    EXPECT_NO_THROW(negotiator_->addRemoteCandidate(candidate("c9", "candidate:9")));
}

} // namespace liveview::webrtc::test
