#include <gtest/gtest.h>
#include <liveview/session/session_machine.hpp>
#include <liveview/signaling/memory_channel.hpp>

#include "support/fake_peer_connection.hpp"

namespace liveview::session::test {

using namespace std::chrono_literals;
using liveview::test::FakeMediaTrack;
using liveview::test::FakePeerConnection;
using signaling::MessageKind;
using signaling::Side;
using signaling::SignalingMessage;

class SessionMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<core::ManualClock>();
        loop_ = std::make_unique<core::EventLoop>(clock_);
        hub_ = std::make_unique<signaling::InMemorySignalingHub>(*loop_);
        agent_ = hub_->endpoint(Side::Agent);

        options_.request_timeout = 1000ms;
        options_.connection_timeout = 5000ms;
    }

    webrtc::PeerConnectionFactory factory() {
        return [this](const webrtc::IceConfiguration& ice) -> std::unique_ptr<webrtc::PeerConnection> {
            auto record = std::make_shared<FakePeerConnection::Record>();
            record->ice = ice;
            records_.push_back(record);
            auto pc = std::make_unique<FakePeerConnection>(record);
            pc_ = pc.get();
            return pc;
        };
    }

    void start() {
        machine_ = SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), factory(), options_, "agent-1");
        machine_->setObserver([this](const SessionSnapshot& s) { published_.push_back(s); });
        machine_->start();
        loop_->processAll();
    }

    void agentSends(const SignalingMessage& message) {
        ASSERT_TRUE(agent_->send(machine_->sessionId(), message).is_ok());
        loop_->processAll();
    }

    // Sampai offer dari agent sudah dijawab
    void negotiate() {
        start();
        agentSends(SignalingMessage::accepted(sid()));
        agentSends(SignalingMessage::offer(sid(), "v=0\r\ns=agent\r\n"));
        ASSERT_EQ(machine_->state(), SessionState::Connecting);
    }

    std::shared_ptr<FakeMediaTrack> arrive(const std::string& id) {
        auto track = std::make_shared<FakeMediaTrack>(id);
        pc_->simulateTrack(track);
        loop_->processAll();
        return track;
    }

    void connect() {
        pc_->simulateState(webrtc::PeerConnectionState::Connected);
        loop_->processAll();
    }

    std::vector<SignalingMessage> viewerSent(MessageKind kind) const {
        std::vector<SignalingMessage> out;
        for (const auto& m : hub_->sentBy(Side::Viewer)) {
            if (m.kind == kind) out.push_back(m);
        }
        return out;
    }

    std::string sid() const { return machine_->sessionId(); }

    std::shared_ptr<core::ManualClock> clock_;
    std::unique_ptr<core::EventLoop> loop_;
    std::unique_ptr<signaling::InMemorySignalingHub> hub_;
    std::shared_ptr<signaling::SignalingChannel> agent_;
    SessionOptions options_;

    std::shared_ptr<SessionMachine> machine_;
    std::vector<SessionSnapshot> published_;
    std::vector<std::shared_ptr<FakePeerConnection::Record>> records_;
    // Valid only until the session disposes its negotiator
    FakePeerConnection* pc_ = nullptr;
};

TEST_F(SessionMachineTest, StartsIdle) {
    machine_ = SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), factory(), options_, "agent-1");
    EXPECT_EQ(machine_->state(), SessionState::Idle);
    EXPECT_EQ(machine_->snapshot().state, SessionState::Idle);
    EXPECT_EQ(machine_->snapshot().agent_id, "agent-1");
    EXPECT_TRUE(hub_->sentBy(Side::Viewer).empty());
}

TEST_F(SessionMachineTest, StartSendsRequest) {
    options_.viewer_id = "sup-1";
    options_.viewer_display_name = "Dana";
    start();

    EXPECT_EQ(machine_->state(), SessionState::Requesting);
    EXPECT_EQ(hub_->subscriberCount(Side::Viewer, sid()), 1u);

    auto requests = viewerSent(MessageKind::Request);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].session_id, sid());
    EXPECT_EQ(requests[0].agent_id, "agent-1");
    EXPECT_EQ(requests[0].viewer_id, "sup-1");
    EXPECT_EQ(requests[0].viewer_display_name, "Dana");
}

TEST_F(SessionMachineTest, StreamingHappyPath) {
    negotiate();
    auto t1 = arrive("t1");
    connect();

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Streaming);
    ASSERT_EQ(snap.feeds.size(), 1u);
    EXPECT_EQ(snap.feeds[0].feed_id, "t1");
    EXPECT_FALSE(snap.feeds[0].label.has_value());
    EXPECT_EQ(snap.feeds[0].track, t1);
    EXPECT_FALSE(snap.error.has_value());

    ASSERT_EQ(viewerSent(MessageKind::Answer).size(), 1u);
    EXPECT_FALSE(viewerSent(MessageKind::Answer)[0].sdp.empty());
    ASSERT_EQ(records_.size(), 1u);
    ASSERT_EQ(records_[0]->remote_descriptions.size(), 1u);
    EXPECT_EQ(records_[0]->remote_descriptions[0].type, webrtc::SdpType::Offer);

    std::vector<SessionState> states;
    for (const auto& s : published_) states.push_back(s.state);
    EXPECT_EQ(states, (std::vector<SessionState>{SessionState::Requesting, SessionState::Waiting,
                                                 SessionState::Connecting, SessionState::Connecting,
                                                 SessionState::Streaming}));
}

TEST_F(SessionMachineTest, IceConfigurationReachesBackend) {
    options_.ice.transport_policy = webrtc::IceTransportPolicy::Relay;
    start();
    agentSends(SignalingMessage::accepted(sid()));

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0]->ice.transport_policy, webrtc::IceTransportPolicy::Relay);
}

TEST_F(SessionMachineTest, RejectedDisposesSubscription) {
    start();
    agentSends(SignalingMessage::rejected(sid(), std::string("busy")));

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Error);
    EXPECT_EQ(snap.error, "request rejected");
    EXPECT_EQ(snap.error_code, core::ErrorCode::RequestRejected);
    EXPECT_EQ(hub_->subscriberCount(Side::Viewer, sid()), 0u);
    EXPECT_TRUE(viewerSent(MessageKind::End).empty());

    // Tidak ada perubahan setelah terminal
    const auto published = published_.size();
    agentSends(SignalingMessage::accepted(sid()));
    agentSends(SignalingMessage::offer(sid(), "v=0\r\n"));
    EXPECT_EQ(machine_->state(), SessionState::Error);
    EXPECT_EQ(published_.size(), published);
    EXPECT_TRUE(records_.empty());
}

TEST_F(SessionMachineTest, RequestTimeout) {
    start();
    clock_->advance(999ms);
    loop_->processAll();
    EXPECT_EQ(machine_->state(), SessionState::Requesting);

    clock_->advance(1ms);
    loop_->processAll();
    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Error);
    EXPECT_EQ(snap.error, "no response from agent");
    EXPECT_EQ(snap.error_code, core::ErrorCode::RequestTimeout);

    auto ends = viewerSent(MessageKind::End);
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].reason, signaling::end_reason::Expired);
    EXPECT_EQ(hub_->subscriberCount(Side::Viewer, sid()), 0u);
}

TEST_F(SessionMachineTest, AcceptedCancelsRequestTimer) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    clock_->advance(1500ms);
    loop_->processAll();
    EXPECT_EQ(machine_->state(), SessionState::Waiting);
}

TEST_F(SessionMachineTest, ConnectionTimeoutReleasesResources) {
    negotiate();
    auto t1 = arrive("t1");

    clock_->advance(5000ms);
    loop_->processAll();

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Error);
    EXPECT_EQ(snap.error, "connection timed out");
    EXPECT_TRUE(snap.feeds.empty());
    EXPECT_TRUE(t1->stopped());
    EXPECT_EQ(records_[0]->closes, 1);
    EXPECT_EQ(hub_->subscriberCount(Side::Viewer, sid()), 0u);
    EXPECT_EQ(loop_->pendingTimers(), 0u);
    ASSERT_EQ(viewerSent(MessageKind::End).size(), 1u);
    EXPECT_EQ(viewerSent(MessageKind::End)[0].reason, signaling::end_reason::Expired);
}

// Offer yang tidak pernah datang juga dibatasi timer koneksi
TEST_F(SessionMachineTest, ConnectionTimeoutWhileWaitingForOffer) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    clock_->advance(5000ms);
    loop_->processAll();

    EXPECT_EQ(machine_->snapshot().error, "connection timed out");
    EXPECT_EQ(records_[0]->closes, 1);
}

TEST_F(SessionMachineTest, ConnectedCancelsConnectionTimer) {
    negotiate();
    connect();
    EXPECT_EQ(loop_->pendingTimers(), 0u);

    clock_->advance(60s);
    loop_->processAll();
    EXPECT_EQ(machine_->state(), SessionState::Streaming);
}

TEST_F(SessionMachineTest, FailureWhileStreamingStopsTracks) {
    negotiate();
    auto t1 = arrive("t1");
    auto t2 = arrive("t2");
    connect();

    pc_->simulateState(webrtc::PeerConnectionState::Failed);
    loop_->processAll();

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Error);
    EXPECT_EQ(snap.error, "connection lost");
    EXPECT_EQ(snap.error_code, core::ErrorCode::ConnectionLost);
    EXPECT_TRUE(t1->stopped());
    EXPECT_TRUE(t2->stopped());
    EXPECT_TRUE(snap.feeds.empty());
    ASSERT_EQ(viewerSent(MessageKind::End).size(), 1u);
    EXPECT_EQ(viewerSent(MessageKind::End)[0].reason, signaling::end_reason::Error);
}

TEST_F(SessionMachineTest, DisconnectedIsTransient) {
    negotiate();
    connect();
    pc_->simulateState(webrtc::PeerConnectionState::Disconnected);
    loop_->processAll();
    EXPECT_EQ(machine_->state(), SessionState::Streaming);
}

TEST_F(SessionMachineTest, EndIsIdempotent) {
    negotiate();
    auto t1 = arrive("t1");
    connect();

    machine_->end();
    const auto published = published_.size();
    EXPECT_NO_THROW(machine_->end());
    loop_->processAll();

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Ended);
    EXPECT_EQ(snap.end_reason, signaling::end_reason::ViewerClosed);
    EXPECT_TRUE(machine_->disposed());
    EXPECT_TRUE(t1->stopped());
    EXPECT_EQ(t1->stopCalls(), 1);
    EXPECT_EQ(records_[0]->closes, 1);
    EXPECT_EQ(published_.size(), published);

    auto ends = viewerSent(MessageKind::End);
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].reason, signaling::end_reason::ViewerClosed);
}

TEST_F(SessionMachineTest, EndBeforeStartSendsNothing) {
    machine_ = SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), factory(), options_, "agent-1");
    machine_->end();
    machine_->end();

    EXPECT_EQ(machine_->state(), SessionState::Ended);
    EXPECT_TRUE(hub_->sentBy(Side::Viewer).empty());

    machine_->start();
    EXPECT_EQ(machine_->state(), SessionState::Ended);
}

TEST_F(SessionMachineTest, EndWhileRequestingCancelsTimer) {
    start();
    machine_->end();

    EXPECT_EQ(machine_->state(), SessionState::Ended);
    EXPECT_EQ(loop_->pendingTimers(), 0u);
    EXPECT_EQ(hub_->subscriberCount(Side::Viewer, sid()), 0u);
    ASSERT_EQ(viewerSent(MessageKind::End).size(), 1u);
}

TEST_F(SessionMachineTest, RemoteEndWhileStreaming) {
    negotiate();
    auto t1 = arrive("t1");
    connect();

    agentSends(SignalingMessage::end(sid(), signaling::end_reason::AgentClosed));

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Ended);
    EXPECT_EQ(snap.end_reason, "agent_closed");
    EXPECT_FALSE(snap.error.has_value());
    EXPECT_TRUE(t1->stopped());
    EXPECT_TRUE(viewerSent(MessageKind::End).empty());

    // end() setelahnya tidak berpengaruh
    machine_->end();
    EXPECT_EQ(machine_->snapshot().end_reason, "agent_closed");
}

TEST_F(SessionMachineTest, RemoteEndWhileWaiting) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    ASSERT_TRUE(hub_->injectRaw(Side::Agent, R"({"type":"end","sessionId":")" + sid() + R"("})").is_ok());
    loop_->processAll();

    EXPECT_EQ(machine_->state(), SessionState::Ended);
    EXPECT_EQ(machine_->snapshot().end_reason, signaling::end_reason::AgentClosed);
    EXPECT_EQ(records_[0]->closes, 1);
}

TEST_F(SessionMachineTest, FeedMetaBeforeTrack) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    agentSends(SignalingMessage::feedMeta(sid(), "t2", std::string("Right monitor")));
    agentSends(SignalingMessage::offer(sid(), "v=0\r\n"));

    arrive("t1");
    arrive("t2");
    agentSends(SignalingMessage::feedMeta(sid(), "t1", std::string("Left monitor")));
    connect();

    auto feeds = machine_->snapshot().feeds;
    ASSERT_EQ(feeds.size(), 2u);
    EXPECT_EQ(feeds[0].feed_id, "t1");
    EXPECT_EQ(feeds[0].label, "Left monitor");
    EXPECT_EQ(feeds[1].feed_id, "t2");
    EXPECT_EQ(feeds[1].label, "Right monitor");
}

TEST_F(SessionMachineTest, DuplicateTracksDeduplicated) {
    negotiate();
    auto first = arrive("t1");
    auto second = arrive("t1");

    auto feeds = machine_->snapshot().feeds;
    ASSERT_EQ(feeds.size(), 1u);
    EXPECT_EQ(feeds[0].track, first);
    EXPECT_FALSE(first->stopped());
}

TEST_F(SessionMachineTest, TrackEndRemovesFeed) {
    negotiate();
    auto t1 = arrive("t1");
    arrive("t2");
    connect();

    pc_->simulateTrackEnded("t1");
    loop_->processAll();

    auto feeds = machine_->snapshot().feeds;
    ASSERT_EQ(feeds.size(), 1u);
    EXPECT_EQ(feeds[0].feed_id, "t2");
    EXPECT_TRUE(t1->stopped());
    EXPECT_EQ(machine_->state(), SessionState::Streaming);
}

TEST_F(SessionMachineTest, RemoteCandidatesBufferedAndDeduplicated) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    webrtc::IceCandidate c{"c1", "candidate:1 1 UDP 1 10.0.0.2 9 typ host", std::string("0"), 0};
    agentSends(SignalingMessage::iceCandidate(sid(), c));
    agentSends(SignalingMessage::iceCandidate(sid(), c));
    EXPECT_TRUE(records_[0]->remote_candidates.empty());

    agentSends(SignalingMessage::offer(sid(), "v=0\r\n"));
    agentSends(SignalingMessage::iceCandidate(sid(), c));
    ASSERT_EQ(records_[0]->remote_candidates.size(), 1u);
    EXPECT_EQ(records_[0]->remote_candidates[0].id, "c1");
}

TEST_F(SessionMachineTest, LocalCandidatesSentWithFreshIds) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    pc_->simulateLocalCandidate("candidate:early");
    loop_->processAll();
    EXPECT_TRUE(viewerSent(MessageKind::IceCandidate).empty());

    agentSends(SignalingMessage::offer(sid(), "v=0\r\n"));
    pc_->simulateLocalCandidate("candidate:late");
    loop_->processAll();

    auto sent = viewerSent(MessageKind::IceCandidate);
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].candidate->candidate, "candidate:early");
    EXPECT_EQ(sent[1].candidate->candidate, "candidate:late");
    EXPECT_EQ(sent[0].candidate->id.rfind("cand-", 0), 0u);
    EXPECT_NE(sent[0].candidate->id, sent[1].candidate->id);
}

TEST_F(SessionMachineTest, NegotiationFailure) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    pc_->fail_remote_description = true;
    agentSends(SignalingMessage::offer(sid(), "v=0\r\n"));

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Error);
    EXPECT_EQ(snap.error, "unable to negotiate the live stream");
    EXPECT_EQ(snap.error_code, core::ErrorCode::NegotiationError);
    EXPECT_EQ(records_[0]->closes, 1);
    ASSERT_EQ(viewerSent(MessageKind::End).size(), 1u);
    EXPECT_EQ(viewerSent(MessageKind::End)[0].reason, signaling::end_reason::Error);
}

TEST_F(SessionMachineTest, UnexpectedAnswerIgnored) {
    start();
    agentSends(SignalingMessage::accepted(sid()));
    agentSends(SignalingMessage::answer(sid(), "v=0\r\n"));
    EXPECT_EQ(machine_->state(), SessionState::Waiting);
    EXPECT_TRUE(records_[0]->remote_descriptions.empty());
}

TEST_F(SessionMachineTest, MalformedAndForeignMessagesIgnored) {
    start();
    EXPECT_TRUE(hub_->injectRaw(Side::Agent, R"({"type":"accepted"})").is_error());
    EXPECT_TRUE(hub_->injectRaw(Side::Agent, "garbage").is_error());
    loop_->processAll();
    EXPECT_EQ(machine_->state(), SessionState::Requesting);

    auto foreign = SessionEvent::fromMessage(SignalingMessage::accepted("someone-else"));
    ASSERT_TRUE(foreign.has_value());
    machine_->dispatch(*foreign);
    EXPECT_EQ(machine_->state(), SessionState::Requesting);

    // Agent tidak pernah mengirim request
    EXPECT_FALSE(SessionEvent::fromMessage(SignalingMessage::request(sid(), "agent-1")).has_value());
}

TEST_F(SessionMachineTest, ViewerInitiatedOffer) {
    options_.viewer_initiates_offer = true;
    start();
    agentSends(SignalingMessage::accepted(sid()));

    auto offers = viewerSent(MessageKind::Offer);
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(records_[0]->offers, 1);

    // Agent tidak boleh ikut mengirim offer
    agentSends(SignalingMessage::offer(sid(), "v=0\r\n"));
    EXPECT_EQ(machine_->state(), SessionState::Waiting);

    agentSends(SignalingMessage::answer(sid(), "v=0\r\ns=agent-answer\r\n"));
    EXPECT_EQ(machine_->state(), SessionState::Connecting);
    ASSERT_EQ(records_[0]->remote_descriptions.size(), 1u);
    EXPECT_EQ(records_[0]->remote_descriptions[0].type, webrtc::SdpType::Answer);
    EXPECT_TRUE(viewerSent(MessageKind::Answer).empty());

    arrive("0");
    connect();
    EXPECT_EQ(machine_->state(), SessionState::Streaming);
}

TEST_F(SessionMachineTest, ViewerOfferFailure) {
    options_.viewer_initiates_offer = true;
    webrtc::PeerConnectionFactory failing = [this](const webrtc::IceConfiguration& ice) {
        auto pc = factory()(ice);
        static_cast<FakePeerConnection*>(pc.get())->fail_offer = true;
        return pc;
    };
    machine_ = SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), failing, options_, "agent-1");
    machine_->start();
    loop_->processAll();
    agentSends(SignalingMessage::accepted(sid()));

    EXPECT_EQ(machine_->snapshot().error, "unable to negotiate the live stream");
}

TEST_F(SessionMachineTest, MissingPeerConnectionFailsNegotiation) {
    machine_ = SessionMachine::create(
        *loop_, hub_->endpoint(Side::Viewer),
        [](const webrtc::IceConfiguration&) { return std::unique_ptr<webrtc::PeerConnection>(); },
        options_, "agent-1");
    machine_->start();
    loop_->processAll();
    agentSends(SignalingMessage::accepted(sid()));

    EXPECT_EQ(machine_->state(), SessionState::Error);
    EXPECT_EQ(machine_->snapshot().error_code, core::ErrorCode::NegotiationError);
}

namespace {

class BrokenChannel : public signaling::SignalingChannel {
public:
    core::Result<void> send(const std::string&, const SignalingMessage&) override {
        return {core::ErrorCode::SignalingError, "relay unreachable"};
    }
    signaling::Subscription subscribe(const std::string&, Handler) override {
        ++subscribed;
        return signaling::Subscription([this] { ++disposed; });
    }

    int subscribed = 0;
    int disposed = 0;
};

} // namespace

TEST_F(SessionMachineTest, RequestSendFailure) {
    auto channel = std::make_shared<BrokenChannel>();
    machine_ = SessionMachine::create(*loop_, channel, factory(), options_, "agent-1");
    machine_->start();
    loop_->processAll();

    auto snap = machine_->snapshot();
    EXPECT_EQ(snap.state, SessionState::Error);
    EXPECT_EQ(snap.error, "failed to request live stream");
    EXPECT_EQ(snap.error_code, core::ErrorCode::SignalingError);
    EXPECT_EQ(channel->subscribed, 1);
    EXPECT_EQ(channel->disposed, 1);
    EXPECT_EQ(loop_->pendingTimers(), 0u);
}

TEST_F(SessionMachineTest, ConstructorValidatesCollaborators) {
    EXPECT_THROW(SessionMachine::create(*loop_, nullptr, factory(), options_, "agent-1"), core::Error);
    EXPECT_THROW(SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), nullptr, options_, "agent-1"),
                 core::Error);
}

// Observer boleh memanggil end() dari dalam callback
TEST_F(SessionMachineTest, ObserverMayEndSession) {
    machine_ = SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), factory(), options_, "agent-1");
    machine_->setObserver([this](const SessionSnapshot& s) {
        published_.push_back(s);
        if (s.state == SessionState::Waiting) machine_->end();
    });
    machine_->start();
    loop_->processAll();
    agentSends(SignalingMessage::accepted(sid()));

    EXPECT_EQ(machine_->state(), SessionState::Ended);
    ASSERT_FALSE(published_.empty());
    EXPECT_EQ(published_.back().state, SessionState::Ended);
}

TEST_F(SessionMachineTest, DisposalCallbackRunsAfterTerminalPublish) {
    int calls = 0;
    std::optional<SessionState> published_at_callback;
    machine_ = SessionMachine::create(*loop_, hub_->endpoint(Side::Viewer), factory(), options_, "agent-1");
    machine_->setObserver([&](const SessionSnapshot& s) {
        published_.push_back(s);
        if (s.state == SessionState::Waiting) {
            machine_->whenDisposed([&] {
                ++calls;
                published_at_callback = machine_->snapshot().state;
            });
            machine_->end();
            // Masih diantrikan
            EXPECT_EQ(calls, 0);
            EXPECT_FALSE(machine_->disposed());
        }
    });
    machine_->start();
    loop_->processAll();
    agentSends(SignalingMessage::accepted(sid()));

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(published_at_callback, SessionState::Ended);
    EXPECT_EQ(records_[0]->closes, 1);
}

TEST_F(SessionMachineTest, DisposalCallbackAfterDisposalRunsImmediately) {
    start();
    agentSends(SignalingMessage::rejected(sid()));
    ASSERT_TRUE(machine_->disposed());

    int calls = 0;
    machine_->whenDisposed([&calls] { ++calls; });
    EXPECT_EQ(calls, 1);
}

TEST_F(SessionMachineTest, FailureInsideNegotiatorCallbackKeepsLoopSafe) {
    negotiate();
    auto t1 = arrive("t1");
    connect();

    pc_->simulateState(webrtc::PeerConnectionState::Closed);
    loop_->processAll();
    // Peer connection dilepas lewat loop setelah callback selesai
    EXPECT_EQ(loop_->queueSize(), 0u);

    EXPECT_EQ(machine_->snapshot().error, "connection lost");
    EXPECT_EQ(records_[0]->closes, 1);
    EXPECT_TRUE(t1->stopped());
}

} // namespace liveview::session::test
