#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <liveview/core/event_loop.hpp>
#include <liveview/session/feed_registry.hpp>
#include <liveview/session/session_options.hpp>
#include <liveview/session/session_state.hpp>
#include <liveview/signaling/channel.hpp>
#include <liveview/webrtc/negotiator.hpp>

namespace liveview::session {

// Read-only view handed to presentation code.
struct SessionSnapshot {
    std::string session_id;
    std::string agent_id;
    SessionState state = SessionState::Idle;
    // Bind each track to an output surface only; the session stops them on teardown.
    std::vector<Feed> feeds;
    std::optional<std::string> error;
    std::optional<core::ErrorCode> error_code;
    std::optional<std::string> end_reason;
};

struct SessionEvent {
    EventKind kind;
    std::optional<signaling::SignalingMessage> message;
    webrtc::MediaTrackPtr track;
    std::string transport_id;

    static SessionEvent of(EventKind kind) { return SessionEvent{kind, std::nullopt, nullptr, {}}; }
    // Maps a received message onto an event; std::nullopt for kinds the
    // viewer never receives.
    static std::optional<SessionEvent> fromMessage(const signaling::SignalingMessage& message);
};

// One viewing attempt. Every event funnels through dispatch(), which looks
// the (state, event) pair up in the transition table, moves to the new
// state and then runs the row's action. Must only be driven from the event
// loop thread.
class SessionMachine : public std::enable_shared_from_this<SessionMachine> {
    struct Token {
        explicit Token() = default;
    };

public:
    using Observer = std::function<void(const SessionSnapshot&)>;
    using DisposedCallback = std::function<void()>;

    static std::shared_ptr<SessionMachine> create(core::EventLoop& loop,
                                                  std::shared_ptr<signaling::SignalingChannel> channel,
                                                  webrtc::PeerConnectionFactory factory,
                                                  SessionOptions options,
                                                  std::string agent_id,
                                                  std::string session_id = signaling::generateSessionId());
    // Use create(); the token keeps construction private
    SessionMachine(Token,
                   core::EventLoop& loop,
                   std::shared_ptr<signaling::SignalingChannel> channel,
                   webrtc::PeerConnectionFactory factory,
                   SessionOptions options,
                   std::string agent_id,
                   std::string session_id);
    ~SessionMachine();

    SessionMachine(const SessionMachine&) = delete;
    SessionMachine& operator=(const SessionMachine&) = delete;

    void start() { dispatch(SessionEvent::of(EventKind::Start)); }
    // Safe from any state and more than once
    void end() { dispatch(SessionEvent::of(EventKind::LocalEnd)); }

    void dispatch(SessionEvent event);

    // Thread-safe copy of the last published snapshot
    SessionSnapshot snapshot() const;
    SessionState state() const noexcept { return state_; }
    const std::string& sessionId() const noexcept { return session_id_; }
    const std::string& agentId() const noexcept { return agent_id_; }
    bool disposed() const noexcept { return disposed_; }

    // Called on the loop thread after every state transition or feed change
    void setObserver(Observer observer);

    // Runs once resources are released and the terminal snapshot is
    // published; immediately when that already happened. Loop thread only.
    void whenDisposed(DisposedCallback callback);

private:
    void process(const SessionEvent& event);
    bool guard(const SessionEvent& event) const;
    // Returns true when the action changed observable state
    bool perform(Action action, const Transition& transition, const SessionEvent& event);
    void raise(SessionEvent event);

    void beginRequest();
    void awaitNegotiation();
    void answerOffer(const signaling::SignalingMessage& offer);
    void applyAnswer(const signaling::SignalingMessage& answer);
    bool registerFeed(webrtc::MediaTrackPtr track, const std::string& transport_id);
    void fail(core::ErrorCode code);
    void sendBestEffort(const signaling::SignalingMessage& message);

    void createNegotiator();
    void onSignalingMessage(const signaling::SignalingMessage& message);
    void onConnectionState(webrtc::PeerConnectionState state);

    void startRequestTimer();
    void startConnectionTimer();
    void cancelTimer(std::optional<core::EventLoop::TimerId>& timer);

    void dispose();
    void publish();
    void notifyDisposed();

    core::EventLoop& loop_;
    std::shared_ptr<signaling::SignalingChannel> channel_;
    webrtc::PeerConnectionFactory factory_;
    SessionOptions options_;
    const std::string agent_id_;
    const std::string session_id_;

    SessionState state_ = SessionState::Idle;
    std::optional<std::string> last_error_;
    std::optional<core::ErrorCode> error_code_;
    std::optional<std::string> end_reason_;

    signaling::Subscription subscription_;
    std::unique_ptr<webrtc::Negotiator> negotiator_;
    FeedRegistry feeds_;
    bool request_sent_ = false;
    bool offer_sent_ = false;
    bool disposed_ = false;

    std::optional<core::EventLoop::TimerId> request_timer_;
    std::optional<core::EventLoop::TimerId> connection_timer_;

    std::deque<SessionEvent> pending_;
    bool dispatching_ = false;
    std::vector<DisposedCallback> disposed_callbacks_;

    Observer observer_;
    mutable std::mutex snapshot_mutex_;
    SessionSnapshot published_;
};

} // namespace liveview::session
