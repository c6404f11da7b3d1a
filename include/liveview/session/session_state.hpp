#pragma once

#include <optional>
#include <vector>

#include <liveview/core/error.hpp>

namespace liveview::session {

enum class SessionState {
    Idle,
    Requesting,
    Waiting,
    Connecting,
    Streaming,
    Ended,
    Error
};

const char* sessionStateString(SessionState state) noexcept;

// No automatic transition leaves Ended or Error.
constexpr bool isTerminal(SessionState state) noexcept {
    return state == SessionState::Ended || state == SessionState::Error;
}

// Network activity only happens in these states.
constexpr bool isActive(SessionState state) noexcept {
    return state == SessionState::Requesting || state == SessionState::Waiting ||
           state == SessionState::Connecting || state == SessionState::Streaming;
}

enum class EventKind {
    // caller
    Start,
    LocalEnd,
    // signaling
    Accepted,
    Rejected,
    RemoteOffer,
    RemoteAnswer,
    RemoteCandidate,
    FeedMeta,
    RemoteEnd,
    SignalingFailed,
    // negotiator
    TrackArrived,
    TrackEnded,
    Connected,
    ConnectionFailed,
    NegotiationFailed,
    // timers
    RequestTimeout,
    ConnectionTimeout
};

const char* eventKindString(EventKind kind) noexcept;

enum class Action {
    None,
    BeginRequest,
    AwaitNegotiation,
    AnswerOffer,
    ApplyAnswer,
    AddCandidate,
    AttachLabel,
    RegisterFeed,
    RemoveFeed,
    MarkConnected,
    Fail,
    EndRemote,
    EndLocal
};

struct Transition {
    SessionState to;
    Action action;
    // Set for transitions into Error
    core::ErrorCode error = core::ErrorCode::Success;
    const char* last_error = nullptr;
};

// Pure lookup. std::nullopt means the event is not accepted in `from` and
// must be ignored.
std::optional<Transition> transition(SessionState from, EventKind event) noexcept;

// Events the table accepts in `from`, in declaration order.
std::vector<EventKind> acceptedEvents(SessionState from);

} // namespace liveview::session
