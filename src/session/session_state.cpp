#include <liveview/session/session_state.hpp>

namespace liveview::session {

namespace {

using S = SessionState;
using E = EventKind;
using A = Action;
using core::ErrorCode;

struct Row {
    SessionState from;
    EventKind event;
    Transition result;
};

constexpr const char* REQUEST_REJECTED = "request rejected";
constexpr const char* NO_RESPONSE = "no response from agent";
constexpr const char* CONNECTION_LOST = "connection lost";
constexpr const char* CONNECTION_TIMED_OUT = "connection timed out";
constexpr const char* NEGOTIATION_FAILED = "unable to negotiate the live stream";
constexpr const char* REQUEST_FAILED = "failed to request live stream";

constexpr Row TABLE[] = {
    {S::Idle, E::Start, {S::Requesting, A::BeginRequest}},
    {S::Idle, E::LocalEnd, {S::Ended, A::EndLocal}},

    {S::Requesting, E::Accepted, {S::Waiting, A::AwaitNegotiation}},
    {S::Requesting, E::Rejected, {S::Error, A::Fail, ErrorCode::RequestRejected, REQUEST_REJECTED}},
    {S::Requesting, E::RequestTimeout, {S::Error, A::Fail, ErrorCode::RequestTimeout, NO_RESPONSE}},
    {S::Requesting, E::SignalingFailed, {S::Error, A::Fail, ErrorCode::SignalingError, REQUEST_FAILED}},
    {S::Requesting, E::RemoteEnd, {S::Ended, A::EndRemote}},
    {S::Requesting, E::LocalEnd, {S::Ended, A::EndLocal}},

    {S::Waiting, E::RemoteOffer, {S::Connecting, A::AnswerOffer}},
    {S::Waiting, E::RemoteAnswer, {S::Connecting, A::ApplyAnswer}},
    {S::Waiting, E::RemoteCandidate, {S::Waiting, A::AddCandidate}},
    {S::Waiting, E::FeedMeta, {S::Waiting, A::AttachLabel}},
    {S::Waiting, E::ConnectionFailed, {S::Error, A::Fail, ErrorCode::ConnectionLost, CONNECTION_LOST}},
    {S::Waiting, E::NegotiationFailed, {S::Error, A::Fail, ErrorCode::NegotiationError, NEGOTIATION_FAILED}},
    {S::Waiting, E::ConnectionTimeout, {S::Error, A::Fail, ErrorCode::ConnectionTimeout, CONNECTION_TIMED_OUT}},
    {S::Waiting, E::RemoteEnd, {S::Ended, A::EndRemote}},
    {S::Waiting, E::LocalEnd, {S::Ended, A::EndLocal}},

    {S::Connecting, E::TrackArrived, {S::Connecting, A::RegisterFeed}},
    {S::Connecting, E::TrackEnded, {S::Connecting, A::RemoveFeed}},
    {S::Connecting, E::Connected, {S::Streaming, A::MarkConnected}},
    {S::Connecting, E::RemoteCandidate, {S::Connecting, A::AddCandidate}},
    {S::Connecting, E::FeedMeta, {S::Connecting, A::AttachLabel}},
    {S::Connecting, E::ConnectionFailed, {S::Error, A::Fail, ErrorCode::ConnectionLost, CONNECTION_LOST}},
    {S::Connecting, E::NegotiationFailed, {S::Error, A::Fail, ErrorCode::NegotiationError, NEGOTIATION_FAILED}},
    {S::Connecting, E::ConnectionTimeout, {S::Error, A::Fail, ErrorCode::ConnectionTimeout, CONNECTION_TIMED_OUT}},
    {S::Connecting, E::RemoteEnd, {S::Ended, A::EndRemote}},
    {S::Connecting, E::LocalEnd, {S::Ended, A::EndLocal}},

    {S::Streaming, E::TrackArrived, {S::Streaming, A::RegisterFeed}},
    {S::Streaming, E::TrackEnded, {S::Streaming, A::RemoveFeed}},
    {S::Streaming, E::RemoteCandidate, {S::Streaming, A::AddCandidate}},
    {S::Streaming, E::FeedMeta, {S::Streaming, A::AttachLabel}},
    {S::Streaming, E::ConnectionFailed, {S::Error, A::Fail, ErrorCode::ConnectionLost, CONNECTION_LOST}},
    {S::Streaming, E::ConnectionTimeout, {S::Error, A::Fail, ErrorCode::ConnectionTimeout, CONNECTION_TIMED_OUT}},
    {S::Streaming, E::RemoteEnd, {S::Ended, A::EndRemote}},
    {S::Streaming, E::LocalEnd, {S::Ended, A::EndLocal}},

    // A second connected report while streaming is harmless
    {S::Streaming, E::Connected, {S::Streaming, A::None}},

    // Duplicates and early arrivals that change nothing
    {S::Requesting, E::RemoteCandidate, {S::Requesting, A::None}},
    {S::Requesting, E::FeedMeta, {S::Requesting, A::AttachLabel}},
    {S::Waiting, E::Accepted, {S::Waiting, A::None}},
    {S::Connecting, E::Accepted, {S::Connecting, A::None}},
    {S::Streaming, E::Accepted, {S::Streaming, A::None}},
    {S::Waiting, E::TrackArrived, {S::Waiting, A::RegisterFeed}},
    {S::Waiting, E::TrackEnded, {S::Waiting, A::RemoveFeed}},
    {S::Waiting, E::Connected, {S::Waiting, A::None}},
};

} // namespace

const char* sessionStateString(SessionState state) noexcept {
    switch (state) {
        case S::Idle: return "idle";
        case S::Requesting: return "requesting";
        case S::Waiting: return "waiting";
        case S::Connecting: return "connecting";
        case S::Streaming: return "streaming";
        case S::Ended: return "ended";
        case S::Error: return "error";
    }
    return "unknown";
}

const char* eventKindString(EventKind kind) noexcept {
    switch (kind) {
        case E::Start: return "start";
        case E::LocalEnd: return "local-end";
        case E::Accepted: return "accepted";
        case E::Rejected: return "rejected";
        case E::RemoteOffer: return "offer";
        case E::RemoteAnswer: return "answer";
        case E::RemoteCandidate: return "ice-candidate";
        case E::FeedMeta: return "feed-meta";
        case E::RemoteEnd: return "end";
        case E::SignalingFailed: return "signaling-failed";
        case E::TrackArrived: return "track-arrived";
        case E::TrackEnded: return "track-ended";
        case E::Connected: return "connected";
        case E::ConnectionFailed: return "connection-failed";
        case E::NegotiationFailed: return "negotiation-failed";
        case E::RequestTimeout: return "request-timeout";
        case E::ConnectionTimeout: return "connection-timeout";
    }
    return "unknown";
}

std::optional<Transition> transition(SessionState from, EventKind event) noexcept {
    if (isTerminal(from)) {
        return std::nullopt;
    }
    for (const auto& row : TABLE) {
        if (row.from == from && row.event == event) {
            return row.result;
        }
    }
    return std::nullopt;
}

std::vector<EventKind> acceptedEvents(SessionState from) {
    std::vector<EventKind> events;
    if (isTerminal(from)) {
        return events;
    }
    for (const auto& row : TABLE) {
        if (row.from == from) {
            events.push_back(row.event);
        }
    }
    return events;
}

} // namespace liveview::session
