#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <liveview/core/error.hpp>
#include <liveview/webrtc/peer_connection.hpp>

namespace liveview::signaling {

// Session-control message kinds. The wire names ("request", "ice-candidate",
// ...) are shared with the agent desktop and must not change.
enum class MessageKind {
    Request,
    Accepted,
    Rejected,
    Offer,
    Answer,
    IceCandidate,
    FeedMeta,
    End
};

const char* messageKindString(MessageKind kind) noexcept;
std::optional<MessageKind> parseMessageKind(std::string_view name);

namespace end_reason {
inline constexpr const char* ViewerClosed = "viewer_closed";
inline constexpr const char* AgentClosed = "agent_closed";
inline constexpr const char* Expired = "expired";
inline constexpr const char* Error = "error";
} // namespace end_reason

struct SignalingMessage {
    MessageKind kind = MessageKind::Request;
    std::string session_id;

    // request
    std::string agent_id;
    std::optional<std::string> viewer_id;
    std::optional<std::string> viewer_display_name;

    // rejected, end
    std::optional<std::string> reason;

    // offer, answer
    std::string sdp;

    // ice-candidate
    std::optional<webrtc::IceCandidate> candidate;

    // feed-meta
    std::string feed_id;
    std::optional<std::string> label;

    static SignalingMessage request(std::string session_id, std::string agent_id,
                                    std::optional<std::string> viewer_id = std::nullopt,
                                    std::optional<std::string> viewer_display_name = std::nullopt);
    static SignalingMessage accepted(std::string session_id);
    static SignalingMessage rejected(std::string session_id,
                                     std::optional<std::string> reason = std::nullopt);
    static SignalingMessage offer(std::string session_id, std::string sdp);
    static SignalingMessage answer(std::string session_id, std::string sdp);
    static SignalingMessage iceCandidate(std::string session_id, webrtc::IceCandidate candidate);
    static SignalingMessage feedMeta(std::string session_id, std::string feed_id,
                                     std::optional<std::string> label = std::nullopt);
    static SignalingMessage end(std::string session_id, std::string reason);

    std::string toJson() const;
    // InvalidMessage for malformed input, unknown kinds or missing fields
    static core::Result<SignalingMessage> fromJson(std::string_view json);
};

// Utility functions
std::string generateSessionId();
std::string generateCandidateId();

} // namespace liveview::signaling
