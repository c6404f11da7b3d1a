#include <liveview/signaling/message.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <random>
#include <sstream>
#include <utility>

namespace liveview::signaling {

namespace {

constexpr std::array<std::pair<MessageKind, const char*>, 8> KIND_NAMES = {{
    {MessageKind::Request, "request"},
    {MessageKind::Accepted, "accepted"},
    {MessageKind::Rejected, "rejected"},
    {MessageKind::Offer, "offer"},
    {MessageKind::Answer, "answer"},
    {MessageKind::IceCandidate, "ice-candidate"},
    {MessageKind::FeedMeta, "feed-meta"},
    {MessageKind::End, "end"}
}};

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string requiredString(const nlohmann::json& j, const char* key) {
    auto value = optionalString(j, key);
    if (!value || value->empty()) {
        throw std::invalid_argument(std::string("missing field '") + key + "'");
    }
    return *value;
}

nlohmann::json candidateToJson(const webrtc::IceCandidate& c) {
    nlohmann::json j;
    j["id"] = c.id;
    j["candidate"] = c.candidate;
    j["sdpMid"] = c.sdp_mid ? nlohmann::json(*c.sdp_mid) : nlohmann::json(nullptr);
    j["sdpMLineIndex"] = c.sdp_mline_index ? nlohmann::json(*c.sdp_mline_index) : nlohmann::json(nullptr);
    return j;
}

webrtc::IceCandidate candidateFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("field 'candidate' must be an object");
    }

    webrtc::IceCandidate c;
    c.id = optionalString(j, "id").value_or("");
    c.candidate = requiredString(j, "candidate");
    c.sdp_mid = optionalString(j, "sdpMid");

    auto index = j.find("sdpMLineIndex");
    if (index != j.end() && index->is_number_integer()) {
        c.sdp_mline_index = index->get<int>();
    }
    return c;
}

} // namespace

const char* messageKindString(MessageKind kind) noexcept {
    for (const auto& [k, name] : KIND_NAMES) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<MessageKind> parseMessageKind(std::string_view name) {
    for (const auto& [k, n] : KIND_NAMES) {
        if (name == n) return k;
    }
    return std::nullopt;
}

SignalingMessage SignalingMessage::request(std::string session_id, std::string agent_id,
                                           std::optional<std::string> viewer_id,
                                           std::optional<std::string> viewer_display_name) {
    SignalingMessage m;
    m.kind = MessageKind::Request;
    m.session_id = std::move(session_id);
    m.agent_id = std::move(agent_id);
    m.viewer_id = std::move(viewer_id);
    m.viewer_display_name = std::move(viewer_display_name);
    return m;
}

SignalingMessage SignalingMessage::accepted(std::string session_id) {
    SignalingMessage m;
    m.kind = MessageKind::Accepted;
    m.session_id = std::move(session_id);
    return m;
}

SignalingMessage SignalingMessage::rejected(std::string session_id, std::optional<std::string> reason) {
    SignalingMessage m;
    m.kind = MessageKind::Rejected;
    m.session_id = std::move(session_id);
    m.reason = std::move(reason);
    return m;
}

SignalingMessage SignalingMessage::offer(std::string session_id, std::string sdp) {
    SignalingMessage m;
    m.kind = MessageKind::Offer;
    m.session_id = std::move(session_id);
    m.sdp = std::move(sdp);
    return m;
}

SignalingMessage SignalingMessage::answer(std::string session_id, std::string sdp) {
    SignalingMessage m;
    m.kind = MessageKind::Answer;
    m.session_id = std::move(session_id);
    m.sdp = std::move(sdp);
    return m;
}

SignalingMessage SignalingMessage::iceCandidate(std::string session_id, webrtc::IceCandidate candidate) {
    SignalingMessage m;
    m.kind = MessageKind::IceCandidate;
    m.session_id = std::move(session_id);
    m.candidate = std::move(candidate);
    return m;
}

SignalingMessage SignalingMessage::feedMeta(std::string session_id, std::string feed_id,
                                            std::optional<std::string> label) {
    SignalingMessage m;
    m.kind = MessageKind::FeedMeta;
    m.session_id = std::move(session_id);
    m.feed_id = std::move(feed_id);
    m.label = std::move(label);
    return m;
}

SignalingMessage SignalingMessage::end(std::string session_id, std::string reason) {
    SignalingMessage m;
    m.kind = MessageKind::End;
    m.session_id = std::move(session_id);
    m.reason = std::move(reason);
    return m;
}

std::string SignalingMessage::toJson() const {
    nlohmann::json j;
    j["type"] = messageKindString(kind);
    j["sessionId"] = session_id;

    switch (kind) {
        case MessageKind::Request:
            j["agentId"] = agent_id;
            if (viewer_id) j["viewerId"] = *viewer_id;
            if (viewer_display_name) j["viewerDisplayName"] = *viewer_display_name;
            break;
        case MessageKind::Accepted:
            break;
        case MessageKind::Rejected:
            if (reason) j["reason"] = *reason;
            break;
        case MessageKind::Offer:
        case MessageKind::Answer:
            j["sdp"] = sdp;
            break;
        case MessageKind::IceCandidate:
            if (candidate) j["candidate"] = candidateToJson(*candidate);
            break;
        case MessageKind::FeedMeta:
            j["feedId"] = feed_id;
            if (label) j["label"] = *label;
            break;
        case MessageKind::End:
            j["reason"] = reason.value_or(end_reason::ViewerClosed);
            break;
    }
    return j.dump();
}

core::Result<SignalingMessage> SignalingMessage::fromJson(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return {core::ErrorCode::InvalidMessage, "Signaling message must be a JSON object"};
        }

        auto type = requiredString(j, "type");
        auto kind = parseMessageKind(type);
        if (!kind) {
            return {core::ErrorCode::InvalidMessage, "Unknown signaling message type: " + type};
        }

        SignalingMessage m;
        m.kind = *kind;
        m.session_id = requiredString(j, "sessionId");

        switch (m.kind) {
            case MessageKind::Request:
                m.agent_id = requiredString(j, "agentId");
                m.viewer_id = optionalString(j, "viewerId");
                m.viewer_display_name = optionalString(j, "viewerDisplayName");
                break;
            case MessageKind::Accepted:
                break;
            case MessageKind::Rejected:
                m.reason = optionalString(j, "reason");
                break;
            case MessageKind::Offer:
            case MessageKind::Answer:
                m.sdp = requiredString(j, "sdp");
                break;
            case MessageKind::IceCandidate: {
                auto it = j.find("candidate");
                if (it == j.end()) {
                    throw std::invalid_argument("missing field 'candidate'");
                }
                m.candidate = candidateFromJson(*it);
                break;
            }
            case MessageKind::FeedMeta:
                m.feed_id = requiredString(j, "feedId");
                m.label = optionalString(j, "label");
                break;
            case MessageKind::End:
                m.reason = optionalString(j, "reason");
                break;
        }
        return m;
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::InvalidMessage,
                "Failed to parse signaling message: " + std::string(e.what())};
    }
}

namespace {

std::string randomHex(const char* prefix, int digits) {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < digits; ++i) {
        oss << std::hex << dis(gen);
    }
    return oss.str();
}

} // namespace

std::string generateSessionId() {
    return randomHex("session-", 32);
}

std::string generateCandidateId() {
    return randomHex("cand-", 16);
}

} // namespace liveview::signaling
