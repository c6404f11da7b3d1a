#include <liveview/webrtc/peer_connection.hpp>

namespace liveview::webrtc {

const char* sdpTypeString(SdpType type) noexcept {
    switch (type) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
    }
    return "unknown";
}

const char* peerConnectionStateString(PeerConnectionState state) noexcept {
    switch (state) {
        case PeerConnectionState::New: return "new";
        case PeerConnectionState::Connecting: return "connecting";
        case PeerConnectionState::Connected: return "connected";
        case PeerConnectionState::Disconnected: return "disconnected";
        case PeerConnectionState::Failed: return "failed";
        case PeerConnectionState::Closed: return "closed";
    }
    return "unknown";
}

} // namespace liveview::webrtc
