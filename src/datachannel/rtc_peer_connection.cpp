#include <liveview/datachannel/rtc_peer_connection.hpp>
#include <liveview/core/logger.hpp>

#include <variant>

namespace liveview::datachannel {

namespace {

webrtc::PeerConnectionState mapState(::rtc::PeerConnection::State state) {
    switch (state) {
        case ::rtc::PeerConnection::State::New: return webrtc::PeerConnectionState::New;
        case ::rtc::PeerConnection::State::Connecting: return webrtc::PeerConnectionState::Connecting;
        case ::rtc::PeerConnection::State::Connected: return webrtc::PeerConnectionState::Connected;
        case ::rtc::PeerConnection::State::Disconnected: return webrtc::PeerConnectionState::Disconnected;
        case ::rtc::PeerConnection::State::Failed: return webrtc::PeerConnectionState::Failed;
        case ::rtc::PeerConnection::State::Closed: return webrtc::PeerConnectionState::Closed;
    }
    return webrtc::PeerConnectionState::Failed;
}

} // namespace

RtcMediaTrack::RtcMediaTrack(std::shared_ptr<::rtc::Track> track)
    : track_(std::move(track)) {
}

RtcMediaTrack::~RtcMediaTrack() {
    stop();
}

std::string RtcMediaTrack::id() const {
    return track_->mid();
}

webrtc::MediaKind RtcMediaTrack::kind() const {
    return track_->description().type() == "audio" ? webrtc::MediaKind::Audio : webrtc::MediaKind::Video;
}

bool RtcMediaTrack::isActive() const {
    return !stopped_ && track_->isOpen();
}

void RtcMediaTrack::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    try {
        track_->resetCallbacks();
        track_->close();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Closing track {} failed: {}", track_->mid(), e.what());
    }
}

void RtcMediaTrack::setFrameHandler(FrameHandler handler) {
    if (!handler) {
        track_->onMessage(nullptr);
        return;
    }
    track_->onMessage([handler = std::move(handler)](::rtc::message_variant message) {
        if (auto* data = std::get_if<::rtc::binary>(&message)) {
            handler(*data);
        }
    });
}

::rtc::Configuration toRtcConfiguration(const webrtc::IceConfiguration& ice) {
    ::rtc::Configuration config;
    config.disableAutoNegotiation = true;
    config.iceTransportPolicy = ice.transport_policy == webrtc::IceTransportPolicy::Relay
                                    ? ::rtc::TransportPolicy::Relay
                                    : ::rtc::TransportPolicy::All;

    for (const auto& server : ice.servers) {
        for (const auto& url : server.urls) {
            try {
                ::rtc::IceServer rtc_server(url);
                if (server.username) rtc_server.username = *server.username;
                if (server.credential) rtc_server.password = *server.credential;
                config.iceServers.push_back(std::move(rtc_server));
            }
            catch (const std::exception& e) {
                core::Logger::warn("Skipping ICE server {}: {}", url, e.what());
            }
        }
    }
    return config;
}

RtcPeerConnection::RtcPeerConnection(const webrtc::IceConfiguration& ice)
    : pc_(std::make_shared<::rtc::PeerConnection>(toRtcConfiguration(ice))) {
    bindCallbacks();
}

RtcPeerConnection::~RtcPeerConnection() {
    close();
}

void RtcPeerConnection::bindCallbacks() {
    pc_->onLocalCandidate([this](::rtc::Candidate candidate) {
        webrtc::IceCandidate out;
        out.candidate = candidate.candidate();
        out.sdp_mid = candidate.mid();
        emitLocalCandidate(out);
    });
    pc_->onTrack([this](std::shared_ptr<::rtc::Track> track) {
        adoptTrack(std::move(track));
    });
    pc_->onStateChange([this](::rtc::PeerConnection::State state) {
        state_ = mapState(state);
        emitStateChange(state_);
    });
}

void RtcPeerConnection::adoptTrack(std::shared_ptr<::rtc::Track> track) {
    const std::string mid = track->mid();
    track->onClosed([this, mid] { emitTrackEnded(mid); });
    {
        std::lock_guard<std::mutex> lock(tracks_mutex_);
        tracks_.push_back(track);
    }
    emitTrack(std::make_shared<RtcMediaTrack>(std::move(track)));
}

core::Result<webrtc::SessionDescription> RtcPeerConnection::localDescription(webrtc::SdpType type) {
    auto desc = pc_->localDescription();
    if (!desc) {
        return {core::ErrorCode::NegotiationError, "No local description was produced"};
    }
    return webrtc::SessionDescription{type, std::string(*desc)};
}

core::Result<webrtc::SessionDescription> RtcPeerConnection::createOffer() {
    try {
        auto track = pc_->addTrack(::rtc::Description::Video("video", ::rtc::Description::Direction::RecvOnly));
        {
            std::lock_guard<std::mutex> lock(tracks_mutex_);
            offered_tracks_.push_back(std::move(track));
        }
        pc_->setLocalDescription(::rtc::Description::Type::Offer);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::NegotiationError, e.what()};
    }
    return localDescription(webrtc::SdpType::Offer);
}

core::Result<webrtc::SessionDescription> RtcPeerConnection::createAnswer() {
    try {
        pc_->setLocalDescription(::rtc::Description::Type::Answer);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::NegotiationError, e.what()};
    }
    return localDescription(webrtc::SdpType::Answer);
}

core::Result<void> RtcPeerConnection::setRemoteDescription(const webrtc::SessionDescription& desc) {
    try {
        pc_->setRemoteDescription(::rtc::Description(desc.sdp, desc.type == webrtc::SdpType::Offer
                                                                   ? ::rtc::Description::Type::Offer
                                                                   : ::rtc::Description::Type::Answer));
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::NegotiationError, e.what()};
    }

    if (desc.type == webrtc::SdpType::Answer) {
        std::vector<std::shared_ptr<::rtc::Track>> offered;
        {
            std::lock_guard<std::mutex> lock(tracks_mutex_);
            offered.swap(offered_tracks_);
        }
        // onTrack only fires for remotely created transceivers
        for (auto& track : offered) {
            adoptTrack(std::move(track));
        }
    }
    return {};
}

core::Result<void> RtcPeerConnection::addRemoteCandidate(const webrtc::IceCandidate& candidate) {
    try {
        pc_->addRemoteCandidate(::rtc::Candidate(candidate.candidate, candidate.sdp_mid.value_or("")));
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::InvalidData, e.what()};
    }
    return {};
}

void RtcPeerConnection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    pc_->resetCallbacks();
    std::vector<std::shared_ptr<::rtc::Track>> tracks;
    {
        std::lock_guard<std::mutex> lock(tracks_mutex_);
        tracks.swap(tracks_);
        offered_tracks_.clear();
    }
    for (auto& track : tracks) {
        track->resetCallbacks();
    }

    try {
        pc_->close();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Closing peer connection failed: {}", e.what());
    }
    state_ = webrtc::PeerConnectionState::Closed;
}

webrtc::PeerConnectionFactory makeRtcPeerConnectionFactory() {
    return [](const webrtc::IceConfiguration& ice) -> std::unique_ptr<webrtc::PeerConnection> {
        return std::make_unique<RtcPeerConnection>(ice);
    };
}

} // namespace liveview::datachannel
