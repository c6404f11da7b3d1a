#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include <rtc/rtc.hpp>

#include <liveview/webrtc/peer_connection.hpp>

namespace liveview::datachannel {

// Remote video (or audio) track received over a libdatachannel connection
class RtcMediaTrack : public webrtc::MediaTrack {
public:
    explicit RtcMediaTrack(std::shared_ptr<::rtc::Track> track);
    ~RtcMediaTrack() override;

    std::string id() const override;
    webrtc::MediaKind kind() const override;
    bool isActive() const override;
    void stop() override;
    void setFrameHandler(FrameHandler handler) override;

private:
    std::shared_ptr<::rtc::Track> track_;
    std::atomic<bool> stopped_{false};
};

// webrtc::PeerConnection over libdatachannel. Negotiation is manual
// (auto-negotiation disabled) so the Negotiator decides when descriptions
// are produced.
class RtcPeerConnection : public webrtc::PeerConnection {
public:
    explicit RtcPeerConnection(const webrtc::IceConfiguration& ice);
    ~RtcPeerConnection() override;

    core::Result<webrtc::SessionDescription> createOffer() override;
    core::Result<webrtc::SessionDescription> createAnswer() override;
    core::Result<void> setRemoteDescription(const webrtc::SessionDescription& desc) override;
    core::Result<void> addRemoteCandidate(const webrtc::IceCandidate& candidate) override;
    void close() override;
    webrtc::PeerConnectionState state() const override { return state_; }

private:
    void bindCallbacks();
    void adoptTrack(std::shared_ptr<::rtc::Track> track);
    core::Result<webrtc::SessionDescription> localDescription(webrtc::SdpType type);

    std::shared_ptr<::rtc::PeerConnection> pc_;
    std::atomic<webrtc::PeerConnectionState> state_{webrtc::PeerConnectionState::New};

    std::mutex tracks_mutex_;
    std::vector<std::shared_ptr<::rtc::Track>> tracks_;
    // Receive-only transceivers we offered; announced once the answer lands
    std::vector<std::shared_ptr<::rtc::Track>> offered_tracks_;
    bool closed_ = false;
};

::rtc::Configuration toRtcConfiguration(const webrtc::IceConfiguration& ice);

webrtc::PeerConnectionFactory makeRtcPeerConnectionFactory();

} // namespace liveview::datachannel
