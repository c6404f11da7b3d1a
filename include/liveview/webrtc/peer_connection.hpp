#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <liveview/core/error.hpp>
#include <liveview/webrtc/ice_config.hpp>

namespace liveview::webrtc {

// SDP session description types
enum class SdpType {
    Offer,
    Answer
};

const char* sdpTypeString(SdpType type) noexcept;

struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;
};

struct IceCandidate {
    // Opaque id used for de-duplication across re-published candidate lists
    std::string id;
    std::string candidate;
    std::optional<std::string> sdp_mid;
    std::optional<int> sdp_mline_index;
};

enum class PeerConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

const char* peerConnectionStateString(PeerConnectionState state) noexcept;

enum class MediaKind {
    Video,
    Audio
};

// A remote media track. The session owns it; stop() releases the underlying
// transport resources and is idempotent.
class MediaTrack {
public:
    using FrameHandler = std::function<void(const std::vector<std::byte>&)>;

    virtual ~MediaTrack() = default;

    // Transport-level identifier (mid or track id)
    virtual std::string id() const = 0;
    virtual MediaKind kind() const = 0;
    virtual bool isActive() const = 0;
    virtual void stop() = 0;

    // Binds an output surface. Frames arrive on a transport thread.
    virtual void setFrameHandler(FrameHandler handler) = 0;
};

using MediaTrackPtr = std::shared_ptr<MediaTrack>;

// Backend-neutral peer connection. Callbacks may be invoked from any thread;
// Negotiator marshals them onto the session event loop.
class PeerConnection {
public:
    using LocalCandidateCallback = std::function<void(const IceCandidate&)>;
    using TrackCallback = std::function<void(MediaTrackPtr)>;
    using TrackEndedCallback = std::function<void(const std::string& track_id)>;
    using StateCallback = std::function<void(PeerConnectionState)>;

    virtual ~PeerConnection() = default;

    // Adds a receive-only video transceiver and returns the local offer.
    virtual core::Result<SessionDescription> createOffer() = 0;
    // Requires a remote offer to have been applied.
    virtual core::Result<SessionDescription> createAnswer() = 0;
    virtual core::Result<void> setRemoteDescription(const SessionDescription& desc) = 0;
    virtual core::Result<void> addRemoteCandidate(const IceCandidate& candidate) = 0;
    virtual void close() = 0;

    virtual PeerConnectionState state() const = 0;

    void onLocalCandidate(LocalCandidateCallback cb) { setCallback(local_candidate_callback_, std::move(cb)); }
    void onTrack(TrackCallback cb) { setCallback(track_callback_, std::move(cb)); }
    void onTrackEnded(TrackEndedCallback cb) { setCallback(track_ended_callback_, std::move(cb)); }
    void onStateChange(StateCallback cb) { setCallback(state_callback_, std::move(cb)); }

    void resetCallbacks() {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        local_candidate_callback_ = nullptr;
        track_callback_ = nullptr;
        track_ended_callback_ = nullptr;
        state_callback_ = nullptr;
    }

protected:
    void emitLocalCandidate(const IceCandidate& candidate) {
        if (auto cb = copyCallback(local_candidate_callback_)) cb(candidate);
    }
    void emitTrack(MediaTrackPtr track) {
        if (auto cb = copyCallback(track_callback_)) cb(std::move(track));
    }
    void emitTrackEnded(const std::string& track_id) {
        if (auto cb = copyCallback(track_ended_callback_)) cb(track_id);
    }
    void emitStateChange(PeerConnectionState state) {
        if (auto cb = copyCallback(state_callback_)) cb(state);
    }

private:
    template<typename F>
    void setCallback(F& slot, F cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        slot = std::move(cb);
    }

    // Invoked outside the lock so a callback may reset callbacks itself
    template<typename F>
    F copyCallback(const F& slot) const {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        return slot;
    }

    mutable std::mutex callback_mutex_;
    LocalCandidateCallback local_candidate_callback_;
    TrackCallback track_callback_;
    TrackEndedCallback track_ended_callback_;
    StateCallback state_callback_;
};

using PeerConnectionFactory =
    std::function<std::unique_ptr<PeerConnection>(const IceConfiguration&)>;

} // namespace liveview::webrtc
