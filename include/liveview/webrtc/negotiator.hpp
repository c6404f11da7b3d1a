#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <liveview/core/event_loop.hpp>
#include <liveview/webrtc/peer_connection.hpp>

namespace liveview::webrtc {

// Owns exactly one PeerConnection for a session. Candidate buffering lives
// here: remote candidates wait for the remote description, local candidates
// are held back until the remote description has been applied.
//
// All callbacks are delivered on the EventLoop passed at construction, in the
// order the backend produced them. Nothing is delivered after close().
class Negotiator {
public:
    using TrackCallback = std::function<void(MediaTrackPtr track, const std::string& transport_id)>;
    using TrackEndedCallback = std::function<void(const std::string& transport_id)>;
    using StateCallback = std::function<void(PeerConnectionState)>;
    using LocalCandidateCallback = std::function<void(const IceCandidate&)>;

    Negotiator(core::EventLoop& loop, std::unique_ptr<PeerConnection> connection);
    ~Negotiator();

    Negotiator(const Negotiator&) = delete;
    Negotiator& operator=(const Negotiator&) = delete;

    // Receive-only offer. Throws core::NegotiationError once closed.
    SessionDescription createOffer();
    SessionDescription createAnswer();

    // Throws core::NegotiationError on failure. Flushes buffered candidates.
    void applyRemoteDescription(const SessionDescription& desc);

    // Buffers until the remote description is set. Duplicate ids are dropped,
    // a candidate the backend refuses is logged and skipped.
    void addRemoteCandidate(const IceCandidate& candidate);

    // Idempotent
    void close();

    bool isClosed() const noexcept { return closed_; }
    bool hasRemoteDescription() const noexcept { return has_remote_description_; }
    std::size_t pendingRemoteCandidates() const noexcept { return pending_remote_.size(); }
    std::size_t pendingLocalCandidates() const noexcept { return pending_local_.size(); }

    void onTrack(TrackCallback cb) { track_callback_ = std::move(cb); }
    void onTrackEnded(TrackEndedCallback cb) { track_ended_callback_ = std::move(cb); }
    void onStateChange(StateCallback cb) { state_callback_ = std::move(cb); }
    void onLocalCandidate(LocalCandidateCallback cb) { local_candidate_callback_ = std::move(cb); }

private:
    void bindConnection();
    void ensureOpen(const char* operation) const;
    void applyCandidate(const IceCandidate& candidate);
    void flushPending();

    void handleLocalCandidate(const IceCandidate& candidate);
    void handleTrack(MediaTrackPtr track);
    void handleTrackEnded(const std::string& transport_id);
    void handleStateChange(PeerConnectionState state);

    core::EventLoop& loop_;
    std::unique_ptr<PeerConnection> connection_;
    // Backend callbacks hold a weak reference; reset on close()
    std::shared_ptr<bool> alive_;

    bool closed_ = false;
    bool has_remote_description_ = false;
    std::vector<IceCandidate> pending_remote_;
    std::vector<IceCandidate> pending_local_;
    std::unordered_set<std::string> applied_candidate_ids_;

    TrackCallback track_callback_;
    TrackEndedCallback track_ended_callback_;
    StateCallback state_callback_;
    LocalCandidateCallback local_candidate_callback_;
};

} // namespace liveview::webrtc
