#include <liveview/webrtc/negotiator.hpp>
#include <liveview/core/logger.hpp>

namespace liveview::webrtc {

Negotiator::Negotiator(core::EventLoop& loop, std::unique_ptr<PeerConnection> connection)
    : loop_(loop)
    , connection_(std::move(connection))
    , alive_(std::make_shared<bool>(true)) {
    if (!connection_) {
        throw core::NegotiationError("Negotiator requires a peer connection");
    }
    bindConnection();
}

Negotiator::~Negotiator() {
    close();
}

void Negotiator::bindConnection() {
    std::weak_ptr<bool> alive = alive_;

    // Backend threads -> session loop
    connection_->onLocalCandidate([this, alive](const IceCandidate& candidate) {
        loop_.post([this, alive, candidate] {
            if (alive.lock()) handleLocalCandidate(candidate);
        });
    });
    connection_->onTrack([this, alive](MediaTrackPtr track) {
        loop_.post([this, alive, track = std::move(track)]() mutable {
            if (alive.lock()) handleTrack(std::move(track));
        });
    });
    connection_->onTrackEnded([this, alive](const std::string& transport_id) {
        loop_.post([this, alive, transport_id] {
            if (alive.lock()) handleTrackEnded(transport_id);
        });
    });
    connection_->onStateChange([this, alive](PeerConnectionState state) {
        loop_.post([this, alive, state] {
            if (alive.lock()) handleStateChange(state);
        });
    });
}

void Negotiator::ensureOpen(const char* operation) const {
    if (closed_) {
        throw core::NegotiationError(std::string(operation) + " called after the connection closed");
    }
}

SessionDescription Negotiator::createOffer() {
    ensureOpen("createOffer");

    auto offer = connection_->createOffer();
    if (!offer) {
        throw core::NegotiationError("Failed to create offer: " + std::string(offer.error().what()));
    }
    core::Logger::debug("Created receive-only offer ({} bytes)", offer.value().sdp.size());
    return offer.value();
}

SessionDescription Negotiator::createAnswer() {
    ensureOpen("createAnswer");
    if (!has_remote_description_) {
        throw core::NegotiationError("Cannot create answer without a remote offer");
    }

    auto answer = connection_->createAnswer();
    if (!answer) {
        throw core::NegotiationError("Failed to create answer: " + std::string(answer.error().what()));
    }
    core::Logger::debug("Created answer ({} bytes)", answer.value().sdp.size());
    return answer.value();
}

void Negotiator::applyRemoteDescription(const SessionDescription& desc) {
    ensureOpen("applyRemoteDescription");
    if (desc.sdp.empty()) {
        throw core::NegotiationError("Remote description is empty");
    }

    auto applied = connection_->setRemoteDescription(desc);
    if (!applied) {
        throw core::NegotiationError("Failed to apply remote " + std::string(sdpTypeString(desc.type)) +
                                     ": " + applied.error().what());
    }

    core::Logger::debug("Applied remote {}", sdpTypeString(desc.type));
    has_remote_description_ = true;
    flushPending();
}

void Negotiator::addRemoteCandidate(const IceCandidate& candidate) {
    if (closed_) {
        core::Logger::debug("Ignoring remote candidate after close");
        return;
    }
    if (candidate.candidate.empty()) {
        return;
    }
    if (!candidate.id.empty() && applied_candidate_ids_.count(candidate.id) > 0) {
        core::Logger::debug("Skipping duplicate remote candidate {}", candidate.id);
        return;
    }

    if (!has_remote_description_) {
        if (!candidate.id.empty()) {
            applied_candidate_ids_.insert(candidate.id);
        }
        pending_remote_.push_back(candidate);
        return;
    }

    applyCandidate(candidate);
}

void Negotiator::applyCandidate(const IceCandidate& candidate) {
    if (!candidate.id.empty()) {
        applied_candidate_ids_.insert(candidate.id);
    }

    auto result = connection_->addRemoteCandidate(candidate);
    if (!result) {
        core::Logger::warn("Remote candidate rejected: {}", result.error().what());
    }
}

void Negotiator::flushPending() {
    auto remote = std::move(pending_remote_);
    pending_remote_.clear();
    for (const auto& candidate : remote) {
        applyCandidate(candidate);
    }

    auto local = std::move(pending_local_);
    pending_local_.clear();
    for (const auto& candidate : local) {
        if (local_candidate_callback_) local_candidate_callback_(candidate);
    }
}

void Negotiator::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    alive_.reset();

    pending_remote_.clear();
    pending_local_.clear();
    applied_candidate_ids_.clear();

    connection_->resetCallbacks();
    connection_->close();
    core::Logger::debug("Peer connection closed");
}

void Negotiator::handleLocalCandidate(const IceCandidate& candidate) {
    if (!has_remote_description_) {
        pending_local_.push_back(candidate);
        return;
    }
    if (local_candidate_callback_) local_candidate_callback_(candidate);
}

void Negotiator::handleTrack(MediaTrackPtr track) {
    if (!track) {
        return;
    }
    const std::string transport_id = track->id();
    core::Logger::debug("Remote track arrived: {}", transport_id);
    if (track_callback_) track_callback_(std::move(track), transport_id);
}

void Negotiator::handleTrackEnded(const std::string& transport_id) {
    core::Logger::debug("Remote track ended: {}", transport_id);
    if (track_ended_callback_) track_ended_callback_(transport_id);
}

void Negotiator::handleStateChange(PeerConnectionState state) {
    core::Logger::debug("Peer connection state: {}", peerConnectionStateString(state));
    if (state_callback_) state_callback_(state);
}

} // namespace liveview::webrtc
