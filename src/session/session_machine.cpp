#include <liveview/session/session_machine.hpp>
#include <liveview/core/logger.hpp>

namespace liveview::session {

std::optional<SessionEvent> SessionEvent::fromMessage(const signaling::SignalingMessage& message) {
    EventKind kind;
    switch (message.kind) {
        case signaling::MessageKind::Accepted: kind = EventKind::Accepted; break;
        case signaling::MessageKind::Rejected: kind = EventKind::Rejected; break;
        case signaling::MessageKind::Offer: kind = EventKind::RemoteOffer; break;
        case signaling::MessageKind::Answer: kind = EventKind::RemoteAnswer; break;
        case signaling::MessageKind::IceCandidate: kind = EventKind::RemoteCandidate; break;
        case signaling::MessageKind::FeedMeta: kind = EventKind::FeedMeta; break;
        case signaling::MessageKind::End: kind = EventKind::RemoteEnd; break;
        default: return std::nullopt;
    }
    return SessionEvent{kind, message, nullptr, {}};
}

std::shared_ptr<SessionMachine> SessionMachine::create(core::EventLoop& loop,
                                                       std::shared_ptr<signaling::SignalingChannel> channel,
                                                       webrtc::PeerConnectionFactory factory,
                                                       SessionOptions options,
                                                       std::string agent_id,
                                                       std::string session_id) {
    return std::make_shared<SessionMachine>(Token{}, loop, std::move(channel), std::move(factory),
                                            std::move(options), std::move(agent_id), std::move(session_id));
}

SessionMachine::SessionMachine(Token,
                               core::EventLoop& loop,
                               std::shared_ptr<signaling::SignalingChannel> channel,
                               webrtc::PeerConnectionFactory factory,
                               SessionOptions options,
                               std::string agent_id,
                               std::string session_id)
    : loop_(loop)
    , channel_(std::move(channel))
    , factory_(std::move(factory))
    , options_(std::move(options))
    , agent_id_(std::move(agent_id))
    , session_id_(std::move(session_id)) {
    if (!channel_) {
        throw core::Error(core::ErrorCode::InvalidArgument, "SessionMachine requires a signaling channel");
    }
    if (!factory_) {
        throw core::Error(core::ErrorCode::InvalidArgument, "SessionMachine requires a peer connection factory");
    }
    published_.session_id = session_id_;
    published_.agent_id = agent_id_;
}

SessionMachine::~SessionMachine() {
    dispose();
    notifyDisposed();
}

void SessionMachine::setObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    observer_ = std::move(observer);
}

void SessionMachine::whenDisposed(DisposedCallback callback) {
    if (!callback) {
        return;
    }
    disposed_callbacks_.push_back(std::move(callback));
    if (disposed_ && !dispatching_) {
        notifyDisposed();
    }
}

SessionSnapshot SessionMachine::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return published_;
}

void SessionMachine::dispatch(SessionEvent event) {
    pending_.push_back(std::move(event));
    if (dispatching_) {
        // Drained by the outer dispatch, after the current action finishes
        return;
    }

    dispatching_ = true;
    while (!pending_.empty()) {
        SessionEvent next = std::move(pending_.front());
        pending_.pop_front();
        try {
            process(next);
        }
        catch (const std::exception& e) {
            core::Logger::error("Session {}: unhandled failure on {}: {}",
                                session_id_, eventKindString(next.kind), e.what());
        }
    }
    dispatching_ = false;

    if (disposed_) {
        notifyDisposed();
    }
}

void SessionMachine::raise(SessionEvent event) {
    pending_.push_back(std::move(event));
}

void SessionMachine::process(const SessionEvent& event) {
    if (!guard(event)) {
        return;
    }

    auto next = transition(state_, event.kind);
    if (!next) {
        core::Logger::debug("Session {}: ignoring {} in {}", session_id_,
                            eventKindString(event.kind), sessionStateString(state_));
        return;
    }

    const SessionState from = state_;
    state_ = next->to;
    if (from != state_) {
        core::Logger::info("Session {}: {} -> {} ({})", session_id_, sessionStateString(from),
                           sessionStateString(state_), eventKindString(event.kind));
    }
    if (state_ == SessionState::Error) {
        last_error_ = next->last_error ? std::string(next->last_error) : std::string("unknown error");
        error_code_ = next->error;
    }

    const bool changed = perform(next->action, *next, event);
    if (changed || from != state_) {
        publish();
    }
}

bool SessionMachine::guard(const SessionEvent& event) const {
    if (event.message) {
        const auto& message = *event.message;
        if (message.session_id != session_id_) {
            core::Logger::warn("Session {}: dropping {} addressed to {}", session_id_,
                               signaling::messageKindString(message.kind), message.session_id);
            return false;
        }

        switch (event.kind) {
            case EventKind::RemoteOffer:
                if (options_.viewer_initiates_offer) {
                    core::Logger::warn("Session {}: unexpected offer, viewer is the offerer", session_id_);
                    return false;
                }
                if (message.sdp.empty()) {
                    core::Logger::warn("Session {}: offer without sdp", session_id_);
                    return false;
                }
                break;
            case EventKind::RemoteAnswer:
                if (!offer_sent_) {
                    core::Logger::warn("Session {}: answer received but no offer was sent", session_id_);
                    return false;
                }
                if (message.sdp.empty()) {
                    core::Logger::warn("Session {}: answer without sdp", session_id_);
                    return false;
                }
                break;
            case EventKind::RemoteCandidate:
                if (!message.candidate || message.candidate->candidate.empty()) {
                    core::Logger::warn("Session {}: ice-candidate without candidate", session_id_);
                    return false;
                }
                break;
            case EventKind::FeedMeta:
                if (message.feed_id.empty()) {
                    core::Logger::warn("Session {}: feed-meta without feedId", session_id_);
                    return false;
                }
                break;
            default:
                break;
        }
    }

    if (event.kind == EventKind::TrackArrived && !event.track) {
        return false;
    }
    return true;
}

bool SessionMachine::perform(Action action, const Transition& next, const SessionEvent& event) {
    switch (action) {
        case Action::None:
            return false;

        case Action::BeginRequest:
            beginRequest();
            return false;

        case Action::AwaitNegotiation:
            awaitNegotiation();
            return false;

        case Action::AnswerOffer:
            answerOffer(*event.message);
            return false;

        case Action::ApplyAnswer:
            applyAnswer(*event.message);
            return false;

        case Action::AddCandidate:
            if (negotiator_) negotiator_->addRemoteCandidate(*event.message->candidate);
            return false;

        case Action::AttachLabel:
            return feeds_.attachLabel(event.message->feed_id, event.message->label);

        case Action::RegisterFeed:
            return registerFeed(event.track, event.transport_id);

        case Action::RemoveFeed:
            if (feeds_.remove(event.transport_id)) {
                core::Logger::info("Session {}: feed {} removed", session_id_, event.transport_id);
                return true;
            }
            return false;

        case Action::MarkConnected:
            cancelTimer(connection_timer_);
            return false;

        case Action::Fail:
            fail(next.error);
            return true;

        case Action::EndRemote:
            end_reason_ = event.message && event.message->reason ? *event.message->reason
                                                                 : std::string(signaling::end_reason::AgentClosed);
            core::Logger::info("Session {}: agent ended the session ({})", session_id_, *end_reason_);
            dispose();
            return true;

        case Action::EndLocal:
            end_reason_ = signaling::end_reason::ViewerClosed;
            if (request_sent_) {
                sendBestEffort(signaling::SignalingMessage::end(session_id_, signaling::end_reason::ViewerClosed));
            }
            dispose();
            return true;
    }
    return false;
}

void SessionMachine::beginRequest() {
    std::weak_ptr<SessionMachine> weak = weak_from_this();
    auto& loop = loop_;
    subscription_ = channel_->subscribe(session_id_, [weak, &loop](const signaling::SignalingMessage& message) {
        // Delivery may happen on a transport thread
        loop.post([weak, message] {
            if (auto self = weak.lock()) self->onSignalingMessage(message);
        });
    });

    auto sent = channel_->send(session_id_,
                               signaling::SignalingMessage::request(session_id_, agent_id_, options_.viewer_id,
                                                                    options_.viewer_display_name));
    if (!sent) {
        core::Logger::error("Session {}: failed to send request: {}", session_id_, sent.error().what());
        raise(SessionEvent::of(EventKind::SignalingFailed));
        return;
    }
    request_sent_ = true;
    startRequestTimer();
}

void SessionMachine::awaitNegotiation() {
    cancelTimer(request_timer_);
    startConnectionTimer();
    createNegotiator();
    if (!negotiator_ || !options_.viewer_initiates_offer) {
        return;
    }

    try {
        auto offer = negotiator_->createOffer();
        auto sent = channel_->send(session_id_, signaling::SignalingMessage::offer(session_id_, offer.sdp));
        if (!sent) {
            core::Logger::error("Session {}: failed to send offer: {}", session_id_, sent.error().what());
            raise(SessionEvent::of(EventKind::NegotiationFailed));
            return;
        }
        offer_sent_ = true;
    }
    catch (const core::NegotiationError& e) {
        core::Logger::error("Session {}: {}", session_id_, e.what());
        raise(SessionEvent::of(EventKind::NegotiationFailed));
    }
}

void SessionMachine::createNegotiator() {
    try {
        negotiator_ = std::make_unique<webrtc::Negotiator>(loop_, factory_(options_.ice));
    }
    catch (const std::exception& e) {
        core::Logger::error("Session {}: cannot create peer connection: {}", session_id_, e.what());
        raise(SessionEvent::of(EventKind::NegotiationFailed));
        return;
    }

    // Negotiator delivers on the loop and goes silent after close()
    std::weak_ptr<SessionMachine> weak = weak_from_this();
    negotiator_->onTrack([weak](webrtc::MediaTrackPtr track, const std::string& transport_id) {
        if (auto self = weak.lock()) {
            self->dispatch(SessionEvent{EventKind::TrackArrived, std::nullopt, std::move(track), transport_id});
        }
    });
    negotiator_->onTrackEnded([weak](const std::string& transport_id) {
        if (auto self = weak.lock()) {
            self->dispatch(SessionEvent{EventKind::TrackEnded, std::nullopt, nullptr, transport_id});
        }
    });
    negotiator_->onStateChange([weak](webrtc::PeerConnectionState state) {
        if (auto self = weak.lock()) self->onConnectionState(state);
    });
    negotiator_->onLocalCandidate([weak](const webrtc::IceCandidate& candidate) {
        auto self = weak.lock();
        if (!self) return;
        webrtc::IceCandidate outgoing = candidate;
        outgoing.id = signaling::generateCandidateId();
        self->sendBestEffort(signaling::SignalingMessage::iceCandidate(self->session_id_, std::move(outgoing)));
    });
}

void SessionMachine::answerOffer(const signaling::SignalingMessage& offer) {
    if (!negotiator_) {
        raise(SessionEvent::of(EventKind::NegotiationFailed));
        return;
    }

    try {
        negotiator_->applyRemoteDescription({webrtc::SdpType::Offer, offer.sdp});
        auto answer = negotiator_->createAnswer();
        auto sent = channel_->send(session_id_, signaling::SignalingMessage::answer(session_id_, answer.sdp));
        if (!sent) {
            core::Logger::error("Session {}: failed to send answer: {}", session_id_, sent.error().what());
            raise(SessionEvent::of(EventKind::NegotiationFailed));
        }
    }
    catch (const core::NegotiationError& e) {
        core::Logger::error("Session {}: {}", session_id_, e.what());
        raise(SessionEvent::of(EventKind::NegotiationFailed));
    }
}

void SessionMachine::applyAnswer(const signaling::SignalingMessage& answer) {
    if (!negotiator_) {
        raise(SessionEvent::of(EventKind::NegotiationFailed));
        return;
    }

    try {
        negotiator_->applyRemoteDescription({webrtc::SdpType::Answer, answer.sdp});
    }
    catch (const core::NegotiationError& e) {
        core::Logger::error("Session {}: {}", session_id_, e.what());
        raise(SessionEvent::of(EventKind::NegotiationFailed));
    }
}

bool SessionMachine::registerFeed(webrtc::MediaTrackPtr track, const std::string& transport_id) {
    const std::string feed_id = transport_id.empty() ? track->id() : transport_id;
    if (feeds_.contains(feed_id)) {
        core::Logger::debug("Session {}: duplicate track {} ignored", session_id_, feed_id);
        return false;
    }
    feeds_.upsert(feed_id, std::move(track));
    core::Logger::info("Session {}: feed {} registered ({} total)", session_id_, feed_id, feeds_.size());
    return true;
}

void SessionMachine::fail(core::ErrorCode code) {
    core::Logger::error("Session {}: {}", session_id_, last_error_.value_or(""));

    switch (code) {
        case core::ErrorCode::RequestTimeout:
        case core::ErrorCode::ConnectionTimeout:
            sendBestEffort(signaling::SignalingMessage::end(session_id_, signaling::end_reason::Expired));
            break;
        case core::ErrorCode::ConnectionLost:
        case core::ErrorCode::NegotiationError:
            sendBestEffort(signaling::SignalingMessage::end(session_id_, signaling::end_reason::Error));
            break;
        default:
            // Agent already knows (rejected) or the channel is unusable
            break;
    }
    dispose();
}

void SessionMachine::sendBestEffort(const signaling::SignalingMessage& message) {
    auto sent = channel_->send(session_id_, message);
    if (!sent) {
        core::Logger::warn("Session {}: could not send {}: {}", session_id_,
                           signaling::messageKindString(message.kind), sent.error().what());
    }
}

void SessionMachine::onSignalingMessage(const signaling::SignalingMessage& message) {
    auto event = SessionEvent::fromMessage(message);
    if (!event) {
        core::Logger::warn("Session {}: ignoring {} from agent", session_id_,
                           signaling::messageKindString(message.kind));
        return;
    }
    dispatch(std::move(*event));
}

void SessionMachine::onConnectionState(webrtc::PeerConnectionState state) {
    switch (state) {
        case webrtc::PeerConnectionState::Connected:
            dispatch(SessionEvent::of(EventKind::Connected));
            break;
        case webrtc::PeerConnectionState::Failed:
        case webrtc::PeerConnectionState::Closed:
            dispatch(SessionEvent::of(EventKind::ConnectionFailed));
            break;
        case webrtc::PeerConnectionState::Disconnected:
            // Bisa pulih sendiri; failed menyusul kalau tidak
            core::Logger::warn("Session {}: peer connection disconnected", session_id_);
            break;
        default:
            break;
    }
}

void SessionMachine::startRequestTimer() {
    std::weak_ptr<SessionMachine> weak = weak_from_this();
    request_timer_ = loop_.schedule(options_.request_timeout, [weak] {
        if (auto self = weak.lock()) {
            self->request_timer_.reset();
            self->dispatch(SessionEvent::of(EventKind::RequestTimeout));
        }
    });
}

void SessionMachine::startConnectionTimer() {
    std::weak_ptr<SessionMachine> weak = weak_from_this();
    connection_timer_ = loop_.schedule(options_.connection_timeout, [weak] {
        if (auto self = weak.lock()) {
            self->connection_timer_.reset();
            self->dispatch(SessionEvent::of(EventKind::ConnectionTimeout));
        }
    });
}

void SessionMachine::cancelTimer(std::optional<core::EventLoop::TimerId>& timer) {
    if (timer) {
        loop_.cancel(*timer);
        timer.reset();
    }
}

void SessionMachine::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;

    cancelTimer(request_timer_);
    cancelTimer(connection_timer_);
    subscription_.dispose();
    if (negotiator_) {
        negotiator_->close();
        if (dispatching_) {
            // Bisa jadi kita sedang di dalam callback negotiator itu sendiri
            std::shared_ptr<webrtc::Negotiator> retired(std::move(negotiator_));
            loop_.post([retired] {});
        }
        else {
            negotiator_.reset();
        }
    }
    feeds_.clear();
    core::Logger::debug("Session {}: resources released", session_id_);
}

void SessionMachine::notifyDisposed() {
    auto callbacks = std::move(disposed_callbacks_);
    disposed_callbacks_.clear();
    for (auto& callback : callbacks) {
        try {
            callback();
        }
        catch (const std::exception& e) {
            core::Logger::error("Session {}: disposal callback failed: {}", session_id_, e.what());
        }
    }
}

void SessionMachine::publish() {
    SessionSnapshot snap;
    snap.session_id = session_id_;
    snap.agent_id = agent_id_;
    snap.state = state_;
    snap.feeds = feeds_.snapshot();
    snap.error = last_error_;
    snap.error_code = error_code_;
    snap.end_reason = end_reason_;

    Observer observer;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        published_ = snap;
        observer = observer_;
    }
    if (observer) {
        observer(snap);
    }
}

} // namespace liveview::session
