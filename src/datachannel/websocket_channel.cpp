#include <liveview/datachannel/websocket_channel.hpp>
#include <liveview/core/logger.hpp>

#include <variant>

namespace liveview::datachannel {

std::shared_ptr<WebSocketSignalingChannel> WebSocketSignalingChannel::create(std::string url) {
    return std::make_shared<WebSocketSignalingChannel>(Token{}, std::move(url));
}

WebSocketSignalingChannel::WebSocketSignalingChannel(Token, std::string url)
    : url_(std::move(url))
    , ws_(std::make_shared<::rtc::WebSocket>()) {
}

WebSocketSignalingChannel::~WebSocketSignalingChannel() {
    close();
}

core::Result<void> WebSocketSignalingChannel::open() {
    if (url_.empty()) {
        return {core::ErrorCode::InvalidArgument, "signaling.url is not configured"};
    }

    std::weak_ptr<WebSocketSignalingChannel> weak = weak_from_this();
    ws_->onOpen([weak] {
        if (auto self = weak.lock()) self->handleOpen();
    });
    ws_->onClosed([weak] {
        if (auto self = weak.lock()) self->handleClosed();
    });
    ws_->onError([url = url_](std::string error) {
        core::Logger::error("Signaling socket {} error: {}", url, error);
    });
    ws_->onMessage([weak](::rtc::message_variant message) {
        auto self = weak.lock();
        if (!self) return;
        if (auto* text = std::get_if<std::string>(&message)) {
            self->handleText(*text);
        }
        else {
            core::Logger::warn("Ignoring binary frame on signaling socket");
        }
    });

    try {
        ws_->open(url_);
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::SignalingError, std::string("Cannot open ") + url_ + ": " + e.what()};
    }
    core::Logger::info("Connecting to signaling relay {}", url_);
    return {};
}

void WebSocketSignalingChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        outbox_.clear();
    }
    ws_->resetCallbacks();
    try {
        ws_->close();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Closing signaling socket failed: {}", e.what());
    }
}

bool WebSocketSignalingChannel::isOpen() const {
    return ws_->isOpen();
}

core::Result<void> WebSocketSignalingChannel::send(const std::string& session_id,
                                                   const signaling::SignalingMessage& message) {
    if (session_id.empty()) {
        return {core::ErrorCode::InvalidArgument, "session id is required"};
    }

    signaling::SignalingMessage outgoing = message;
    outgoing.session_id = session_id;
    std::string text = outgoing.toJson();

    std::lock_guard<std::mutex> writing(send_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return {core::ErrorCode::SignalingError, "signaling channel is closed"};
        }
        if (!opened_) {
            outbox_.push_back(std::move(text));
            return {};
        }
    }

    try {
        if (!ws_->send(text)) {
            return {core::ErrorCode::SignalingError, "signaling socket refused the message"};
        }
    }
    catch (const std::exception& e) {
        return {core::ErrorCode::SignalingError, e.what()};
    }
    return {};
}

signaling::Subscription WebSocketSignalingChannel::subscribe(const std::string& session_id, Handler handler) {
    std::uint64_t token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = next_token_++;
        handlers_[session_id][token] = std::move(handler);
    }

    std::weak_ptr<WebSocketSignalingChannel> weak = weak_from_this();
    return signaling::Subscription([weak, session_id, token] {
        auto self = weak.lock();
        if (!self) return;
        std::lock_guard<std::mutex> lock(self->mutex_);
        auto it = self->handlers_.find(session_id);
        if (it == self->handlers_.end()) return;
        it->second.erase(token);
        if (it->second.empty()) self->handlers_.erase(it);
    });
}

void WebSocketSignalingChannel::handleOpen() {
    // Held until the outbox is written; later sends queue up behind it
    std::lock_guard<std::mutex> writing(send_mutex_);
    std::vector<std::string> queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        opened_ = true;
        queued.swap(outbox_);
    }
    core::Logger::info("Signaling relay connected ({} queued)", queued.size());

    for (const auto& text : queued) {
        try {
            if (!ws_->send(text)) {
                core::Logger::warn("Dropped queued signaling message");
            }
        }
        catch (const std::exception& e) {
            core::Logger::warn("Dropped queued signaling message: {}", e.what());
        }
    }
}

void WebSocketSignalingChannel::handleClosed() {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_ = false;
    closed_ = true;
    core::Logger::warn("Signaling relay {} closed", url_);
}

void WebSocketSignalingChannel::handleText(const std::string& text) {
    auto decoded = signaling::SignalingMessage::fromJson(text);
    if (!decoded) {
        core::Logger::warn("Dropping malformed signaling message: {}", decoded.error().what());
        return;
    }

    const auto& message = decoded.value();
    std::vector<Handler> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(message.session_id);
        if (it == handlers_.end()) {
            core::Logger::debug("No subscriber for session {}", message.session_id);
            return;
        }
        for (const auto& [token, handler] : it->second) {
            targets.push_back(handler);
        }
    }
    for (const auto& handler : targets) {
        handler(message);
    }
}

} // namespace liveview::datachannel
