#pragma once

#include <functional>
#include <string>

#include <liveview/core/error.hpp>
#include <liveview/signaling/message.hpp>

namespace liveview::signaling {

// Disposer returned by SignalingChannel::subscribe. Disposing stops delivery
// and releases the underlying listener; it is idempotent and also runs on
// destruction.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> disposer);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void dispose();
    bool active() const noexcept { return static_cast<bool>(disposer_); }

private:
    std::function<void()> disposer_;
};

// Bidirectional relay keyed by session id. Delivery is ordered per session
// but not guaranteed. Implementations must tolerate concurrent use by
// distinct session ids.
class SignalingChannel {
public:
    using Handler = std::function<void(const SignalingMessage&)>;

    virtual ~SignalingChannel() = default;

    virtual core::Result<void> send(const std::string& session_id, const SignalingMessage& message) = 0;

    // Every call opens an independent delivery; callers subscribe once per session.
    [[nodiscard]] virtual Subscription subscribe(const std::string& session_id, Handler handler) = 0;
};

} // namespace liveview::signaling
