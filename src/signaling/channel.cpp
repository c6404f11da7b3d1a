#include <liveview/signaling/channel.hpp>
#include <liveview/core/logger.hpp>

namespace liveview::signaling {

Subscription::Subscription(std::function<void()> disposer)
    : disposer_(std::move(disposer)) {}

Subscription::~Subscription() {
    dispose();
}

Subscription::Subscription(Subscription&& other) noexcept
    : disposer_(std::move(other.disposer_)) {
    other.disposer_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        dispose();
        disposer_ = std::move(other.disposer_);
        other.disposer_ = nullptr;
    }
    return *this;
}

void Subscription::dispose() {
    if (!disposer_) {
        return;
    }
    auto disposer = std::move(disposer_);
    disposer_ = nullptr;
    try {
        disposer();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Failed to dispose signaling subscription: {}", e.what());
    }
}

} // namespace liveview::signaling
