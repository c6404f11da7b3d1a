#include <liveview/signaling/memory_channel.hpp>
#include <liveview/core/logger.hpp>

#include <atomic>
#include <map>

namespace liveview::signaling {

namespace {

Side opposite(Side side) {
    return side == Side::Viewer ? Side::Agent : Side::Viewer;
}

const char* sideName(Side side) {
    return side == Side::Viewer ? "viewer" : "agent";
}

struct Subscriber {
    SignalingChannel::Handler handler;
    std::atomic<bool> active{true};
};

} // namespace

struct InMemorySignalingHub::State {
    explicit State(core::EventLoop& loop) : loop(loop) {}

    core::Result<void> relay(Side from, const SignalingMessage& message);

    core::EventLoop& loop;
    mutable std::mutex mutex;
    bool partitioned = false;
    std::uint64_t next_id = 1;
    // side -> session -> subscriber id -> subscriber
    std::map<Side, std::unordered_map<std::string, std::map<std::uint64_t, std::shared_ptr<Subscriber>>>> subscribers;
    std::map<Side, std::vector<SignalingMessage>> history;
};

core::Result<void> InMemorySignalingHub::State::relay(Side from, const SignalingMessage& message) {
    std::vector<std::weak_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        history[from].push_back(message);
        if (partitioned) {
            core::Logger::debug("Partitioned: dropping {} from {}",
                                messageKindString(message.kind), sideName(from));
            return {};
        }

        auto& sessions = subscribers[opposite(from)];
        auto it = sessions.find(message.session_id);
        if (it != sessions.end()) {
            for (const auto& [id, subscriber] : it->second) {
                targets.push_back(subscriber);
            }
        }
    }

    for (auto& target : targets) {
        loop.post([target, message] {
            auto subscriber = target.lock();
            if (subscriber && subscriber->active) {
                subscriber->handler(message);
            }
        });
    }
    return {};
}

class InMemorySignalingHub::Endpoint : public SignalingChannel {
public:
    Endpoint(std::shared_ptr<State> state, Side side)
        : state_(std::move(state)), side_(side) {}

    core::Result<void> send(const std::string& session_id, const SignalingMessage& message) override {
        if (session_id.empty()) {
            return {core::ErrorCode::InvalidArgument, "Session id is required"};
        }
        SignalingMessage copy = message;
        copy.session_id = session_id;
        return state_->relay(side_, copy);
    }

    Subscription subscribe(const std::string& session_id, Handler handler) override {
        auto subscriber = std::make_shared<Subscriber>();
        subscriber->handler = std::move(handler);

        std::uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->subscribers[side_][session_id].emplace(id, subscriber);
        }

        std::weak_ptr<State> weak_state = state_;
        Side side = side_;
        return Subscription([weak_state, side, session_id, id, subscriber] {
            subscriber->active = false;
            auto state = weak_state.lock();
            if (!state) return;

            std::lock_guard<std::mutex> lock(state->mutex);
            auto& sessions = state->subscribers[side];
            auto it = sessions.find(session_id);
            if (it == sessions.end()) return;
            it->second.erase(id);
            if (it->second.empty()) {
                sessions.erase(it);
            }
        });
    }

private:
    std::shared_ptr<State> state_;
    Side side_;
};

InMemorySignalingHub::InMemorySignalingHub(core::EventLoop& delivery_loop)
    : state_(std::make_shared<State>(delivery_loop)) {}

InMemorySignalingHub::~InMemorySignalingHub() = default;

std::shared_ptr<SignalingChannel> InMemorySignalingHub::endpoint(Side side) {
    return std::make_shared<Endpoint>(state_, side);
}

void InMemorySignalingHub::setPartitioned(bool partitioned) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->partitioned = partitioned;
}

core::Result<void> InMemorySignalingHub::injectRaw(Side from, const std::string& json) {
    auto message = SignalingMessage::fromJson(json);
    if (!message) {
        core::Logger::warn("Ignoring malformed signaling message from {}: {}",
                           sideName(from), message.error().what());
        return message.error();
    }
    return state_->relay(from, message.value());
}

std::vector<SignalingMessage> InMemorySignalingHub::sentBy(Side from) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->history.find(from);
    return it != state_->history.end() ? it->second : std::vector<SignalingMessage>{};
}

std::size_t InMemorySignalingHub::subscriberCount(Side side, const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto side_it = state_->subscribers.find(side);
    if (side_it == state_->subscribers.end()) return 0;
    auto it = side_it->second.find(session_id);
    return it != side_it->second.end() ? it->second.size() : 0;
}

} // namespace liveview::signaling
