#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <liveview/core/event_loop.hpp>
#include <liveview/signaling/channel.hpp>

namespace liveview::signaling {

enum class Side {
    Viewer,
    Agent
};

// In-process relay between a viewer endpoint and an agent endpoint. Messages
// sent from one side are delivered, in send order, to the other side's
// subscribers for the same session id by posting onto the delivery loop.
class InMemorySignalingHub {
public:
    explicit InMemorySignalingHub(core::EventLoop& delivery_loop);
    ~InMemorySignalingHub();

    InMemorySignalingHub(const InMemorySignalingHub&) = delete;
    InMemorySignalingHub& operator=(const InMemorySignalingHub&) = delete;

    std::shared_ptr<SignalingChannel> endpoint(Side side);

    // Simulates a network partition: sends succeed but nothing is delivered.
    void setPartitioned(bool partitioned);

    // Decodes raw wire text and relays it as if sent by `from`. Malformed
    // input is logged and dropped.
    core::Result<void> injectRaw(Side from, const std::string& json);

    // Every message sent by `from`, including dropped ones.
    std::vector<SignalingMessage> sentBy(Side from) const;
    std::size_t subscriberCount(Side side, const std::string& session_id) const;

private:
    struct State;
    class Endpoint;

    std::shared_ptr<State> state_;
};

} // namespace liveview::signaling
