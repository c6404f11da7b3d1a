#include <liveview/presentation/state_copy.hpp>

namespace liveview::presentation {

namespace {

struct Row {
    session::SessionState state;
    StateCopy copy;
};

constexpr Row COPY[] = {
    {session::SessionState::Idle, {"Standby", "Request a stream to begin live viewing."}},
    {session::SessionState::Requesting, {"Request Sent", "Waiting for the agent desktop to acknowledge the request."}},
    {session::SessionState::Waiting, {"Waiting for Agent", "Agent desktop is preparing the live stream."}},
    {session::SessionState::Connecting, {"Connecting", "Negotiating secure peer connection…"}},
    {session::SessionState::Streaming, {"Live", "You are viewing the agent desktop in real time."}},
    {session::SessionState::Ended, {"Session Ended", "The live stream has ended."}},
    {session::SessionState::Error, {"Error", "Unable to establish the live session."}},
};

} // namespace

StateCopy copyFor(session::SessionState state) noexcept {
    for (const auto& row : COPY) {
        if (row.state == state) return row.copy;
    }
    return COPY[0].copy;
}

std::string feedDisplayLabel(const session::Feed& feed, std::size_t index) {
    if (feed.label && !feed.label->empty()) {
        return *feed.label;
    }
    return "Screen " + std::to_string(index + 1);
}

Description describe(const session::SessionSnapshot& snapshot) {
    const StateCopy copy = copyFor(snapshot.state);
    Description out{std::string(copy.title), std::string(copy.description)};
    if (snapshot.error && !snapshot.error->empty()) {
        out.body = *snapshot.error;
    }
    return out;
}

} // namespace liveview::presentation
