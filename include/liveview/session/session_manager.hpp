#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <liveview/core/event_loop.hpp>
#include <liveview/session/session_machine.hpp>

namespace liveview::session {

// Opaque reference to a session started by a SessionManager
struct SessionHandle {
    std::string session_id;
    std::string agent_id;

    bool valid() const noexcept { return !session_id.empty(); }
    bool operator==(const SessionHandle& other) const { return session_id == other.session_id; }
};

// Control surface for presentation code. All session work runs on one event
// loop; the public methods may be called from any thread except that
// endSession(...).wait() must not be used from inside the loop itself.
class SessionManager {
public:
    using Observer = SessionMachine::Observer;

    // Owns a loop running on its own worker thread
    SessionManager(std::shared_ptr<signaling::SignalingChannel> channel,
                   webrtc::PeerConnectionFactory factory,
                   SessionOptions options = {});
    // Borrows `loop`, which must outlive the manager
    SessionManager(core::EventLoop& loop,
                   std::shared_ptr<signaling::SignalingChannel> channel,
                   webrtc::PeerConnectionFactory factory,
                   SessionOptions options = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Throws core::InvalidTargetError for an empty or blank agent id, before
    // any network activity. The session starts on the loop; `observer`, when
    // given, is installed first and so sees every transition.
    SessionHandle startSession(const std::string& agent_id, Observer observer = {});

    // Resolves once the session's resources are released. Never throws;
    // unknown or already finished handles resolve immediately.
    std::future<void> endSession(const SessionHandle& handle);

    // Finished sessions stay readable until the next startSession() prunes them
    std::optional<SessionSnapshot> snapshot(const SessionHandle& handle) const;
    // Returns false for an unknown handle
    bool observe(const SessionHandle& handle, Observer observer);

    // Sessions that have not reached ended/error
    std::vector<SessionHandle> activeSessions() const;

    // Ends every session and waits for disposal
    void shutdown();

    // Sessions still held, finished ones not yet pruned included
    std::size_t size() const;

    core::EventLoop& loop() noexcept { return *loop_; }
    const SessionOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<SessionMachine> find(const SessionHandle& handle) const;
    void runOnLoop(core::EventLoop::Task task);
    // Drops sessions whose terminal snapshot is published; caller holds mutex_
    void pruneFinishedLocked();

    std::unique_ptr<core::EventLoop> owned_loop_;
    core::EventLoop* loop_;
    std::shared_ptr<signaling::SignalingChannel> channel_;
    webrtc::PeerConnectionFactory factory_;
    SessionOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionMachine>> sessions_;
};

} // namespace liveview::session
