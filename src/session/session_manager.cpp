#include <liveview/session/session_manager.hpp>
#include <liveview/core/logger.hpp>

#include <algorithm>
#include <cctype>

namespace liveview::session {

namespace {

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::future<void> resolved() {
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

} // namespace

SessionManager::SessionManager(std::shared_ptr<signaling::SignalingChannel> channel,
                               webrtc::PeerConnectionFactory factory,
                               SessionOptions options)
    : owned_loop_(core::make_event_loop())
    , loop_(owned_loop_.get())
    , channel_(std::move(channel))
    , factory_(std::move(factory))
    , options_(std::move(options)) {
    owned_loop_->start();
}

SessionManager::SessionManager(core::EventLoop& loop,
                               std::shared_ptr<signaling::SignalingChannel> channel,
                               webrtc::PeerConnectionFactory factory,
                               SessionOptions options)
    : loop_(&loop)
    , channel_(std::move(channel))
    , factory_(std::move(factory))
    , options_(std::move(options)) {
}

SessionManager::~SessionManager() {
    shutdown();
    if (owned_loop_) {
        owned_loop_->stop();
    }
    // Machines must die on the loop side of the stop, after their last task
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

SessionHandle SessionManager::startSession(const std::string& agent_id, Observer observer) {
    if (isBlank(agent_id)) {
        throw core::InvalidTargetError("An agent identifier is required to start a live session");
    }

    auto machine = SessionMachine::create(*loop_, channel_, factory_, options_, agent_id);
    if (observer) {
        machine->setObserver(std::move(observer));
    }
    SessionHandle handle{machine->sessionId(), agent_id};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneFinishedLocked();
        sessions_[handle.session_id] = machine;
    }

    core::Logger::info("Starting live session {} for agent {}", handle.session_id, agent_id);
    // Selalu lewat antrian, juga dari thread loop sendiri
    loop_->post([machine] { machine->start(); });
    return handle;
}

std::future<void> SessionManager::endSession(const SessionHandle& handle) {
    auto machine = find(handle);
    if (!machine) {
        return resolved();
    }

    auto done = std::make_shared<std::promise<void>>();
    auto resolved_flag = std::make_shared<bool>(false);
    auto resolve = [done, resolved_flag] {
        if (!*resolved_flag) {
            *resolved_flag = true;
            done->set_value();
        }
    };
    auto future = done->get_future();
    try {
        runOnLoop([machine, resolve] {
            // end() only queues when the machine is mid-dispatch (an observer
            // calling back in), so completion comes from the disposal path.
            machine->whenDisposed(resolve);
            try {
                machine->end();
            }
            catch (const std::exception& e) {
                core::Logger::error("Ending session {} failed: {}", machine->sessionId(), e.what());
                resolve();
            }
        });
    }
    catch (const std::exception& e) {
        core::Logger::error("Could not schedule end of session {}: {}", handle.session_id, e.what());
        return resolved();
    }
    return future;
}

std::optional<SessionSnapshot> SessionManager::snapshot(const SessionHandle& handle) const {
    auto machine = find(handle);
    if (!machine) {
        return std::nullopt;
    }
    return machine->snapshot();
}

bool SessionManager::observe(const SessionHandle& handle, Observer observer) {
    auto machine = find(handle);
    if (!machine) {
        return false;
    }
    machine->setObserver(std::move(observer));
    return true;
}

std::vector<SessionHandle> SessionManager::activeSessions() const {
    std::vector<SessionHandle> active;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, machine] : sessions_) {
        if (!isTerminal(machine->snapshot().state)) {
            active.push_back(SessionHandle{id, machine->agentId()});
        }
    }
    return active;
}

void SessionManager::shutdown() {
    std::vector<std::future<void>> pending;
    for (const auto& handle : activeSessions()) {
        pending.push_back(endSession(handle));
    }
    if (!loop_->isRunning()) {
        // Manual loop: the caller drives it
        loop_->processAll();
        return;
    }
    if (!loop_->isLoopThread()) {
        for (auto& f : pending) {
            f.wait();
        }
    }
}

std::size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionManager::pruneFinishedLocked() {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (isTerminal(it->second->snapshot().state)) {
            core::Logger::debug("Dropping finished session {}", it->first);
            it = sessions_.erase(it);
        }
        else {
            ++it;
        }
    }
}

std::shared_ptr<SessionMachine> SessionManager::find(const SessionHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(handle.session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void SessionManager::runOnLoop(core::EventLoop::Task task) {
    if (loop_->isLoopThread()) {
        task();
        return;
    }
    loop_->post(std::move(task));
}

} // namespace liveview::session
