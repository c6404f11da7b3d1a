#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace liveview::core {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Waktu hanya bergerak lewat advance(), untuk test timeout
class ManualClock : public Clock {
public:
    time_point now() const override;
    void advance(duration d);

private:
    mutable std::mutex mutex_;
    time_point now_{};
};

// Single logical task queue. Every task and every expired timer runs on the
// same thread (the worker after start(), or the caller of processOne/processAll).
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    explicit EventLoop(std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>());
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();
    void stop();

    void post(Task task);

    // Runs task once `delay` has elapsed on this loop's clock.
    TimerId schedule(std::chrono::milliseconds delay, Task task);
    // Returns false if the timer already fired or was cancelled.
    bool cancel(TimerId id);

    // Process a single ready task or due timer
    bool processOne();

    // Process until nothing is ready
    void processAll();

    bool isRunning() const noexcept { return running_; }
    bool isLoopThread() const;

    std::size_t queueSize() const;
    std::size_t pendingTimers() const;

    Clock& clock() noexcept { return *clock_; }

private:
    struct Timer {
        Clock::time_point deadline;
        Task task;
    };

    // Caller holds mutex_. Moves the next runnable task out, if any.
    bool takeReady(Task& out);
    void runTask(Task& task);
    void run();

    std::shared_ptr<Clock> clock_;
    std::queue<Task> task_queue_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::thread::id loop_thread_id_{};
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
};

inline std::unique_ptr<EventLoop> make_event_loop() {
    return std::make_unique<EventLoop>();
}

} // namespace liveview::core
