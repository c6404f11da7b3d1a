#include <liveview/core/event_loop.hpp>
#include <liveview/core/logger.hpp>

namespace liveview::core {

Clock::time_point ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += d;
}

EventLoop::EventLoop(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<SteadyClock>();
    }
}

EventLoop::~EventLoop() {
    if (running_) {
        stop();
    }
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread(&EventLoop::run, this);
    loop_thread_id_ = worker_.get_id();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }

    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    loop_thread_id_ = std::thread::id{};
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_queue_.push(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_.emplace(id, Timer{clock_->now() + delay, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

bool EventLoop::isLoopThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        // Manual mode: whoever drives processAll() is the loop thread.
        return true;
    }
    return std::this_thread::get_id() == loop_thread_id_;
}

bool EventLoop::takeReady(Task& out) {
    if (!task_queue_.empty()) {
        out = std::move(task_queue_.front());
        task_queue_.pop();
        return true;
    }

    // Timer paling awal yang sudah lewat deadline
    auto now = clock_->now();
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline <= now &&
            (due == timers_.end() || it->second.deadline < due->second.deadline)) {
            due = it;
        }
    }
    if (due == timers_.end()) {
        return false;
    }

    out = std::move(due->second.task);
    timers_.erase(due);
    return true;
}

void EventLoop::runTask(Task& task) {
    try {
        task();
    }
    catch (const std::exception& e) {
        Logger::error("Error processing task: {}", e.what());
    }
}

bool EventLoop::processOne() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!takeReady(task)) {
            return false;
        }
    }

    runTask(task);
    return true;
}

void EventLoop::processAll() {
    while (processOne()) {}
}

std::size_t EventLoop::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_queue_.size();
}

std::size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_requested_) {
        Task task;
        if (takeReady(task)) {
            // Release lock selama processing
            lock.unlock();
            runTask(task);
            lock.lock();
            continue;
        }

        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin()->second.deadline;
        for (const auto& [id, timer] : timers_) {
            if (timer.deadline < next) next = timer.deadline;
        }
        cv_.wait_for(lock, next - clock_->now());
    }
}

} // namespace liveview::core
