#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace shellhost {

// Single-threaded reactor that owns all component state.
// epoll for fd readiness, an eventfd for cross-thread posts, and a small
// timer table. Everything except post() and stop() must be called on the
// thread that runs the loop.
class EventLoop {
public:
    using Task = std::function<void()>;
    using FdHandler = std::function<void(uint32_t events)>;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Thread-safe: queue a task for the loop thread and wake the loop.
    void post(Task task);

    TimerId add_timer(std::chrono::milliseconds delay, Task task);
    // Returns false if the timer already fired or was never armed.
    bool cancel_timer(TimerId id);
    size_t pending_timers() const { return timers_.size(); }

    // Watch fd for readability (EPOLLIN; hangup and errors are reported too).
    bool watch_fd(int fd, FdHandler handler);
    void unwatch_fd(int fd);

    // Run until stop() is called.
    void run();

    // One wait-and-dispatch iteration, blocking at most max_wait.
    void run_once(std::chrono::milliseconds max_wait);

    // Iterate until pred() holds or the timeout expires. Returns pred().
    bool run_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

    // Thread-safe.
    void stop();

private:
    struct Timer {
        std::chrono::steady_clock::time_point deadline;
        Task task;
    };

    void wake();
    void drain_posted();
    void fire_due_timers();
    int next_timeout_ms(std::chrono::milliseconds max_wait) const;

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};

    std::mutex post_mutex_;
    std::vector<Task> posted_;

    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;

    std::unordered_map<int, std::shared_ptr<FdHandler>> fd_handlers_;
};

} // namespace shellhost
