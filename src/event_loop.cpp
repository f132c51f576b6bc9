#include "event_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace shellhost {

EventLoop::EventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::runtime_error(std::string("epoll_create1 failed: ") + std::strerror(errno));
    }
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        ::close(epoll_fd_);
        throw std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno));
    }
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) != 0) {
        ::close(wake_fd_);
        ::close(epoll_fd_);
        throw std::runtime_error(std::string("epoll_ctl failed: ") + std::strerror(errno));
    }
}

EventLoop::~EventLoop() {
    if (wake_fd_ >= 0) ::close(wake_fd_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    wake();
}

void EventLoop::wake() {
    uint64_t one = 1;
    ssize_t n = ::write(wake_fd_, &one, sizeof(one));
    (void)n; // EAGAIN means the counter is already non-zero
}

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Task task) {
    TimerId id = next_timer_id_++;
    timers_[id] = Timer{std::chrono::steady_clock::now() + delay, std::move(task)};
    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    return timers_.erase(id) > 0;
}

bool EventLoop::watch_fd(int fd, FdHandler handler) {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
        std::cerr << "[loop] epoll_ctl(ADD, " << fd << ") failed: "
                  << std::strerror(errno) << "\n";
        return false;
    }
    fd_handlers_[fd] = std::make_shared<FdHandler>(std::move(handler));
    return true;
}

void EventLoop::unwatch_fd(int fd) {
    if (fd_handlers_.erase(fd) > 0) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    }
}

int EventLoop::next_timeout_ms(std::chrono::milliseconds max_wait) const {
    auto wait = max_wait;
    auto now = std::chrono::steady_clock::now();
    for (const auto& [id, timer] : timers_) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
            timer.deadline - now);
        if (until.count() < 0) until = std::chrono::milliseconds(0);
        // Round up so we never wake just before the deadline and spin.
        if (timer.deadline > now + until) until += std::chrono::milliseconds(1);
        if (until < wait) wait = until;
    }
    return static_cast<int>(wait.count());
}

void EventLoop::drain_posted() {
    uint64_t val;
    while (::read(wake_fd_, &val, sizeof(val)) > 0) {}

    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        task();
    }
}

void EventLoop::fire_due_timers() {
    auto now = std::chrono::steady_clock::now();
    std::vector<TimerId> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.deadline <= now) due.push_back(id);
    }
    for (TimerId id : due) {
        // A handler that ran earlier in this pass may have cancelled it.
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        Task task = std::move(it->second.task);
        timers_.erase(it);
        task();
    }
}

void EventLoop::run_once(std::chrono::milliseconds max_wait) {
    constexpr int kMaxEvents = 16;
    epoll_event events[kMaxEvents];

    int n = epoll_wait(epoll_fd_, events, kMaxEvents, next_timeout_ms(max_wait));
    if (n < 0 && errno != EINTR) {
        std::cerr << "[loop] epoll_wait failed: " << std::strerror(errno) << "\n";
    }

    for (int i = 0; i < n; ++i) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            drain_posted();
            continue;
        }
        auto it = fd_handlers_.find(fd);
        if (it == fd_handlers_.end()) continue;
        // Keep the handler alive even if it unwatches its own fd.
        auto handler = it->second;
        (*handler)(events[i].events);
    }

    fire_due_timers();
}

void EventLoop::run() {
    running_.store(true, std::memory_order_release);
    while (running_.load(std::memory_order_acquire)) {
        run_once(std::chrono::milliseconds(1000));
    }
}

bool EventLoop::run_until(const std::function<bool()>& pred,
                          std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return pred();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        run_once(std::min(left, std::chrono::milliseconds(20)));
    }
    return true;
}

void EventLoop::stop() {
    running_.store(false, std::memory_order_release);
    wake();
}

} // namespace shellhost
