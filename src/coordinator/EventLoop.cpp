#include "swarmshare/coordinator/EventLoop.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <system_error>
#include <utility>

#ifndef __linux__
#error "EventLoop requires epoll (Linux)."
#endif

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace swarmshare::coordinator {

namespace {

constexpr int kMaxEvents = 64;

std::uint32_t to_epoll_mask(std::uint32_t events) {
    std::uint32_t mask = 0;
    if (events & EventLoop::kEventReadable) {
        mask |= EPOLLIN;
    }
    if (events & EventLoop::kEventWritable) {
        mask |= EPOLLOUT;
    }
    return mask;
}

}  // namespace

EventLoop::EventLoop() {
    backend_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (backend_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_create1 failed");
    }
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        const auto error = errno;
        ::close(backend_fd_);
        throw std::system_error(error, std::generic_category(), "eventfd failed");
    }
    epoll_event event{};
    event.events = EPOLLIN;
    event.data.fd = wake_fd_;
    if (::epoll_ctl(backend_fd_, EPOLL_CTL_ADD, wake_fd_, &event) != 0) {
        const auto error = errno;
        ::close(wake_fd_);
        ::close(backend_fd_);
        throw std::system_error(error, std::generic_category(), "epoll_ctl ADD wake_fd failed");
    }
}

EventLoop::~EventLoop() {
    stop();
    for (const auto& [fd, _] : timers_) {
        ::close(fd);
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
    if (backend_fd_ >= 0) {
        ::close(backend_fd_);
    }
}

void EventLoop::add(int fd, std::uint32_t events, EventCallback callback) {
    Watcher watcher;
    watcher.events = events;
    watcher.callback = std::move(callback);
    watchers_[fd] = std::move(watcher);

    epoll_event event{};
    event.events = to_epoll_mask(events);
    event.data.fd = fd;
    if (::epoll_ctl(backend_fd_, EPOLL_CTL_ADD, fd, &event) != 0) {
        watchers_.erase(fd);
        throw std::system_error(errno, std::generic_category(), "epoll_ctl ADD failed");
    }
}

void EventLoop::update(int fd, std::uint32_t events) {
    auto it = watchers_.find(fd);
    if (it == watchers_.end() || it->second.events == events) {
        return;
    }
    it->second.events = events;
    epoll_event event{};
    event.events = to_epoll_mask(events);
    event.data.fd = fd;
    ::epoll_ctl(backend_fd_, EPOLL_CTL_MOD, fd, &event);
}

void EventLoop::remove(int fd) {
    if (watchers_.erase(fd) == 0) {
        return;
    }
    ::epoll_ctl(backend_fd_, EPOLL_CTL_DEL, fd, nullptr);
}

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds interval, Task task) {
    const int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "timerfd_create failed");
    }

    const auto millis = std::max<std::chrono::milliseconds::rep>(interval.count(), 1);
    itimerspec spec{};
    spec.it_interval.tv_sec = static_cast<time_t>(millis / 1000);
    spec.it_interval.tv_nsec = static_cast<long>((millis % 1000) * 1000000);
    spec.it_value = spec.it_interval;
    if (::timerfd_settime(fd, 0, &spec, nullptr) != 0) {
        const auto error = errno;
        ::close(fd);
        throw std::system_error(error, std::generic_category(), "timerfd_settime failed");
    }

    timers_[fd] = std::move(task);
    add(fd, kEventReadable, [this](int timer_fd, std::uint32_t) {
        std::uint64_t expirations = 0;
        if (::read(timer_fd, &expirations, sizeof(expirations)) != static_cast<ssize_t>(sizeof(expirations))) {
            return;
        }
        const auto it = timers_.find(timer_fd);
        if (it != timers_.end()) {
            auto task = it->second;
            task();
        }
    });
    return fd;
}

void EventLoop::cancel_timer(TimerId id) {
    if (timers_.erase(id) == 0) {
        return;
    }
    remove(id);
    ::close(id);
}

void EventLoop::post(Task task) {
    {
        std::scoped_lock lock(posted_mutex_);
        posted_.push_back(std::move(task));
    }
    wake();
}

void EventLoop::run() {
    running_.store(true);
    std::array<epoll_event, kMaxEvents> events;
    while (!stop_requested_.load()) {
        const int ready = ::epoll_wait(backend_fd_, events.data(), static_cast<int>(events.size()), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < ready; ++i) {
            const int fd = events[i].data.fd;
            if (fd == wake_fd_) {
                std::uint64_t value = 0;
                const auto consumed = ::read(wake_fd_, &value, sizeof(value));
                (void)consumed;
                drain_posted();
                continue;
            }
            auto it = watchers_.find(fd);
            if (it == watchers_.end()) {
                continue;
            }
            const auto mask = translate_events(events[i].events);
            if (mask == kEventNone) {
                continue;
            }
            // The callback may remove its own watcher.
            auto callback = it->second.callback;
            callback(fd, mask);
        }
    }
    drain_posted();
    running_.store(false);
}

void EventLoop::stop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    wake();
}

void EventLoop::wake() {
    if (wake_fd_ >= 0) {
        const std::uint64_t value = 1;
        const auto written = ::write(wake_fd_, &value, sizeof(value));
        (void)written;
    }
}

void EventLoop::drain_posted() {
    std::vector<Task> tasks;
    {
        std::scoped_lock lock(posted_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        task();
    }
}

std::uint32_t EventLoop::translate_events(std::uint32_t backend_mask) const {
    std::uint32_t mask = kEventNone;
    if (backend_mask & EPOLLIN) {
        mask |= kEventReadable;
    }
    if (backend_mask & EPOLLOUT) {
        mask |= kEventWritable;
    }
    if (backend_mask & (EPOLLERR | EPOLLHUP)) {
        mask |= kEventError;
    }
    return mask;
}

}  // namespace swarmshare::coordinator
