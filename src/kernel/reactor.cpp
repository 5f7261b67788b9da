#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace vigil::kernel {

namespace {

struct timespec to_timespec(std::chrono::milliseconds ms) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ms.count() / 1000);
    ts.tv_nsec = static_cast<long>((ms.count() % 1000) * 1000000);
    return ts;
}

} // namespace

Reactor::Reactor() = default;

Reactor::~Reactor() {
    for (const auto& [fd, callback] : timers_) {
        close(fd);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }
    spdlog::debug("Reactor initialized (epoll_fd={})", epoll_fd_);
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    struct epoll_event ev;
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Failed to add fd {} to epoll: {}", fd, strerror(errno));
        return false;
    }

    callbacks_[fd] = std::move(callback);
    spdlog::debug("Added fd {} to reactor (events=0x{:x})", fd, events);
    return true;
}

bool Reactor::remove(int fd) {
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        // ENOENT is ok - fd might already be closed
        if (errno != ENOENT) {
            spdlog::error("Failed to remove fd {} from epoll: {}", fd, strerror(errno));
            return false;
        }
    }

    callbacks_.erase(fd);
    spdlog::debug("Removed fd {} from reactor", fd);
    return true;
}

int Reactor::add_timer(std::chrono::milliseconds interval, TimerCallback callback,
                       bool fire_immediately) {
    if (interval.count() <= 0) {
        spdlog::error("Refusing timer with non-positive interval");
        return -1;
    }

    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        spdlog::error("Failed to create timerfd: {}", strerror(errno));
        return -1;
    }

    struct itimerspec spec;
    spec.it_interval = to_timespec(interval);
    // A zero it_value disarms the timer, so "immediately" means 1ns
    spec.it_value = fire_immediately ? timespec{0, 1} : to_timespec(interval);

    if (timerfd_settime(tfd, 0, &spec, nullptr) < 0) {
        spdlog::error("Failed to arm timerfd: {}", strerror(errno));
        close(tfd);
        return -1;
    }

    timers_[tfd] = std::move(callback);
    bool added = add(tfd, static_cast<uint32_t>(EventType::READABLE), [this](int fd, uint32_t) {
        uint64_t expirations = 0;
        if (read(fd, &expirations, sizeof(expirations)) != sizeof(expirations)) {
            return;
        }
        auto it = timers_.find(fd);
        if (it != timers_.end()) {
            it->second();
        }
    });
    if (!added) {
        timers_.erase(tfd);
        close(tfd);
        return -1;
    }

    spdlog::debug("Timer fd {} armed ({}ms)", tfd, interval.count());
    return tfd;
}

bool Reactor::remove_timer(int timer_fd) {
    if (timers_.erase(timer_fd) == 0) {
        return false;
    }
    bool removed = remove(timer_fd);
    close(timer_fd);
    return removed;
}

int Reactor::poll(int timeout_ms) {
    constexpr int MAX_EVENTS = 64;
    struct epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0; // Interrupted, not an error
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    // Process events
    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;
        uint32_t ev = events[i].events;

        auto it = callbacks_.find(fd);
        if (it != callbacks_.end()) {
            // Copy: the callback may remove itself
            auto callback = it->second;
            callback(fd, ev);
        }
    }

    return n;
}

} // namespace vigil::kernel
