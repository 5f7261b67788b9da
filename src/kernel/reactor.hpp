#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace vigil::kernel {

// Event types
enum class EventType : uint32_t {
    READABLE  = 0x001
};

// Event callback: (fd, events) -> void
using EventCallback = std::function<void(int fd, uint32_t events)>;

// Timer callback, invoked once per expiry batch
using TimerCallback = std::function<void()>;

class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Initialize epoll
    bool init();

    // Add fd to watch (returns true on success)
    bool add(int fd, uint32_t events, EventCallback callback);

    // Remove fd from watch
    bool remove(int fd);

    // Periodic timer backed by a timerfd. Returns the timer fd, or -1.
    int add_timer(std::chrono::milliseconds interval, TimerCallback callback,
                  bool fire_immediately = false);

    // Remove and close a timer created by add_timer
    bool remove_timer(int timer_fd);

    // Run one iteration of event loop
    // timeout_ms: -1 = block forever, 0 = return immediately
    int poll(int timeout_ms = -1);

    size_t timer_count() const { return timers_.size(); }

private:
    int epoll_fd_ = -1;
    std::unordered_map<int, EventCallback> callbacks_;
    std::unordered_map<int, TimerCallback> timers_;
};

} // namespace vigil::kernel
