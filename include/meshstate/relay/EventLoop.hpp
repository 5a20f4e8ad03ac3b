#pragma once

#include "meshstate/core/Scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meshstate::relay {

// Readiness loop over epoll (kqueue on macOS) with timers and a posted-task
// queue. post() may be called from any thread; everything else belongs to the
// thread running run().
class EventLoop : public core::Scheduler {
public:
    using EventCallback = std::function<void(int fd, std::uint32_t events)>;
    using Clock = std::chrono::steady_clock;

    static constexpr std::uint32_t kEventNone = 0;
    static constexpr std::uint32_t kEventReadable = 1u << 0;
    static constexpr std::uint32_t kEventWritable = 1u << 1;
    static constexpr std::uint32_t kEventError = 1u << 2;

    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void add(int fd, std::uint32_t events, EventCallback callback);
    void update(int fd, std::uint32_t events);
    void remove(int fd);

    void post(Task task) override;
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

    void run();
    void stop();
    bool running() const noexcept { return running_.load(); }

private:
    struct Watcher {
        std::uint32_t events{0};
        EventCallback callback;
    };

    using ReadyList = std::vector<std::pair<int, std::uint32_t>>;

    enum class InterestChange { Add, Modify, Remove };

    // Backend primitives. Only Add failures are reported.
    void apply_interest(int fd, InterestChange change, std::uint32_t events);
    // False when the backend wait fails for a reason other than EINTR.
    bool poll_backend(int timeout_ms, ReadyList& ready);
    void drain_wake();
    void wake();

    int next_timeout_ms();
    void run_due_timers();
    void run_posted();
    void dispatch(int fd, std::uint32_t mask);

#if !defined(__linux__) && !defined(__APPLE__)
#error "EventLoop currently supports Linux and macOS only."
#endif
    int backend_fd_{-1};
    // eventfd on Linux (both ends equal), a pipe on macOS.
    int wake_read_fd_{-1};
    int wake_write_fd_{-1};

    std::unordered_map<int, Watcher> watchers_;
    std::atomic<bool> running_{false};

    std::map<std::pair<Clock::time_point, TimerId>, Task> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;
    TimerId next_timer_id_{1};

    std::mutex posted_mutex_;
    std::vector<Task> posted_;
};

}  // namespace meshstate::relay
