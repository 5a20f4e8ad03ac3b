#include "meshstate/relay/EventLoop.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <deque>
#include <limits>
#include <system_error>

#include <unistd.h>

#ifdef __linux__
#include <sys/epoll.h>
#include <sys/eventfd.h>
#elif defined(__APPLE__)
#include <fcntl.h>
#include <sys/event.h>
#include <sys/time.h>
#endif

namespace meshstate::relay {

namespace {

constexpr int kMaxEvents = 64;

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

#ifdef __linux__
std::uint32_t to_epoll(std::uint32_t events) {
    std::uint32_t mask = 0;
    if (events & EventLoop::kEventReadable) {
        mask |= EPOLLIN;
    }
    if (events & EventLoop::kEventWritable) {
        mask |= EPOLLOUT;
    }
    return mask;
}

std::uint32_t from_epoll(std::uint32_t mask) {
    std::uint32_t events = EventLoop::kEventNone;
    if (mask & EPOLLIN) {
        events |= EventLoop::kEventReadable;
    }
    if (mask & EPOLLOUT) {
        events |= EventLoop::kEventWritable;
    }
    if (mask & (EPOLLERR | EPOLLHUP)) {
        events |= EventLoop::kEventError;
    }
    return events;
}
#elif defined(__APPLE__)
bool set_nonblocking_cloexec(int fd) {
    const int status = ::fcntl(fd, F_GETFL, 0);
    const int descriptor = ::fcntl(fd, F_GETFD, 0);
    return status != -1 && descriptor != -1 && ::fcntl(fd, F_SETFL, status | O_NONBLOCK) != -1 &&
           ::fcntl(fd, F_SETFD, descriptor | FD_CLOEXEC) != -1;
}
#endif

}  // namespace

EventLoop::EventLoop() {
#ifdef __linux__
    backend_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (backend_fd_ < 0) {
        throw_errno("epoll_create1 failed");
    }
    wake_read_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_read_fd_ < 0) {
        close_fd(backend_fd_);
        throw_errno("eventfd failed");
    }
    wake_write_fd_ = wake_read_fd_;
#elif defined(__APPLE__)
    backend_fd_ = ::kqueue();
    if (backend_fd_ < 0) {
        throw_errno("kqueue failed");
    }
    int ends[2]{-1, -1};
    if (::pipe(ends) != 0 || !set_nonblocking_cloexec(ends[0]) || !set_nonblocking_cloexec(ends[1])) {
        const int saved = errno;
        close_fd(ends[0]);
        close_fd(ends[1]);
        close_fd(backend_fd_);
        throw std::system_error(saved, std::generic_category(), "wake pipe failed");
    }
    wake_read_fd_ = ends[0];
    wake_write_fd_ = ends[1];
#endif
    try {
        apply_interest(wake_read_fd_, InterestChange::Add, kEventReadable);
    } catch (const std::system_error&) {
        if (wake_write_fd_ != wake_read_fd_) {
            close_fd(wake_write_fd_);
        }
        close_fd(wake_read_fd_);
        close_fd(backend_fd_);
        throw;
    }
}

EventLoop::~EventLoop() {
    stop();
    if (wake_write_fd_ != wake_read_fd_) {
        close_fd(wake_write_fd_);
    }
    close_fd(wake_read_fd_);
    close_fd(backend_fd_);
}

void EventLoop::add(int fd, std::uint32_t events, EventCallback callback) {
    apply_interest(fd, InterestChange::Add, events);
    watchers_[fd] = Watcher{events, std::move(callback)};
}

void EventLoop::update(int fd, std::uint32_t events) {
    const auto it = watchers_.find(fd);
    if (it == watchers_.end() || it->second.events == events) {
        return;
    }
    it->second.events = events;
    apply_interest(fd, InterestChange::Modify, events);
}

void EventLoop::remove(int fd) {
    if (watchers_.erase(fd) > 0) {
        apply_interest(fd, InterestChange::Remove, kEventNone);
    }
}

void EventLoop::apply_interest(int fd, InterestChange change, std::uint32_t events) {
#ifdef __linux__
    epoll_event event{};
    event.events = to_epoll(events);
    event.data.fd = fd;
    switch (change) {
        case InterestChange::Add:
            if (::epoll_ctl(backend_fd_, EPOLL_CTL_ADD, fd, &event) != 0) {
                throw_errno("epoll_ctl ADD failed");
            }
            break;
        case InterestChange::Modify:
            ::epoll_ctl(backend_fd_, EPOLL_CTL_MOD, fd, &event);
            break;
        case InterestChange::Remove:
            ::epoll_ctl(backend_fd_, EPOLL_CTL_DEL, fd, nullptr);
            break;
    }
#elif defined(__APPLE__)
    // kqueue tracks read and write as separate filters.
    std::array<struct kevent, 2> changes{};
    int count = 0;
    const auto filter_change = [&](short filter, bool wanted) {
        if (wanted) {
            EV_SET(&changes[count++], fd, filter, EV_ADD, 0, 0, nullptr);
        } else if (change != InterestChange::Add) {
            EV_SET(&changes[count++], fd, filter, EV_DELETE, 0, 0, nullptr);
        }
    };
    filter_change(EVFILT_READ, (events & kEventReadable) != 0);
    filter_change(EVFILT_WRITE, (events & kEventWritable) != 0);
    if (count == 0) {
        return;
    }
    if (change == InterestChange::Add) {
        if (::kevent(backend_fd_, changes.data(), count, nullptr, 0, nullptr) != 0) {
            throw_errno("kevent add failed");
        }
    } else {
        // Deleting a filter that was never added reports ENOENT; nothing to undo.
        for (int i = 0; i < count; ++i) {
            ::kevent(backend_fd_, &changes[i], 1, nullptr, 0, nullptr);
        }
    }
#endif
}

bool EventLoop::poll_backend(int timeout_ms, ReadyList& ready) {
    ready.clear();
#ifdef __linux__
    std::array<epoll_event, kMaxEvents> events;
    const int count = ::epoll_wait(backend_fd_, events.data(), static_cast<int>(events.size()), timeout_ms);
    if (count < 0) {
        return errno == EINTR;
    }
    for (int i = 0; i < count; ++i) {
        // epoll_event is packed on x86-64; copy the members out before use.
        const int fd = events[i].data.fd;
        const std::uint32_t mask = events[i].events;
        ready.emplace_back(fd, from_epoll(mask));
    }
    return true;
#elif defined(__APPLE__)
    std::array<struct kevent, kMaxEvents> events;
    struct timespec timeout{};
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_nsec = static_cast<long>(timeout_ms % 1000) * 1000000L;
    const int count = ::kevent(backend_fd_, nullptr, 0, events.data(), static_cast<int>(events.size()),
                               timeout_ms < 0 ? nullptr : &timeout);
    if (count < 0) {
        return errno == EINTR;
    }
    // One fd may report its read and write filters separately.
    for (int i = 0; i < count; ++i) {
        const int fd = static_cast<int>(events[i].ident);
        std::uint32_t mask = kEventNone;
        if (events[i].filter == EVFILT_READ) {
            mask |= kEventReadable;
        } else if (events[i].filter == EVFILT_WRITE) {
            mask |= kEventWritable;
        }
        if (events[i].flags & EV_EOF) {
            mask |= kEventError;
        }
        const auto merged = std::find_if(ready.begin(), ready.end(), [fd](const auto& entry) {
            return entry.first == fd;
        });
        if (merged != ready.end()) {
            merged->second |= mask;
        } else {
            ready.emplace_back(fd, mask);
        }
    }
    return true;
#endif
}

void EventLoop::drain_wake() {
    std::array<char, 64> buffer{};
    // eventfd reads exactly 8 bytes; a pipe is drained until empty.
    while (::read(wake_read_fd_, buffer.data(), buffer.size()) > 0) {
        if (wake_read_fd_ == wake_write_fd_) {
            break;
        }
    }
}

void EventLoop::wake() {
    if (wake_write_fd_ < 0) {
        return;
    }
    const std::uint64_t one = 1;
    // A full pipe or saturated eventfd already guarantees a wakeup.
    const auto written = ::write(wake_write_fd_, &one, wake_read_fd_ == wake_write_fd_ ? sizeof(one) : 1);
    (void)written;
}

void EventLoop::post(Task task) {
    {
        std::scoped_lock lock(posted_mutex_);
        posted_.push_back(std::move(task));
    }
    wake();
}

EventLoop::TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, Task task) {
    const TimerId id = next_timer_id_++;
    const Clock::time_point due = Clock::now() + std::max(delay, std::chrono::milliseconds::zero());
    timer_deadlines_[id] = due;
    timers_.emplace(std::make_pair(due, id), std::move(task));
    return id;
}

void EventLoop::cancel(TimerId id) {
    const auto found = timer_deadlines_.find(id);
    if (found != timer_deadlines_.end()) {
        timers_.erase(std::make_pair(found->second, id));
        timer_deadlines_.erase(found);
    }
}

void EventLoop::run() {
    running_.store(true);
    ReadyList ready;
    ready.reserve(kMaxEvents);
    while (running_.load()) {
        if (!poll_backend(next_timeout_ms(), ready)) {
            break;
        }
        for (const auto& [fd, mask] : ready) {
            if (!running_.load()) {
                break;
            }
            if (fd == wake_read_fd_) {
                drain_wake();
            } else {
                dispatch(fd, mask);
            }
        }
        run_due_timers();
        run_posted();
    }
}

void EventLoop::stop() {
    if (running_.exchange(false)) {
        wake();
    }
}

void EventLoop::dispatch(int fd, std::uint32_t mask) {
    if (mask == kEventNone) {
        return;
    }
    const auto it = watchers_.find(fd);
    if (it == watchers_.end()) {
        return;
    }
    // Copied: the callback may remove its own watcher.
    const EventCallback callback = it->second.callback;
    callback(fd, mask);
}

int EventLoop::next_timeout_ms() {
    {
        std::scoped_lock lock(posted_mutex_);
        if (!posted_.empty()) {
            return 0;
        }
    }
    if (timers_.empty()) {
        return -1;
    }
    const auto remaining = timers_.begin()->first.first - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return 0;
    }
    // Round up so the timer is due when the wait returns.
    const auto millis = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
    return static_cast<int>(std::min<long long>(millis, std::numeric_limits<int>::max()));
}

void EventLoop::run_due_timers() {
    const auto now = Clock::now();
    while (running_.load() && !timers_.empty() && timers_.begin()->first.first <= now) {
        auto node = timers_.extract(timers_.begin());
        timer_deadlines_.erase(node.key().second);
        node.mapped()();
    }
}

void EventLoop::run_posted() {
    std::deque<Task> batch;
    {
        std::scoped_lock lock(posted_mutex_);
        batch.assign(std::make_move_iterator(posted_.begin()), std::make_move_iterator(posted_.end()));
        posted_.clear();
    }
    while (!batch.empty()) {
        if (!running_.load()) {
            // Unrun tasks go back in front for the next run().
            std::scoped_lock lock(posted_mutex_);
            posted_.insert(posted_.begin(), std::make_move_iterator(batch.begin()),
                           std::make_move_iterator(batch.end()));
            return;
        }
        Task task = std::move(batch.front());
        batch.pop_front();
        task();
    }
}

}  // namespace meshstate::relay
