#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace meshstate::core {

// Deferred work for the single-threaded mesh. Tasks never run re-entrantly
// from the call that queued them.
class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    virtual ~Scheduler() = default;

    virtual void post(Task task) = 0;
    virtual TimerId schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    // Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

}  // namespace meshstate::core
