#pragma once

#include <chrono>
#include <functional>

// Deferred execution of tasks after a delay. Tasks must not be assumed
// to run on the caller's stack; schedule_after never blocks.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;
    virtual void schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    virtual Clock::time_point now() const = 0;
};
