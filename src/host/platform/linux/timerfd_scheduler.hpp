#pragma once

#include "platform/scheduler.hpp"

#include <cstdint>
#include <queue>
#include <vector>

// Runs deferred tasks on the event loop thread. One timerfd is armed for
// the earliest deadline; the loop calls dispatch_due() when it fires.
class TimerfdScheduler : public Scheduler {
public:
    TimerfdScheduler();
    ~TimerfdScheduler() override;

    TimerfdScheduler(const TimerfdScheduler&) = delete;
    TimerfdScheduler& operator=(const TimerfdScheduler&) = delete;

    bool init();
    int fd() const { return timer_fd_; }

    void schedule_after(std::chrono::milliseconds delay, Task task) override;
    Clock::time_point now() const override { return Clock::now(); }

    // Runs every task whose deadline has passed, then re-arms the timer.
    // Returns the number of tasks run.
    size_t dispatch_due();
    size_t pending() const { return queue_.size(); }

private:
    struct Entry {
        Clock::time_point deadline;
        uint64_t seq; // FIFO among equal deadlines
        Task task;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    void rearm();

    int timer_fd_ = -1;
    uint64_t next_seq_ = 0;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
};
