#include "platform/linux/timerfd_scheduler.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/timerfd.h>
#include <unistd.h>

TimerfdScheduler::TimerfdScheduler() = default;

TimerfdScheduler::~TimerfdScheduler() {
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool TimerfdScheduler::init() {
    timer_fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "scheduler: timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void TimerfdScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    queue_.push(Entry{.deadline = Clock::now() + delay, .seq = next_seq_++, .task = std::move(task)});
    rearm();
}

size_t TimerfdScheduler::dispatch_due() {
    // EAGAIN only means a re-arm raced with the wakeup.
    uint64_t expirations;
    ssize_t n;
    do {
        n = ::read(timer_fd_, &expirations, sizeof(expirations));
    } while (n < 0 && errno == EINTR);
    if (n < 0 && errno != EAGAIN) {
        std::println(stderr, "scheduler: timerfd read failed: {}", std::strerror(errno));
    }

    size_t ran = 0;
    auto now = Clock::now();
    while (!queue_.empty() && queue_.top().deadline <= now) {
        // Copy out before pop: the task may schedule more work.
        auto task = std::move(const_cast<Entry&>(queue_.top()).task);
        queue_.pop();
        task();
        ++ran;
    }

    rearm();
    return ran;
}

void TimerfdScheduler::rearm() {
    if (timer_fd_ < 0) return;

    itimerspec spec{};
    if (!queue_.empty()) {
        auto wait = queue_.top().deadline - Clock::now();
        // A zero it_value disarms the timer, so fire "now" as 1ns.
        auto ns = std::max<int64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(wait).count(), 1);
        spec.it_value.tv_sec = ns / 1'000'000'000;
        spec.it_value.tv_nsec = ns % 1'000'000'000;
    }

    if (::timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "scheduler: timerfd_settime failed: {}", std::strerror(errno));
    }
}
