#pragma once

#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <system_error>
#include <utility>

// Zero or one deep-link URL waiting for the UI to ask for it.
// A new set() overwrites whatever was there; take() drains it.
// A lock() that throws std::system_error is logged and treated as
// "no value".
template <typename Mutex>
class BasicPendingUrlStore {
public:
    BasicPendingUrlStore() = default;

    BasicPendingUrlStore(const BasicPendingUrlStore&) = delete;
    BasicPendingUrlStore& operator=(const BasicPendingUrlStore&) = delete;

    // Returns false if the value could not be stored.
    bool set(std::string url) {
        try {
            std::lock_guard lock(mutex_);
            url_ = std::move(url);
            return true;
        } catch (const std::system_error& e) {
            std::println(stderr, "pending: failed to lock store, dropping URL: {}", e.what());
            return false;
        }
    }

    std::optional<std::string> take() {
        try {
            std::lock_guard lock(mutex_);
            return std::exchange(url_, std::nullopt);
        } catch (const std::system_error& e) {
            std::println(stderr, "pending: failed to lock store: {}", e.what());
            return std::nullopt;
        }
    }

private:
    Mutex mutex_;
    std::optional<std::string> url_;
};

using PendingUrlStore = BasicPendingUrlStore<std::mutex>;
