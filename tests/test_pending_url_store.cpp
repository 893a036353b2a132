#include <catch2/catch_test_macros.hpp>

#include "pending_url_store.hpp"

#include <system_error>
#include <thread>
#include <vector>

namespace {

// Lock that can never be acquired, as after a failed pthread_mutex_lock.
struct BrokenMutex {
    void lock() {
        throw std::system_error(std::make_error_code(std::errc::resource_deadlock_would_occur));
    }
    void unlock() {}
};

} // namespace

TEST_CASE("PendingUrlStore", "[pending]") {
    PendingUrlStore store;

    SECTION("EmptyOnConstruction") {
        REQUIRE_FALSE(store.take().has_value());
    }

    SECTION("TakeReturnsValueOnce") {
        REQUIRE(store.set("app://open?id=1"));
        auto url = store.take();
        REQUIRE(url.has_value());
        REQUIRE(*url == "app://open?id=1");
        REQUIRE_FALSE(store.take().has_value());
    }

    SECTION("LastWriteWins") {
        store.set("app://a");
        store.set("app://b");
        REQUIRE(store.take() == "app://b");
        REQUIRE_FALSE(store.take().has_value());
    }

    SECTION("SetAfterTakeRefills") {
        store.set("app://first");
        REQUIRE(store.take() == "app://first");
        store.set("app://second");
        REQUIRE(store.take() == "app://second");
    }

    SECTION("TakeFromAnotherThread") {
        store.set("app://threaded");
        std::optional<std::string> seen;
        std::thread t([&] { seen = store.take(); });
        t.join();
        REQUIRE(seen == "app://threaded");
        REQUIRE_FALSE(store.take().has_value());
    }

    SECTION("ConcurrentTakersSeeValueAtMostOnce") {
        store.set("app://race");
        std::vector<std::optional<std::string>> results(8);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i] { results[i] = store.take(); });
        }
        for (auto& t : threads) t.join();

        int hits = 0;
        for (auto& r : results) {
            if (r) {
                ++hits;
                REQUIRE(*r == "app://race");
            }
        }
        REQUIRE(hits == 1);
    }
}

TEST_CASE("PendingUrlStore lock failure", "[pending]") {
    BasicPendingUrlStore<BrokenMutex> store;

    SECTION("SetReportsDrop") {
        REQUIRE_FALSE(store.set("app://lost"));
    }

    SECTION("TakeReturnsNothing") {
        store.set("app://lost");
        REQUIRE_FALSE(store.take().has_value());
    }
}
