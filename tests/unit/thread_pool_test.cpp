#include <stylec/platform/thread_pool.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace stylec::platform;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, ZeroThreadsStillStartsOneWorker) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([](int a, int b) { return a * b; }, 6, 7).get(), 42);
}

TEST(ThreadPoolTest, SubmitCarriesExceptions) {
    ThreadPool pool(2);
    auto future = pool.submit([]() -> int { throw std::logic_error("bad sheet"); });
    EXPECT_THROW(future.get(), std::logic_error);
}

// ---------------------------------------------------------------------------
// map
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, MapKeepsItemOrder) {
    ThreadPool pool(4);
    std::vector<int> items;
    for (int i = 0; i < 64; ++i) items.push_back(i);

    auto results = pool.map(items, [](const int& value) {
        // Later items finish first
        std::this_thread::sleep_for(std::chrono::microseconds(64 - value));
        return std::to_string(value);
    });

    ASSERT_EQ(results.size(), items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(results[i], std::to_string(items[i]));
    }
}

TEST(ThreadPoolTest, MapSpreadsAcrossWorkers) {
    constexpr int kWorkers = 3;
    ThreadPool pool(kWorkers);
    std::mutex mutex;
    std::set<std::thread::id> seen;
    std::atomic<int> started{0};

    // Each item waits until every worker holds one, so they must overlap
    std::vector<int> items(kWorkers, 0);
    pool.map(items, [&](const int&) {
        {
            std::lock_guard lock(mutex);
            seen.insert(std::this_thread::get_id());
        }
        started.fetch_add(1);
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (started.load() < kWorkers && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        return 0;
    });
    EXPECT_EQ(seen.size(), static_cast<size_t>(kWorkers));
}

TEST(ThreadPoolTest, MapOfNothing) {
    ThreadPool pool(2);
    std::vector<std::string> items;
    EXPECT_TRUE(pool.map(items, [](const std::string& s) { return s.size(); }).empty());
}

TEST(ThreadPoolTest, MapRethrowsAfterEveryItemRan) {
    ThreadPool pool(2);
    std::atomic<int> ran{0};
    std::vector<int> items = {1, 2, 3, 4};
    EXPECT_THROW(pool.map(items,
                          [&ran](const int& value) {
                              ran.fetch_add(1);
                              if (value == 2) throw std::runtime_error("item 2");
                              return value;
                          }),
                 std::runtime_error);
    EXPECT_EQ(ran.load(), 4);
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------
TEST(ThreadPoolTest, ShutdownRunsQueuedWork) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};
    for (int i = 0; i < 30; ++i) {
        pool.submit([&counter]() {
            std::this_thread::sleep_for(1ms);
            counter.fetch_add(1);
        });
    }
    pool.shutdown();
    EXPECT_EQ(counter.load(), 30);

    EXPECT_NO_THROW(pool.shutdown());
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}

TEST(ThreadPoolTest, DestructorRunsQueuedWork) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.submit([&counter]() { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 10);
}
