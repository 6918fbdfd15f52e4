#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "result_store.hpp"
#include "worker_pool.hpp"

TEST(WorkerPoolTest, ReturnsResults) {
    WorkerPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ExceptionsReachTheCaller) {
    WorkerPool pool(1);
    std::future<void> failing = pool.submit([]() { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, NeverRunsMoreTasksThanThreads) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    {
        WorkerPool pool(3);
        EXPECT_EQ(pool.size(), 3u);
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 12; ++i) {
            futures.push_back(pool.submit([&]() {
                int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                --running;
            }));
        }
        for (auto& future : futures) future.get();
    }
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, QueuedJobsRunBeforeShutdown) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 8; ++i) {
            pool.submit([&done]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                ++done;
            });
        }
    }
    EXPECT_EQ(done.load(), 8);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ResultStoreTest, OneRecordPerPort) {
    ResultStore store({22, 80, 443});
    EXPECT_EQ(store.size(), 3u);
    std::map<int, PortResult> snapshot = store.snapshot();
    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_FALSE(snapshot[22].scan_time.empty());
    EXPECT_EQ(snapshot[22].scan_time, snapshot[443].scan_time);
    EXPECT_TRUE(snapshot[80].tcp_states.empty());
}

TEST(ResultStoreTest, UpdatesAreVisible) {
    ResultStore store({80});
    store.update(80, [](PortResult& result) { result.tcp_states[ScanTechnique::SYN] = STATE_OPEN; });
    EXPECT_TRUE(store.get(80).isOpen());
}

TEST(ResultStoreTest, UnknownPortThrows) {
    ResultStore store({80});
    EXPECT_THROW(store.get(81), std::out_of_range);
    EXPECT_THROW(store.update(81, [](PortResult&) {}), std::out_of_range);
}

TEST(ResultStoreTest, ConcurrentUpdatesAreSerialised) {
    ResultStore store({80});
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store]() {
            for (int i = 0; i < 100; ++i) {
                store.update(80, [](PortResult& result) { result.vulns.push_back("x"); });
            }
        });
    }
    for (auto& thread : threads) thread.join();
    EXPECT_EQ(store.get(80).vulns.size(), 800u);
}
