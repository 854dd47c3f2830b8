// EN: Unit tests for the fixed-size ThreadPool
// FR: Tests unitaires pour le ThreadPool de taille fixe

#include <gtest/gtest.h>
#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

using namespace ConCat;

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    static ThreadPoolConfig makeConfig(size_t threads, size_t max_queue = 0) {
        ThreadPoolConfig config;
        config.thread_count = threads;
        config.max_queue_size = max_queue;
        config.name = "test_pool";
        return config;
    }
};

TEST_F(ThreadPoolTest, RejectsZeroThreads) {
    EXPECT_THROW(ThreadPool(makeConfig(0)), std::invalid_argument);
}

TEST_F(ThreadPoolTest, ReturnsResultsThroughFutures) {
    ThreadPool pool(makeConfig(2));
    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    auto text = pool.submitNamed("concat", [](const std::string& s) { return s + "!"; }, std::string("done"));

    EXPECT_EQ(sum.get(), 5);
    EXPECT_EQ(text.get(), "done!");
}

TEST_F(ThreadPoolTest, PropagatesTaskExceptions) {
    ThreadPool pool(makeConfig(2));
    auto failing = pool.submit([]() -> int { throw std::runtime_error("rewrite failed"); });
    auto fine = pool.submit([]() { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 7);

    pool.waitForAll();
    EXPECT_EQ(pool.getStats().failed_tasks, 1u);
}

TEST_F(ThreadPoolTest, WaitForAllIsABarrier) {
    ThreadPool pool(makeConfig(3));
    std::atomic<int> finished{0};
    for (int i = 0; i < 12; ++i) {
        pool.submit([&finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            finished++;
        });
    }

    pool.waitForAll();
    EXPECT_EQ(finished.load(), 12);

    auto stats = pool.getStats();
    EXPECT_EQ(stats.completed_tasks, 12u);
    EXPECT_EQ(stats.queued_tasks, 0u);
    EXPECT_EQ(stats.active_threads, 0u);
    EXPECT_EQ(stats.total_threads, 3u);
}

TEST_F(ThreadPoolTest, NeverRunsMoreTasksThanWorkers) {
    ThreadPool pool(makeConfig(2));
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 8; ++i) {
        pool.submit([&]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        });
    }
    pool.waitForAll();
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST_F(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    ThreadPool pool(makeConfig(1));
    std::atomic<int> finished{0};
    for (int i = 0; i < 5; ++i) {
        pool.submit([&finished]() { finished++; });
    }
    pool.shutdown();

    EXPECT_EQ(finished.load(), 5);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
    pool.shutdown();
}

TEST_F(ThreadPoolTest, BoundedQueueRejectsOverflow) {
    ThreadPool pool(makeConfig(1, 1));
    std::atomic<bool> release{false};
    auto blocker = pool.submit([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    // EN: Wait until the worker holds the blocker so the queue is empty
    // FR: Attend que le worker tienne la tâche bloquante pour que la queue soit vide
    while (pool.getStats().active_threads == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto queued = pool.submit([]() {});
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    release = true;
    blocker.get();
    queued.get();
    EXPECT_EQ(pool.getStats().peak_queue_size, 1u);
}

TEST_F(ThreadPoolTest, TasksRunOnWorkerThreads) {
    ThreadPool pool(makeConfig(2));
    std::set<std::thread::id> ids;
    std::mutex ids_mutex;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(pool.submit([&]() {
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.insert(std::this_thread::get_id());
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(ids.count(std::this_thread::get_id()), 0u);
    EXPECT_LE(ids.size(), 2u);
}
