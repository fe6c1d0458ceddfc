#include "../include/WorkerPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <fstream>
#include <sys/resource.h>
#include <unistd.h>

namespace {

// Virtual size of this process in bytes, from /proc/self/statm.
unsigned long long current_vm_bytes() {
    std::ifstream statm("/proc/self/statm");
    unsigned long long pages = 0;
    statm >> pages;
    return pages * static_cast<unsigned long long>(sysconf(_SC_PAGESIZE));
}

} // namespace

TEST(WorkerPoolTest, RunsEveryTaskOnBoundedWorkers) {
    std::atomic<int> done(0);
    std::atomic<int> in_flight(0);
    std::atomic<int> peak(0);

    WorkerPool pool("TestPool", 3);
    EXPECT_EQ(pool.workerCount(), 3u);

    for (int i = 0; i < 30; i++) {
        ASSERT_TRUE(pool.submit([&](size_t worker_index) {
            EXPECT_LT(worker_index, 3u);
            int now = ++in_flight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            in_flight--;
            done++;
        }));
    }
    pool.waitIdle();

    EXPECT_EQ(done.load(), 30);
    EXPECT_LE(peak.load(), 3);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotStopPool) {
    std::atomic<int> done(0);
    WorkerPool pool("TestPool", 1);

    ASSERT_TRUE(pool.submit([](size_t) { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool.submit([&](size_t) { done++; }));
    pool.waitIdle();

    EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, SubmitAfterShutdownFails) {
    WorkerPool pool("TestPool", 2);
    pool.shutdown();
    EXPECT_FALSE(pool.submit([](size_t) {}));
}

TEST(WorkerPoolDeathTest, KeepsStartedWorkersWhenThreadsRunOut) {
    EXPECT_EXIT({
        alarm(30);

        // Leave room for a few dozen thread stacks, far fewer than requested.
        rlimit limit;
        limit.rlim_cur = current_vm_bytes() + 256ULL * 1024 * 1024;
        limit.rlim_max = limit.rlim_cur;
        if (setrlimit(RLIMIT_AS, &limit) != 0) {
            std::_Exit(3);
        }

        std::atomic<int> done(0);
        {
            WorkerPool pool("TestPool", 4096);
            if (pool.workerCount() == 0 || pool.workerCount() >= 4096) {
                std::_Exit(2);
            }
            for (int i = 0; i < 100; i++) {
                if (!pool.submit([&done](size_t) { done++; })) {
                    std::_Exit(4);
                }
            }
            pool.waitIdle();
        }
        std::_Exit(done.load() == 100 ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}
