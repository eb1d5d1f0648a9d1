#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "helpers/worker_pool.hpp"

using mailbridge::helpers::worker_pool;

TEST(WorkerPool, ReturnsResultsThroughFutures) {
    worker_pool pool{2, "test"};

    auto a = pool.submit([] { return 20; });
    auto b = pool.submit([] { return 22; });

    EXPECT_EQ(a.get() + b.get(), 42);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(WorkerPool, PropagatesExceptions) {
    worker_pool pool{1, "test"};

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });

    EXPECT_THROW(failing.get(), std::runtime_error);
}

TEST(WorkerPool, ZeroThreadsStillRuns) {
    worker_pool pool{0, "test"};

    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(WorkerPool, DrainsQueueBeforeShutdown) {
    std::atomic<int> done{0};
    {
        worker_pool pool{2, "test"};
        for (int i = 0; i < 50; ++i) {
            pool.submit([&done] { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 50);
}

TEST(WorkerPool, RunsTasksConcurrently) {
    worker_pool pool{2, "test"};
    std::promise<void> release;
    auto released = release.get_future().share();

    auto blocked = pool.submit([released] { released.wait(); return 1; });
    auto other = pool.submit([] { return 2; });

    // the second worker finishes while the first is still blocked
    EXPECT_EQ(other.get(), 2);
    release.set_value();
    EXPECT_EQ(blocked.get(), 1);
}
