#include <gtest/gtest.h>
#include "cw/BoundedQueue.hpp"
#include "cw/UptimeRing.hpp"
#include "cw/WorkerPool.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace cw;
using namespace std::chrono_literals;

TEST(BoundedQueueTest, DropNewestRejectsWhenFull) {
    BoundedQueue<int> q(2);
    EXPECT_TRUE(q.tryPush(1));
    EXPECT_TRUE(q.tryPush(2));
    EXPECT_FALSE(q.tryPush(3));
    EXPECT_EQ(q.dropped(), 1u);
    EXPECT_EQ(q.tryPop().value_or(0), 1);
    EXPECT_EQ(q.tryPop().value_or(0), 2);
    EXPECT_FALSE(q.tryPop().has_value());
}

TEST(BoundedQueueTest, DropOldestEvictsHead) {
    BoundedQueue<int> q(2, OverflowPolicy::DropOldest);
    q.tryPush(1);
    q.tryPush(2);
    EXPECT_FALSE(q.tryPush(3));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.tryPop().value_or(0), 2);
    EXPECT_EQ(q.tryPop().value_or(0), 3);
}

TEST(BoundedQueueTest, PopTimesOutAndWakesOnPush) {
    BoundedQueue<int> q(4);
    EXPECT_FALSE(q.pop(10ms).has_value());
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        q.tryPush(7);
    });
    EXPECT_EQ(q.pop(2s).value_or(0), 7);
    producer.join();
}

TEST(BoundedQueueTest, CloseDrainsThenEnds) {
    BoundedQueue<int> q(4);
    q.tryPush(1);
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.tryPush(2));
    EXPECT_EQ(q.pop(1s).value_or(0), 1);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop(5s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(BoundedQueueTest, ZeroCapacityIsClampedToOne) {
    BoundedQueue<int> q(0);
    EXPECT_EQ(q.capacity(), 1u);
    EXPECT_TRUE(q.tryPush(1));
    EXPECT_FALSE(q.tryPush(2));
}

TEST(UptimeRingTest, PercentageOverWindow) {
    UptimeRing ring(4);
    EXPECT_DOUBLE_EQ(ring.percentage(), 0.0);
    ring.record(true);
    ring.record(false);
    EXPECT_DOUBLE_EQ(ring.percentage(), 50.0);
    ring.record(true);
    ring.record(true);
    EXPECT_DOUBLE_EQ(ring.percentage(), 75.0);
    // Oldest sample (true) falls out
    ring.record(false);
    EXPECT_EQ(ring.size(), 4u);
    EXPECT_EQ(ring.successes(), 2u);
    EXPECT_DOUBLE_EQ(ring.percentage(), 50.0);
    ring.clear();
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_DOUBLE_EQ(ring.percentage(), 0.0);
}

TEST(UptimeRingTest, DefaultCapacityIsThirtyDaysOfMinutes) {
    UptimeRing ring;
    EXPECT_EQ(ring.capacity(), 43200u);
}

TEST(WorkerPoolTest, RunsEveryTaskWithBoundedConcurrency) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.threadCount(), 3u);
    std::atomic<int> done{0};
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(2ms);
            --running;
            ++done;
        });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 20);
    EXPECT_LE(peak.load(), 3);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillPool) {
    WorkerPool pool(1);
    std::atomic<int> done{0};
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&] { ++done; });
    pool.wait();
    EXPECT_EQ(done.load(), 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
