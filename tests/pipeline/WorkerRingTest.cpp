#include "conduit/pipeline/WorkerRing.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace conduit;
using namespace conduit::pipeline;

namespace {

struct Workers {
    std::vector<rt::Sender<Message>>   tx;
    std::vector<rt::Receiver<Message>> rx;
};

Workers makeWorkers(std::size_t n) {
    Workers w;
    for (std::size_t i = 0; i < n; ++i) {
        auto ch = rt::makeChannel<Message>();
        w.tx.push_back(std::move(ch.first));
        w.rx.push_back(std::move(ch.second));
    }
    return w;
}

std::vector<Value> drain(rt::Receiver<Message>& rx) {
    std::vector<Value> out;
    while (auto msg = rx.tryRecv()) out.push_back(expectGenerated("test", *msg));
    return out;
}

} // namespace

TEST(WorkerRingTest, RejectsZeroWorkers) {
    EXPECT_THROW(WorkerRing(std::vector<rt::Sender<Message>>{}), std::invalid_argument);
}

TEST(WorkerRingTest, RoundRobinInArrivalOrder) {
    auto w = makeWorkers(3);
    WorkerRing ring(std::move(w.tx));
    std::vector<std::size_t> picked;
    for (Value v = 0; v < 7; ++v) picked.push_back(ring.dispatch(Generated{v}));

    EXPECT_EQ(picked, (std::vector<std::size_t>{0, 1, 2, 0, 1, 2, 0}));
    EXPECT_EQ(drain(w.rx[0]), (std::vector<Value>{0, 3, 6}));
    EXPECT_EQ(drain(w.rx[1]), (std::vector<Value>{1, 4}));
    EXPECT_EQ(drain(w.rx[2]), (std::vector<Value>{2, 5}));
    EXPECT_EQ(ring.counts(), (std::vector<std::uint64_t>{3, 2, 2}));
}

TEST(WorkerRingTest, BalancedForAnyLength) {
    for (std::size_t n = 1; n <= 5; ++n) {
        for (Value len = n; len < 23; ++len) {
            auto w = makeWorkers(n);
            WorkerRing ring(std::move(w.tx));
            for (Value v = 0; v < len; ++v) ring.dispatch(Generated{v});

            const std::uint64_t lo = len / n;
            const std::uint64_t hi = lo + (len % n ? 1 : 0);
            for (std::size_t i = 0; i < n; ++i) {
                EXPECT_GE(ring.dispatchedTo(i), lo) << "n=" << n << " len=" << len;
                EXPECT_LE(ring.dispatchedTo(i), hi) << "n=" << n << " len=" << len;
            }
        }
    }
}

TEST(WorkerRingTest, ReleaseClosesEveryWorker) {
    auto w = makeWorkers(2);
    WorkerRing ring(std::move(w.tx));
    ring.dispatch(Generated{1});
    ring.release();

    EXPECT_FALSE(w.rx[0].closed());  // one message still queued
    EXPECT_TRUE(w.rx[1].closed());
    EXPECT_EQ(drain(w.rx[0]), (std::vector<Value>{1}));
    EXPECT_TRUE(w.rx[0].closed());
    EXPECT_THROW(ring.dispatch(Generated{2}), std::logic_error);
}

TEST(WorkerRingTest, ClosedWorkerIsNotCounted) {
    auto w = makeWorkers(2);
    w.rx[0].release();
    WorkerRing ring(std::move(w.tx));
    EXPECT_EQ(ring.dispatch(Generated{1}), 0u);
    EXPECT_EQ(ring.dispatch(Generated{2}), 1u);
    EXPECT_EQ(ring.dispatchedTo(0), 0u);
    EXPECT_EQ(ring.dispatchedTo(1), 1u);
}
