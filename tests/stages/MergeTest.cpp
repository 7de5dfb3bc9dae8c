#include "conduit/stages/Merge.hpp"
#include "conduit/rt/StageHandle.hpp"
#include "conduit/util/Logger.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <vector>

using namespace conduit;
using namespace conduit::stages;
using namespace std::chrono_literals;

TEST(MergeTest, ForwardsTransformedAsMerged) {
    Merge merge;
    auto in = rt::makeChannel<Message>();
    auto out = rt::makeChannel<Message>();

    in.first.send(Transformed{4});
    in.first.send(Transformed{9});
    in.first.release();
    merge.run(std::move(in.second), std::move(out.first));

    std::vector<Wide> got;
    while (auto msg = out.second.recv()) got.push_back(expectMerged("test", *msg));
    EXPECT_EQ(got, (std::vector<Wide>{4, 9}));
    EXPECT_EQ(merge.forwarded(), 2u);
}

TEST(MergeTest, WaitsForEverySenderClone) {
    rt::StageMonitor mon;
    Merge merge(&mon);
    auto in = rt::makeChannel<Message>();
    auto out = rt::makeChannel<Message>();

    rt::Sender<Message> w0 = in.first;
    rt::Sender<Message> w1 = in.first;
    rt::Sender<Message> w2 = in.first;
    in.first.release();

    rt::StageHandle h(Merge::kName,
        [&merge, rx = std::move(in.second), tx = std::move(out.first)]() mutable {
            merge.run(std::move(rx), std::move(tx));
        });

    w0.send(Transformed{1});
    w0.release();
    w1.send(Transformed{4});
    w1.release();
    EXPECT_FALSE(h.waitFor(30ms));
    EXPECT_FALSE(mon.exited(Merge::kName));

    w2.send(Transformed{9});
    w2.release();
    EXPECT_TRUE(h.waitFor(1000ms));

    std::vector<Wide> got;
    while (auto msg = out.second.recv()) got.push_back(expectMerged("test", *msg));
    std::sort(got.begin(), got.end());
    EXPECT_EQ(got, (std::vector<Wide>{1, 4, 9}));
}

TEST(MergeDeathTest, AbortsOnUnexpectedVariant) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_DEATH({
        util::logger().setFile("/dev/stderr");
        Merge merge;
        auto in = rt::makeChannel<Message>();
        auto out = rt::makeChannel<Message>();
        in.first.send(Generated{2});
        in.first.release();
        merge.run(std::move(in.second), std::move(out.first));
    }, "stage=merge variant=Generated");
}
