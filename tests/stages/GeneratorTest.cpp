#include "conduit/stages/Generator.hpp"
#include "conduit/rt/StageHandle.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

using namespace conduit;
using namespace conduit::stages;
using namespace std::chrono_literals;

TEST(GeneratorTest, ProducesIncreasingValuesFromSeed) {
    Generator gen(2);
    auto ch = rt::makeChannel<Message>();
    rt::StageHandle h(Generator::kName, [&gen, tx = std::move(ch.first)]() mutable {
        gen.run(std::move(tx));
    });

    std::vector<Value> got;
    for (int i = 0; i < 5; ++i) {
        auto msg = ch.second.recv();
        ASSERT_TRUE(msg.has_value());
        got.push_back(expectGenerated("test", *msg));
    }
    ch.second.release();

    EXPECT_TRUE(h.waitFor(1000ms));
    EXPECT_EQ(got, (std::vector<Value>{2, 3, 4, 5, 6}));
    EXPECT_GE(gen.sent(), 5u);
}

TEST(GeneratorTest, StopsOnFirstFailedSend) {
    rt::StageMonitor mon;
    Generator gen(10, &mon);
    auto ch = rt::makeChannel<Message>();
    ch.second.release();

    gen.run(std::move(ch.first));
    EXPECT_EQ(gen.sent(), 0u);
    EXPECT_TRUE(mon.exited(Generator::kName));
}

TEST(GeneratorTest, StopsAtEndOfValueRange) {
    Generator gen(0xFFFFFFFEu);
    auto ch = rt::makeChannel<Message>();
    gen.run(std::move(ch.first));

    // The generator released its only sender, so the channel is now closed.
    std::vector<Value> got;
    while (auto msg = ch.second.recv()) got.push_back(expectGenerated("test", *msg));
    EXPECT_EQ(got, (std::vector<Value>{0xFFFFFFFEu, 0xFFFFFFFFu}));
    EXPECT_EQ(gen.sent(), 2u);
}
