#include "conduit/pipeline/RunReport.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

using namespace conduit::pipeline;

static rapidjson::Document parseJson(const std::string& s) {
    rapidjson::Document d;
    d.Parse(s.c_str());
    return d;
}

TEST(RunReportTest, SerializesAllFields) {
    RunReport rep;
    rep.generated = {2, 3};
    rep.merged = {9, 4};
    rep.perWorker = {1, 1};
    rep.processedPerWorker = {1, 1};
    rep.generatorSent = 3;
    rep.mergeForwarded = 2;
    rep.elapsed = std::chrono::microseconds(1234);

    auto d = parseJson(rep.toJson());
    ASSERT_FALSE(d.HasParseError());
    ASSERT_TRUE(d["generated"].IsArray());
    EXPECT_EQ(d["generated"].Size(), 2u);
    EXPECT_EQ(d["generated"][1].GetUint(), 3u);
    EXPECT_EQ(d["merged"][0].GetUint64(), 9u);
    EXPECT_EQ(d["perWorker"].Size(), 2u);
    EXPECT_EQ(d["processedPerWorker"][0].GetUint64(), 1u);
    EXPECT_EQ(d["generatorSent"].GetUint64(), 3u);
    EXPECT_EQ(d["mergeForwarded"].GetUint64(), 2u);
    EXPECT_EQ(d["elapsedUs"].GetInt64(), 1234);
    EXPECT_TRUE(d["clean"].GetBool());
    EXPECT_EQ(d["lateStages"].Size(), 0u);
}

TEST(RunReportTest, LateStagesMakeRunUnclean) {
    RunReport rep;
    rep.lateStages = {"merge"};
    EXPECT_FALSE(rep.clean());

    auto d = parseJson(rep.toJson());
    ASSERT_FALSE(d.HasParseError());
    EXPECT_FALSE(d["clean"].GetBool());
    EXPECT_STREQ(d["lateStages"][0].GetString(), "merge");
}

TEST(RunReportTest, WideValuesSurvive) {
    RunReport rep;
    rep.merged = {0xFFFFFFFE00000001ull};
    auto d = parseJson(rep.toJson());
    ASSERT_FALSE(d.HasParseError());
    EXPECT_EQ(d["merged"][0].GetUint64(), 0xFFFFFFFE00000001ull);
}
