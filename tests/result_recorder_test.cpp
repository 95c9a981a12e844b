#include "result_recorder.hpp"
#include "run_config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

RequestOutcome make_outcome(int vu, long iteration, long status, const std::string& error) {
    RequestOutcome o;
    o.vu = vu;
    o.iteration = iteration;
    o.started_at = 1700000000000LL;
    o.duration_ms = 12.5;
    o.status = status;
    o.error = error;
    return o;
}

} // anonymous namespace

TEST(RequestOutcome, FailureClassification) {
    EXPECT_FALSE(make_outcome(0, 0, 200, "").failed());
    EXPECT_FALSE(make_outcome(0, 0, 204, "").failed());
    EXPECT_FALSE(make_outcome(0, 0, 302, "").failed());
    EXPECT_FALSE(make_outcome(0, 0, 399, "").failed());
    EXPECT_TRUE(make_outcome(0, 0, 404, "").failed());
    EXPECT_TRUE(make_outcome(0, 0, 500, "").failed());
    EXPECT_TRUE(make_outcome(0, 0, 101, "").failed());
    EXPECT_TRUE(make_outcome(0, 0, 0, "Timeout was reached").failed());
}

TEST(ResultRecorder, CountsWithoutFile) {
    ResultRecorder recorder;
    recorder.record(make_outcome(0, 0, 200, ""));
    recorder.record(make_outcome(1, 0, 503, ""));
    recorder.record(make_outcome(2, 0, 0, "Couldn't connect to server"));
    EXPECT_EQ(recorder.requests(), 3);
    EXPECT_EQ(recorder.failures(), 2);
}

TEST(ResultRecorder, CsvRowFormat) {
    EXPECT_EQ(ResultRecorder::to_csv_row(make_outcome(3, 7, 200, "")),
              "1700000000000,3,7,200,12.500,");
    EXPECT_EQ(ResultRecorder::to_csv_row(make_outcome(0, 1, 0, "bad \"thing\", here")),
              "1700000000000,0,1,0,12.500,\"bad \"\"thing\"\", here\"");
}

TEST(ResultRecorder, WritesHeaderAndOneRowPerOutcome) {
    std::string path = ::testing::TempDir() + "chaos_load_recorder_test.csv";
    {
        ResultRecorder recorder(path);
        recorder.record(make_outcome(0, 0, 200, ""));
        recorder.record(make_outcome(1, 0, 0, "Timeout was reached"));
    }

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], ResultRecorder::csv_header());
    EXPECT_EQ(lines[1], "1700000000000,0,0,200,12.500,");
    EXPECT_EQ(lines[2], "1700000000000,1,0,0,12.500,Timeout was reached");
    std::remove(path.c_str());
}

TEST(ResultRecorder, UnopenableFileIsConfigError) {
    EXPECT_THROW(ResultRecorder("/nonexistent-dir/for/sure/out.csv"), ConfigError);
}
