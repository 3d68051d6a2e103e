#include <nlohmann/json.hpp>
#include <set>
#include <thread>
#include "gtest/gtest.h"
#include "results/aggregator.hpp"
#include "results/result_store.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

namespace fs = std::filesystem;

using namespace std;
using namespace grader;
using namespace nlohmann;

class ResultStoreTest : public ::testing::Test {
protected:
    ResultStoreTest() : dir("result-test"), store(dir.path()), aggregator(store) {}

    static grading_result make_result(int points) {
        grading_result result;
        result.grading_config_id = "hw1";
        result.max_points = 10;
        step_outcome step;
        step.name = "test";
        step.passed = points > 0;
        step.points_possible = 10;
        step.points_awarded = points;
        step.feedback_text = "feedback";
        result.steps.push_back(step);
        return result;
    }

    test::temp_dir dir;
    file_result_store store;
    result_aggregator aggregator;
};

TEST_F(ResultStoreTest, FinalizeTest) {
    int attempt = aggregator.begin_attempt("sub1");
    EXPECT_EQ(attempt, 1);
    string id = aggregator.finalize("sub1", attempt, make_result(7));

    auto record = store.get("sub1", attempt);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->result.submission_id, "sub1");
    EXPECT_EQ(record->result.attempt, 1);
    EXPECT_EQ(record->result.total_points, 7);
    EXPECT_JSON_EQ(json(record->result), json([&] {
                       grading_result expected = make_result(7);
                       expected.submission_id = "sub1";
                       expected.attempt = 1;
                       expected.total_points = 7;
                       return expected;
                   }()));
    EXPECT_TRUE(fs::exists(dir.path() / "sub1" / "attempt-1.json"));
}

TEST_F(ResultStoreTest, FinalizeTwiceTest) {
    int attempt = aggregator.begin_attempt("sub1");
    string first = aggregator.finalize("sub1", attempt, make_result(7));
    string second = aggregator.finalize("sub1", attempt, make_result(3));
    EXPECT_EQ(first, second);

    // 第一次写入的结果不会被覆盖
    EXPECT_EQ(store.get("sub1", attempt)->result.total_points, 7);
    EXPECT_EQ(store.results("sub1").size(), 1u);
}

TEST_F(ResultStoreTest, ConcurrentFinalizeTest) {
    int attempt = aggregator.begin_attempt("sub1");
    vector<string> ids(8);
    vector<thread> threads;
    for (size_t i = 0; i < ids.size(); ++i)
        threads.emplace_back([&, i] { ids[i] = aggregator.finalize("sub1", attempt, make_result((int)i)); });
    for (auto &th : threads) th.join();

    set<string> unique_ids(ids.begin(), ids.end());
    EXPECT_EQ(unique_ids.size(), 1u);
    auto history = store.results("sub1");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, ids[0]);
}

TEST_F(ResultStoreTest, AttemptHistoryTest) {
    for (int i = 0; i < 3; ++i) {
        int attempt = aggregator.begin_attempt("sub1");
        EXPECT_EQ(attempt, i + 1);
        aggregator.finalize("sub1", attempt, make_result(i));
    }

    auto history = store.results("sub1");
    ASSERT_EQ(history.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(history[i].result.attempt, i + 1);
        EXPECT_EQ(history[i].result.total_points, i);
    }
    EXPECT_EQ(store.last_attempt("sub1"), 3);
    EXPECT_TRUE(store.results("other").empty());
    EXPECT_FALSE(store.get("other", 1).has_value());
}

TEST_F(ResultStoreTest, AttemptsContinueAfterRestartTest) {
    aggregator.finalize("sub1", aggregator.begin_attempt("sub1"), make_result(1));
    aggregator.finalize("sub1", aggregator.begin_attempt("sub1"), make_result(2));

    // 新的聚合器从已经持久化的最大尝试次数之后开始编号
    result_aggregator restarted(store);
    EXPECT_EQ(restarted.begin_attempt("sub1"), 3);
    EXPECT_EQ(restarted.begin_attempt("sub1"), 4);
}

TEST_F(ResultStoreTest, TotalPointsClampTest) {
    vector<step_outcome> steps(2);
    steps[0].points_awarded = 8;
    steps[1].points_awarded = 5;
    EXPECT_EQ(total_points(steps, 10), 10);

    steps[0].points_awarded = -4;
    steps[1].points_awarded = 1;
    EXPECT_EQ(total_points(steps, 10), 0);
}

TEST_F(ResultStoreTest, InvalidUtf8OutputTest) {
    grading_result result = make_result(1);
    result.steps[0].result.stdout_text = "\xff\xfe binary";
    int attempt = aggregator.begin_attempt("sub1");
    EXPECT_NO_THROW(aggregator.finalize("sub1", attempt, result));
    EXPECT_TRUE(store.get("sub1", attempt).has_value());
}

TEST_F(ResultStoreTest, RetryPolicyTest) {
    grading_result result = make_result(0);
    EXPECT_FALSE(aggregator.should_retry(result, 0));

    result.status = grading_status::INFRASTRUCTURE_ERROR;
    EXPECT_TRUE(aggregator.should_retry(result, 0));
    EXPECT_TRUE(aggregator.should_retry(result, 1));
    EXPECT_FALSE(aggregator.should_retry(result, 2));
}
