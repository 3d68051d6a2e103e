#include <nlohmann/json.hpp>
#include "grading/policy.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;
using namespace nlohmann;

class PolicyTest : public ::testing::Test {
protected:
    static step_config pattern_step(const string &pattern) {
        json j = {{"id", "policy"},
                  {"max_points", 1},
                  {"steps", {{{"type", "test"}, {"name", "match"}, {"argv", {"./main"}}, {"points", 1}, {"stdout", {{"pattern", pattern}}}}}}};
        return parse_grading_config(j).steps.at(0);
    }

    static step_outcome judge_stdout(const string &pattern, const string &output) {
        command_result result;
        result.exit_status = 0;
        result.stdout_text = output;
        return judge_step(pattern_step(pattern), result, [](const string &) { return optional<string>(); });
    }
};

TEST_F(PolicyTest, PatternAnchorsTest) {
    EXPECT_TRUE(judge_stdout("^3\\s*$", "3\n").passed);
    // ^ 和 $ 只匹配整个输出的开头和结尾
    EXPECT_FALSE(judge_stdout("^3$", "3\n4").passed);
    EXPECT_FALSE(judge_stdout("^4", "3\n4").passed);
    // . 不匹配换行
    EXPECT_FALSE(judge_stdout("3.4", "3\n4").passed);
    EXPECT_TRUE(judge_stdout("3\\n4", "3\n4").passed);
}

TEST_F(PolicyTest, LongOutputPatternTest) {
    string output(1 << 20, 'x');
    output += "done\n";

    EXPECT_TRUE(judge_stdout("done\\s*$", output).passed);

    // 回溯很深的正则表达式不能让评测线程栈溢出，匹配过于复杂时步骤不通过
    step_outcome outcome = judge_stdout("(.|\\n)*done", output);
    if (!outcome.passed) {
        EXPECT_NE(outcome.feedback_text.find("too complex"), string::npos) << outcome.feedback_text;
        EXPECT_EQ(outcome.points_awarded, 0);
    }
}

TEST_F(PolicyTest, PatternMismatchTest) {
    step_outcome outcome = judge_stdout("^hello", "goodbye\n");
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.points_awarded, 0);
    EXPECT_NE(outcome.feedback_text.find("did not match the pattern ^hello"), string::npos);
}
