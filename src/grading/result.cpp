#include "grading/result.hpp"
#include <algorithm>

namespace grader {
using namespace std;
using namespace nlohmann;

int total_points(const vector<step_outcome> &steps, int max_points) {
    int sum = 0;
    for (auto &step : steps) sum += step.points_awarded;
    return max(0, min(sum, max_points));
}

void to_json(json &j, const step_outcome &outcome) {
    j = {{"name", outcome.name},
         {"result", outcome.result},
         {"passed", outcome.passed},
         {"skipped", outcome.skipped},
         {"points_awarded", outcome.points_awarded},
         {"points_possible", outcome.points_possible},
         {"feedback", outcome.feedback_text},
         {"visible", outcome.visible}};
}

void from_json(const json &j, step_outcome &outcome) {
    j.at("name").get_to(outcome.name);
    j.at("result").get_to(outcome.result);
    j.at("passed").get_to(outcome.passed);
    j.at("skipped").get_to(outcome.skipped);
    j.at("points_awarded").get_to(outcome.points_awarded);
    j.at("points_possible").get_to(outcome.points_possible);
    j.at("feedback").get_to(outcome.feedback_text);
    j.at("visible").get_to(outcome.visible);
}

void to_json(json &j, const grading_result &result) {
    j = {{"submission_id", result.submission_id},
         {"grading_config_id", result.grading_config_id},
         {"attempt", result.attempt},
         {"steps", result.steps},
         {"total_points", result.total_points},
         {"max_points", result.max_points},
         {"status", get_display_message(result.status)},
         {"error_log", result.error_log},
         {"flagged_for_review", result.flagged_for_review}};
}

void from_json(const json &j, grading_result &result) {
    j.at("submission_id").get_to(result.submission_id);
    j.at("grading_config_id").get_to(result.grading_config_id);
    j.at("attempt").get_to(result.attempt);
    j.at("steps").get_to(result.steps);
    j.at("total_points").get_to(result.total_points);
    j.at("max_points").get_to(result.max_points);
    result.status = parse_grading_status(j.at("status").get<string>());
    j.at("error_log").get_to(result.error_log);
    j.at("flagged_for_review").get_to(result.flagged_for_review);
}

}  // namespace grader
