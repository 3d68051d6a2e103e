#include "results/aggregator.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/defer.hpp"

namespace grader {
using namespace std;

result_aggregator::result_aggregator(result_store &store, int max_infrastructure_retries)
    : results(store), max_infrastructure_retries(max_infrastructure_retries) {}

int result_aggregator::begin_attempt(const string &submission_id) {
    int persisted = results.last_attempt(submission_id);
    lock_guard<mutex> guard(mut);
    int &last = allocated[submission_id];
    last = max(last, persisted) + 1;
    return last;
}

string result_aggregator::finalize(const string &submission_id, int attempt, grading_result result) {
    // 最大的已分配尝试次数写入（或者放弃）后，last_attempt 就足以分配新的尝试次数
    defer {
        lock_guard<mutex> guard(mut);
        auto it = allocated.find(submission_id);
        if (it != allocated.end() && it->second <= attempt) allocated.erase(it);
    };
    result.submission_id = submission_id;
    result.attempt = attempt;
    result.total_points = total_points(result.steps, result.max_points);
    return results.put(result);
}

vector<persisted_result> result_aggregator::history(const string &submission_id) {
    return results.results(submission_id);
}

bool result_aggregator::should_retry(const grading_result &result, int retries) const {
    if (result.status != grading_status::INFRASTRUCTURE_ERROR) return false;
    if (retries >= max_infrastructure_retries) {
        LOG(ERROR) << "Submission " << result.submission_id << " failed with infrastructure error after "
                   << retries << " retries: " << result.error_log;
        return false;
    }
    return true;
}

}  // namespace grader
