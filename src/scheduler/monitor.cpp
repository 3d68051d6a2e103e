#include "scheduler/monitor.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<worker_state, const char *> state_string = boost::assign::map_list_of
    (worker_state::IDLE, "idle")
    (worker_state::RUNNING, "running")
    (worker_state::CRASHED, "crashed")
    (worker_state::STOPPED, "stopped");
// clang-format on

monitor::~monitor() = default;

void monitor::start_job(int, const job_info &) {}

void monitor::end_job(int, const job_info &, const grading_result &, const string &) {}

void monitor::worker_state_changed(const string &, int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void log_monitor::start_job(int worker_id, const job_info &job) {
    LOG(INFO) << "[pool " << job.pool << " worker " << worker_id << "] Grading ticket " << job.ticket
              << " (submission " << job.submission_id << ", config " << job.grading_config_id << ", attempt " << job.attempt << ")";
}

void log_monitor::end_job(int worker_id, const job_info &job, const grading_result &result, const string &persisted_id) {
    LOG(INFO) << "[pool " << job.pool << " worker " << worker_id << "] Ticket " << job.ticket << " finished: "
              << get_display_message(result.status) << ", " << result.total_points << "/" << result.max_points
              << " points, record " << (persisted_id.empty() ? "<none>" : persisted_id);
}

void log_monitor::worker_state_changed(const string &pool, int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "[pool " << pool << " worker " << worker_id << "] crashed: " << information;
    else
        DLOG(INFO) << "[pool " << pool << " worker " << worker_id << "] " << state_string.at(state);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << "Operator attention required: " << message;
}

}  // namespace grader
