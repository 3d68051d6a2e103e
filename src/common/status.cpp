#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<grading_status, const char *> status_string = boost::assign::map_list_of
    (grading_status::COMPLETED, "completed")
    (grading_status::TIMED_OUT, "timed_out")
    (grading_status::INFRASTRUCTURE_ERROR, "infrastructure_error")
    (grading_status::CANCELLED, "cancelled");

static const unordered_map<ticket_state, const char *> state_string = boost::assign::map_list_of
    (ticket_state::QUEUED, "queued")
    (ticket_state::RUNNING, "running")
    (ticket_state::COMPLETED, "completed")
    (ticket_state::TIMED_OUT, "timed_out")
    (ticket_state::INFRASTRUCTURE_ERROR, "infrastructure_error")
    (ticket_state::CANCELLED, "cancelled");

static const unordered_map<grading_status, ticket_state> terminal_state = boost::assign::map_list_of
    (grading_status::COMPLETED, ticket_state::COMPLETED)
    (grading_status::TIMED_OUT, ticket_state::TIMED_OUT)
    (grading_status::INFRASTRUCTURE_ERROR, ticket_state::INFRASTRUCTURE_ERROR)
    (grading_status::CANCELLED, ticket_state::CANCELLED);
// clang-format on

const char *get_display_message(grading_status stat) {
    return status_string.at(stat);
}

const char *get_display_message(ticket_state state) {
    return state_string.at(state);
}

ticket_state to_ticket_state(grading_status stat) {
    return terminal_state.at(stat);
}

bool is_terminal(ticket_state state) {
    return state != ticket_state::QUEUED && state != ticket_state::RUNNING;
}

grading_status parse_grading_status(const string &str) {
    for (auto &[stat, name] : status_string)
        if (str == name) return stat;
    throw invalid_argument("unknown grading status " + str);
}

}  // namespace grader
