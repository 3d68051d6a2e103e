#include "executor/command.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const command_result &result) {
    j = {{"exit_status", result.exit_status},
         {"signal", result.signal},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"stdout_truncated", result.stdout_truncated},
         {"stderr_truncated", result.stderr_truncated},
         {"wall_time", result.wall_time},
         {"cpu_time", result.cpu_time},
         {"memory", result.memory},
         {"timed_out", result.timed_out},
         {"resource_killed", result.resource_killed}};
}

void from_json(const json &j, command_result &result) {
    j.at("exit_status").get_to(result.exit_status);
    j.at("signal").get_to(result.signal);
    j.at("stdout").get_to(result.stdout_text);
    j.at("stderr").get_to(result.stderr_text);
    j.at("stdout_truncated").get_to(result.stdout_truncated);
    j.at("stderr_truncated").get_to(result.stderr_truncated);
    j.at("wall_time").get_to(result.wall_time);
    j.at("cpu_time").get_to(result.cpu_time);
    j.at("memory").get_to(result.memory);
    j.at("timed_out").get_to(result.timed_out);
    j.at("resource_killed").get_to(result.resource_killed);
}

}  // namespace grader
