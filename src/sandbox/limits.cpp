#include "sandbox/limits.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

resource_limits resource_limits::tighten(const resource_limits &step) const {
    resource_limits result;
    result.cpu_time = stricter_limit(cpu_time, step.cpu_time);
    result.wall_time = stricter_limit(wall_time, step.wall_time);
    result.memory = stricter_limit(memory, step.memory);
    result.proc_limit = stricter_limit(proc_limit, step.proc_limit);
    result.output_limit = stricter_limit(output_limit, step.output_limit);
    result.file_limit = stricter_limit(file_limit, step.file_limit);
    result.network = network && step.network;
    return result;
}

void from_json(const json &j, resource_limits &limits) {
    if (j.count("cpu_time"))
        j.at("cpu_time").get_to(limits.cpu_time);
    if (j.count("wall_time"))
        j.at("wall_time").get_to(limits.wall_time);
    if (j.count("memory"))
        j.at("memory").get_to(limits.memory);
    if (j.count("proc_limit"))
        j.at("proc_limit").get_to(limits.proc_limit);
    if (j.count("output_limit"))
        j.at("output_limit").get_to(limits.output_limit);
    if (j.count("file_limit"))
        j.at("file_limit").get_to(limits.file_limit);
    if (j.count("network"))
        j.at("network").get_to(limits.network);
}

void to_json(json &j, const resource_limits &limits) {
    j = {{"cpu_time", limits.cpu_time},
         {"wall_time", limits.wall_time},
         {"memory", limits.memory},
         {"proc_limit", limits.proc_limit},
         {"output_limit", limits.output_limit},
         {"file_limit", limits.file_limit},
         {"network", limits.network}};
}

}  // namespace grader
