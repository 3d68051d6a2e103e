#include "config.hpp"
#include <glog/logging.h>
#include <set>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

bool DEBUG = false;

void from_json(const json &j, pool_options &pool) {
    j.at("name").get_to(pool.name);
    if (j.count("slots"))
        j.at("slots").get_to(pool.slots);
    if (j.count("queue_wait_limit"))
        j.at("queue_wait_limit").get_to(pool.queue_wait_limit);
}

void from_json(const json &j, daemon_config &config) {
    if (j.count("pools"))
        j.at("pools").get_to(config.pools);
    if (j.count("max_infrastructure_retries"))
        j.at("max_infrastructure_retries").get_to(config.max_infrastructure_retries);
    if (j.count("provision_attempts"))
        j.at("provision_attempts").get_to(config.provisioning.attempts);
    if (j.count("provision_backoff"))
        config.provisioning.backoff = chrono::duration_cast<chrono::milliseconds>(
            seconds_to_duration(j.at("provision_backoff").get<double>()));
    if (j.count("io_timeout"))
        j.at("io_timeout").get_to(config.io_timeout);
    if (j.count("cgroup_parent"))
        j.at("cgroup_parent").get_to(config.cgroup_parent);
}

static void validate(daemon_config &config) {
    if (config.pools.empty()) {
        pool_options pool;
        pool.name = "default";
        config.pools.push_back(pool);
    }
    set<string> names;
    for (auto &pool : config.pools) {
        if (pool.name.empty()) throw invalid_argument("Resource pool requires a name");
        if (pool.slots == 0) throw invalid_argument("Resource pool " + pool.name + " has no slot");
        if (!names.insert(pool.name).second) throw invalid_argument("Duplicate resource pool " + pool.name);
        if (!(pool.queue_wait_limit > 0)) throw invalid_argument("Resource pool " + pool.name + " must have a positive queue_wait_limit");
    }
    if (config.max_infrastructure_retries < 0) throw invalid_argument("max_infrastructure_retries must not be negative");
    if (config.provisioning.attempts < 1) throw invalid_argument("provision_attempts must be positive");
    if (config.io_timeout <= 0) throw invalid_argument("io_timeout must be positive");
}

daemon_config load_daemon_config(const fs::path &path) {
    daemon_config config;
    if (!path.empty()) {
        try {
            json::parse(read_file_content(path)).get_to(config);
        } catch (json::exception &e) {
            throw invalid_argument("Malformed configuration " + path.string() + ": " + e.what());
        }
    }
    validate(config);
    LOG(INFO) << "Loaded " << config.pools.size() << " resource pool(s)";
    return config;
}

}  // namespace grader
