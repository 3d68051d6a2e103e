#include "sandbox/cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>

namespace grader {
using namespace std;

static string cgroup_message(const string &cgroup_op, int err) {
    if (err == ECGOTHER)
        return "libcgroup: " + cgroup_op + ": " + cgroup_strerror(cgroup_get_last_errno());
    else
        return cgroup_op + ": " + cgroup_strerror(err);
}

cgroup_exception::cgroup_exception(const string &cgroup_op, int err)
    : grader_exception(cgroup_message(cgroup_op, err)) {}

void cgroup_exception::ensure(const string &cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    cgroup_exception::ensure(
        "cgroup_init",
        cgroup_init());
}

void cgroup_ctrl::add_value(const string &name, int64_t value) {
    cgroup_exception::ensure(
        fmt::format("cgroup_add_value_int64({}, {})", name, value),
        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

cgroup_guard::cgroup_guard(const string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

void cgroup_guard::create_cgroup(int ignore_ownership) {
    cgroup_exception::ensure(
        fmt::format("cgroup_create_cgroup({})", ignore_ownership),
        cgroup_create_cgroup(cg, ignore_ownership));
}

cgroup_ctrl cgroup_guard::add_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_add_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_add_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_exception::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

void cgroup_guard::attach_task_pid(pid_t pid) {
    cgroup_exception::ensure(
        fmt::format("cgroup_attach_task_pid({})", pid),
        cgroup_attach_task_pid(cg, pid));
}

void cgroup_guard::delete_cgroup() {
    cgroup_exception::ensure(
        "cgroup_delete_cgroup",
        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

vector<pid_t> cgroup_tasks(const string &cgroup_name, const string &controller) {
    vector<pid_t> tasks;
    void *handle = nullptr;
    pid_t pid;
    int ret = cgroup_get_task_begin(cgroup_name.c_str(), controller.c_str(), &handle, &pid);
    while (ret == 0) {
        tasks.push_back(pid);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
    if (ret != ECGEOF)
        throw cgroup_exception(fmt::format("cgroup_get_task({}, {})", cgroup_name, controller), ret);
    return tasks;
}

}  // namespace grader
