#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

infrastructure_error::infrastructure_error()
    : grader_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : grader_exception(message) {}

provisioning_error::provisioning_error()
    : infrastructure_error() {}

provisioning_error::provisioning_error(const string &message)
    : infrastructure_error(message) {}

sandbox_error::sandbox_error()
    : infrastructure_error() {}

sandbox_error::sandbox_error(const string &message)
    : infrastructure_error(message) {}

not_found_error::not_found_error(const string &path)
    : grader_exception("File not found in sandbox: " + path), path(path) {}

file_too_large_error::file_too_large_error(const string &path, int64_t limit)
    : grader_exception(fmt::format("File {} in sandbox is larger than {} bytes", path, limit)), path(path), limit(limit) {}

leak_detected_error::leak_detected_error(const string &sandbox_id, size_t survivors)
    : grader_exception(fmt::format("Sandbox {} still has {} process(es) after release", sandbox_id, survivors)),
      sandbox_id(sandbox_id),
      survivors(survivors) {}

config_error::config_error()
    : grader_exception() {}

config_error::config_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
