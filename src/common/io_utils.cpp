#include "common/io_utils.hpp"
#include <unistd.h>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

bool is_safe_path(const string &subpath) {
    if (subpath.empty()) return false;
    fs::path p(subpath);
    if (p.is_absolute() || p.has_root_name()) return false;
    for (auto &part : p)
        if (part == "..") return false;
    return true;
}

string assert_safe_path(const string &subpath) {
    if (!is_safe_path(subpath))
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

scoped_fd::scoped_fd() : fd(-1) {}

scoped_fd::scoped_fd(int fd) : fd(fd) {}

scoped_fd::scoped_fd(scoped_fd &&other) : fd(other.release()) {}

scoped_fd::~scoped_fd() {
    reset();
}

scoped_fd &scoped_fd::operator=(scoped_fd &&other) {
    if (this != &other) reset(other.release());
    return *this;
}

int scoped_fd::get() const {
    return fd;
}

int scoped_fd::release() {
    int result = fd;
    fd = -1;
    return result;
}

void scoped_fd::reset(int new_fd) {
    if (fd >= 0) close(fd);
    fd = new_fd;
}

scoped_fd::operator bool() const {
    return fd >= 0;
}

}  // namespace grader
