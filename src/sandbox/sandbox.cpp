#include "sandbox/sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/cgroup_runtime.hpp"
#include "sandbox/process_runtime.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const size_t COPY_CHUNK_SIZE = 65536;

sandbox_runtime::sandbox_runtime(const runtime_options &options)
    : options(options) {}

sandbox_runtime::~sandbox_runtime() = default;

size_t sandbox_runtime::oom_kill_count(sandbox_handle &) {
    return 0;
}

fs::path sandbox_runtime::create_sandbox_dir(const string &id) {
    fs::path dir = options.sandbox_dir / id;
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw provisioning_error(fmt::format("Unable to create sandbox directory {}: {}", dir.string(), ec.message()));
    if (options.user_id >= 0 && chown(dir.c_str(), options.user_id, options.group_id) != 0)
        throw provisioning_error(fmt::format("Unable to chown sandbox directory {}: {}", dir.string(), strerror(errno)));
    return dir;
}

bool sandbox_runtime::remove_sandbox_dir(const sandbox_handle &handle) {
    error_code ec;
    fs::remove_all(handle.root, ec);
    if (ec) {
        LOG(ERROR) << "Unable to remove sandbox directory " << handle.root << ": " << ec.message();
        return false;
    }
    return true;
}

/**
 * @brief 按块拷贝文件内容，每一块拷贝完成后检查是否超时
 */
static void copy_stream(istream &in, ostream &out, const elapsed_time &timer, chrono::milliseconds timeout, const string &name,
                        int64_t max_bytes = -1) {
    char buf[COPY_CHUNK_SIZE];
    int64_t copied = 0;
    while (in) {
        in.read(buf, sizeof(buf));
        copied += in.gcount();
        if (max_bytes >= 0 && copied > max_bytes) throw file_too_large_error(name, max_bytes);
        out.write(buf, in.gcount());
        if (!out) throw sandbox_error(fmt::format("Unable to write {}", name));
        if (timer.duration<chrono::milliseconds>() > timeout)
            throw sandbox_error(fmt::format("Copying {} exceeded I/O timeout of {}ms", name, timeout.count()));
    }
    if (in.bad()) throw sandbox_error(fmt::format("Unable to read {}", name));
}

void sandbox_runtime::copy_in(sandbox_handle &handle, const vector<submission_file> &files) {
    if (handle.released) throw sandbox_error("Sandbox " + handle.id + " has been released");

    elapsed_time timer;
    for (auto &file : files) {
        if (!is_safe_path(file.name)) throw sandbox_error("Unsafe file name " + file.name);
        fs::path dest = handle.root / file.name;

        error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        if (ec) throw sandbox_error(fmt::format("Unable to create directory for {}: {}", file.name, ec.message()));

        ofstream fout(dest, ios::binary | ios::trunc);
        if (!fout) throw sandbox_error(fmt::format("Unable to create {}", dest.string()));
        if (!file.source_path.empty()) {
            ifstream fin(file.source_path, ios::binary);
            if (!fin) throw sandbox_error(fmt::format("Unable to open {}", file.source_path.string()));
            copy_stream(fin, fout, timer, options.io_timeout, file.name);
        } else {
            istringstream sin(file.content);
            copy_stream(sin, fout, timer, options.io_timeout, file.name);
        }
        fout.close();
        if (!fout) throw sandbox_error(fmt::format("Unable to write {}", dest.string()));

        // 运行用户需要能够读写学生提交的文件
        if (options.user_id >= 0) {
            for (fs::path p = dest; p != handle.root && p.has_relative_path(); p = p.parent_path())
                if (lchown(p.c_str(), options.user_id, options.group_id) != 0)
                    throw sandbox_error(fmt::format("Unable to chown {}: {}", p.string(), strerror(errno)));
        }
    }
    DLOG(INFO) << "Copied " << files.size() << " file(s) into sandbox " << handle.id;
}

map<string, string> sandbox_runtime::copy_out(sandbox_handle &handle, const vector<string> &paths, int64_t max_bytes) {
    if (handle.released) throw sandbox_error("Sandbox " + handle.id + " has been released");

    elapsed_time timer;
    map<string, string> result;
    for (auto &path : paths) {
        if (!is_safe_path(path)) throw not_found_error(path);

        // 学生程序可能创建指向沙箱外部的符号链接
        error_code ec;
        fs::path root = fs::canonical(handle.root, ec);
        if (ec) throw sandbox_error(fmt::format("Sandbox directory {} is not accessible: {}", handle.root.string(), ec.message()));
        fs::path file = fs::weakly_canonical(handle.root / path, ec);
        if (ec || !fs::is_regular_file(file, ec)) throw not_found_error(path);
        auto rel = file.lexically_relative(root);
        if (rel.empty() || *rel.begin() == "..") {
            LOG(WARNING) << "Sandbox " << handle.id << " file " << path << " points outside the sandbox";
            throw not_found_error(path);
        }

        // 文件在读取时可能仍在增长，读取过程中同样要检查大小
        auto size = fs::file_size(file, ec);
        if (!ec && max_bytes >= 0 && size > (uintmax_t)max_bytes) throw file_too_large_error(path, max_bytes);

        ifstream fin(file, ios::binary);
        if (!fin) throw not_found_error(path);
        ostringstream sout;
        copy_stream(fin, sout, timer, options.io_timeout, path, max_bytes);
        result[path] = sout.str();
    }
    return result;
}

unique_ptr<sandbox_runtime> make_sandbox_runtime(const string &name, const runtime_options &options) {
    if (name == "cgroup")
        return make_unique<cgroup_sandbox_runtime>(options);
    else if (name == "process")
        return make_unique<process_sandbox_runtime>(options);
    else
        throw invalid_argument("Unknown sandbox runtime " + name);
}

}  // namespace grader
