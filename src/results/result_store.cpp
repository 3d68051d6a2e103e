#include "results/result_store.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <map>
#include <system_error>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static const string ATTEMPT_PREFIX = "attempt-";
static const string ATTEMPT_SUFFIX = ".json";

result_store::~result_store() = default;

file_result_store::file_result_store(const fs::path &root) : root(root) {
    fs::create_directories(root);
}

fs::path file_result_store::submission_dir(const string &submission_id) const {
    return root / assert_safe_path(submission_id);
}

static persisted_result read_record(const fs::path &path) {
    json j = json::parse(read_file_content(path));
    persisted_result record;
    j.at("id").get_to(record.id);
    j.at("result").get_to(record.result);
    return record;
}

string file_result_store::put(const grading_result &result) {
    fs::path dir = submission_dir(result.submission_id);
    fs::create_directories(dir);
    fs::path target = dir / fmt::format("{}{}{}", ATTEMPT_PREFIX, result.attempt, ATTEMPT_SUFFIX);

    // 已经存在时直接返回，避免生成无用的临时文件
    if (fs::exists(target)) return read_record(target).id;

    persisted_result record{random_uuid(), result};
    json j = {{"id", record.id}, {"result", record.result}};

    fs::path temp = dir / fmt::format(".{}.tmp", record.id);
    defer {
        error_code ec;
        fs::remove(temp, ec);
    };
    // 学生程序的输出可能不是合法的 UTF-8
    write_file_content(temp, j.dump(4, ' ', false, json::error_handler_t::replace));

    if (link(temp.c_str(), target.c_str()) != 0) {
        if (errno == EEXIST) {
            // 并发写入时另一个写入者先完成了
            DLOG(INFO) << "Result " << target << " already exists, returning the existing record";
            return read_record(target).id;
        }
        throw system_error(errno, system_category(), "unable to link " + target.string());
    }
    LOG(INFO) << "Persisted result " << record.id << " for submission " << result.submission_id << " attempt " << result.attempt;
    return record.id;
}

optional<persisted_result> file_result_store::get(const string &submission_id, int attempt) {
    fs::path target = submission_dir(submission_id) / fmt::format("{}{}{}", ATTEMPT_PREFIX, attempt, ATTEMPT_SUFFIX);
    if (!fs::exists(target)) return nullopt;
    return read_record(target);
}

/**
 * @brief 列出一份提交的所有结果文件，按尝试次数排序
 */
static map<int, fs::path> attempt_files(const fs::path &dir) {
    map<int, fs::path> files;
    if (!fs::exists(dir)) return files;
    for (auto &entry : fs::directory_iterator(dir)) {
        string name = entry.path().filename().string();
        if (!boost::starts_with(name, ATTEMPT_PREFIX) || !boost::ends_with(name, ATTEMPT_SUFFIX)) continue;
        string number = name.substr(ATTEMPT_PREFIX.size(), name.size() - ATTEMPT_PREFIX.size() - ATTEMPT_SUFFIX.size());
        int attempt;
        if (boost::conversion::try_lexical_convert(number, attempt)) files[attempt] = entry.path();
    }
    return files;
}

vector<persisted_result> file_result_store::results(const string &submission_id) {
    vector<persisted_result> records;
    for (auto &[attempt, path] : attempt_files(submission_dir(submission_id)))
        records.push_back(read_record(path));
    return records;
}

int file_result_store::last_attempt(const string &submission_id) {
    auto files = attempt_files(submission_dir(submission_id));
    return files.empty() ? 0 : files.rbegin()->first;
}

}  // namespace grader
