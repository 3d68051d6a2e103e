#include "server/directory_store.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

directory_submission_store::directory_submission_store(const fs::path &config_dir, const fs::path &submission_dir)
    : config_dir(config_dir), submission_dir(submission_dir) {}

grading_config directory_submission_store::load_config(const string &config_id) {
    if (!is_safe_path(config_id)) throw not_found_error(config_id);
    fs::path path = config_dir / (config_id + ".json");
    if (!fs::is_regular_file(path)) throw not_found_error(path.string());
    grading_config config = load_grading_config(path);
    if (config.id != config_id)
        throw config_error("Grading config ") << path.string() << " declares id " << config.id;
    return config;
}

static void collect_files(const fs::path &files_dir, vector<submission_file> &files) {
    for (auto &entry : fs::recursive_directory_iterator(files_dir)) {
        if (!entry.is_regular_file()) continue;
        submission_file file;
        file.name = fs::relative(entry.path(), files_dir).string();
        file.source_path = entry.path();
        files.push_back(file);
    }
}

submission directory_submission_store::load_submission(const string &submission_id) {
    if (!is_safe_path(submission_id)) throw not_found_error(submission_id);
    fs::path dir = submission_dir / submission_id;
    fs::path info = dir / "submission.json";
    if (!fs::is_regular_file(info)) throw not_found_error(info.string());

    submission submit;
    submit.id = submission_id;
    try {
        json j = json::parse(read_file_content(info));
        if (j.count("files")) {
            for (auto &file : j.at("files")) {
                submission_file f;
                f.name = assert_safe_path(file.at("name").get<string>());
                if (file.count("content"))
                    file.at("content").get_to(f.content);
                else
                    f.source_path = dir / assert_safe_path(file.at("path").get<string>());
                submit.files.push_back(f);
            }
        }
        if (fs::is_directory(dir / "files"))
            collect_files(dir / "files", submit.files);
    } catch (json::exception &e) {
        throw infrastructure_error("Malformed submission " + submission_id + ": " + e.what());
    } catch (invalid_argument &e) {
        throw infrastructure_error("Malformed submission " + submission_id + ": " + e.what());
    } catch (fs::filesystem_error &e) {
        throw infrastructure_error("Unable to read submission " + submission_id + ": " + e.what());
    } catch (system_error &e) {
        throw infrastructure_error("Unable to read submission " + submission_id + ": " + e.what());
    }
    DLOG(INFO) << "Loaded submission " << submission_id << " with " << submit.files.size() << " file(s)";
    return submit;
}

}  // namespace grader::server
