#include "grading/config.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <fstream>
#include <map>
#include <set>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

// clang-format off
static const map<string, feedback_visibility> feedback_names = boost::assign::map_list_of
    ("always", feedback_visibility::ALWAYS)
    ("on_failure", feedback_visibility::ON_FAILURE)
    ("never", feedback_visibility::NEVER);

static const map<string, expected_return_code> return_code_names = boost::assign::map_list_of
    ("none", expected_return_code::NONE)
    ("zero", expected_return_code::ZERO)
    ("nonzero", expected_return_code::NONZERO);
// clang-format on

const step_common &common_of(const step_config &step) {
    return visit([](auto &s) -> const step_common & { return s; }, step);
}

template <typename T>
static T parse_enum(const map<string, T> &names, const string &value, const string &field) {
    auto it = names.find(value);
    if (it == names.end()) throw config_error("Unknown ") << field << " '" << value << "'";
    return it->second;
}

static string read_relative(const fs::path &base_dir, const string &path, const string &step_name) {
    if (!is_safe_path(path)) throw config_error("Step ") << step_name << " references unsafe path " << path;
    try {
        return read_file_content(base_dir / path);
    } catch (system_error &e) {
        throw config_error("Step ") << step_name << " cannot read " << path << ": " << e.what();
    }
}

static void parse_common(const json &j, step_common &step, const fs::path &base_dir) {
    j.at("name").get_to(step.name);
    j.at("argv").get_to(step.argv);
    if (j.count("working_dir"))
        j.at("working_dir").get_to(step.working_dir);
    if (j.count("stdin"))
        j.at("stdin").get_to(step.input);
    else if (j.count("stdin_file"))
        step.input = read_relative(base_dir, j.at("stdin_file").get<string>(), step.name);
    if (j.count("env"))
        j.at("env").get_to(step.env);
    if (j.count("limits"))
        j.at("limits").get_to(step.limits);
    if (j.count("feedback"))
        step.feedback = parse_enum(feedback_names, j.at("feedback").get<string>(), "feedback visibility");
    if (j.count("skip_if_failed"))
        j.at("skip_if_failed").get_to(step.skip_if_failed);
    if (j.count("points"))
        j.at("points").get_to(step.points);
}

static output_match parse_match(const json &j, const string &step_name, const fs::path &base_dir) {
    output_match match;
    if (j.count("exact")) {
        match.type = output_match::mode::EXACT;
        j.at("exact").get_to(match.expected);
    } else if (j.count("exact_file")) {
        match.type = output_match::mode::EXACT;
        match.expected = read_relative(base_dir, j.at("exact_file").get<string>(), step_name);
    } else if (j.count("pattern")) {
        match.type = output_match::mode::PATTERN;
        j.at("pattern").get_to(match.expected);
        try {
            // ^ $ 只匹配整个输出的开头结尾，. 不匹配换行，与 ECMAScript 一致
            match.pattern = make_shared<const boost::regex>(match.expected,
                                                          boost::regex::ECMAScript | boost::regex::no_mod_m | boost::regex::no_mod_s);
        } catch (boost::regex_error &e) {
            throw config_error("Step ") << step_name << " has invalid pattern '" << match.expected << "': " << e.what();
        }
    } else {
        throw config_error("Step ") << step_name << " output match requires 'exact', 'exact_file' or 'pattern'";
    }
    return match;
}

static step_config parse_step(const json &j, const fs::path &base_dir) {
    string type = j.at("type").get<string>();
    if (type == "compile") {
        compile_step step;
        parse_common(j, step, base_dir);
        if (j.count("artifacts"))
            j.at("artifacts").get_to(step.artifacts);
        return step;
    } else if (type == "test") {
        test_step step;
        parse_common(j, step, base_dir);
        if (j.count("expected_return_code"))
            step.return_code = parse_enum(return_code_names, j.at("expected_return_code").get<string>(), "expected return code");
        if (j.count("stdout"))
            step.stdout_match = parse_match(j.at("stdout"), step.name, base_dir);
        if (j.count("stderr"))
            step.stderr_match = parse_match(j.at("stderr"), step.name, base_dir);
        if (j.count("deduction"))
            j.at("deduction").get_to(step.deduction);
        return step;
    } else if (type == "diff") {
        diff_step step;
        parse_common(j, step, base_dir);
        if (j.count("expected"))
            j.at("expected").get_to(step.expected);
        else if (j.count("expected_file"))
            step.expected = read_relative(base_dir, j.at("expected_file").get<string>(), step.name);
        else
            throw config_error("Step ") << step.name << " requires 'expected' or 'expected_file'";
        if (j.count("output_file"))
            j.at("output_file").get_to(step.output_file);
        if (j.count("ignore_case"))
            j.at("ignore_case").get_to(step.options.ignore_case);
        if (j.count("ignore_whitespace"))
            j.at("ignore_whitespace").get_to(step.options.ignore_whitespace);
        if (j.count("ignore_whitespace_changes"))
            j.at("ignore_whitespace_changes").get_to(step.options.ignore_whitespace_changes);
        if (j.count("ignore_blank_lines"))
            j.at("ignore_blank_lines").get_to(step.options.ignore_blank_lines);
        if (j.count("deduction"))
            j.at("deduction").get_to(step.deduction);
        return step;
    } else {
        throw config_error("Unknown step type '") << type << "'";
    }
}

static void check_path(const string &path, const string &step_name, const char *field) {
    if (!is_safe_path(path))
        throw config_error("Step ") << step_name << " has unsafe " << field << " '" << path << "'";
}

/**
 * @brief 校验整个配置，并将 skip_if_failed 解析为步骤下标
 */
static void validate(grading_config &config) {
    if (config.max_points < 0) throw config_error("max_points must not be negative");
    if (config.resource_class.empty()) throw config_error("resource_class must not be empty");

    map<string, size_t> index;
    for (size_t i = 0; i < config.steps.size(); ++i) {
        auto &step = visit([](auto &s) -> step_common & { return s; }, config.steps[i]);
        if (step.name.empty()) throw config_error("Step #") << i << " has no name";
        if (index.count(step.name)) throw config_error("Duplicate step name ") << step.name;
        if (step.argv.empty() || step.argv[0].empty()) throw config_error("Step ") << step.name << " has empty argv";
        if (step.points < 0) throw config_error("Step ") << step.name << " has negative points";
        if (!step.working_dir.empty()) check_path(step.working_dir, step.name, "working_dir");

        step.dependencies.clear();
        set<size_t> seen;
        for (auto &dep : step.skip_if_failed) {
            // 只能依赖之前的步骤，这样依赖关系一定无环
            auto it = index.find(dep);
            if (it == index.end())
                throw config_error("Step ") << step.name << " depends on '" << dep << "' which is not an earlier step";
            if (seen.insert(it->second).second) step.dependencies.push_back(it->second);
        }

        if (auto compile = get_if<compile_step>(&config.steps[i])) {
            for (auto &artifact : compile->artifacts) check_path(artifact, step.name, "artifact");
        } else if (auto test = get_if<test_step>(&config.steps[i])) {
            if (test->deduction < 0) throw config_error("Step ") << step.name << " has negative deduction";
        } else if (auto diff = get_if<diff_step>(&config.steps[i])) {
            if (diff->deduction < 0) throw config_error("Step ") << step.name << " has negative deduction";
            if (!diff->output_file.empty()) check_path(diff->output_file, step.name, "output_file");
        }

        index[step.name] = i;
    }

    for (auto &file : config.files)
        if (!is_safe_path(file.name)) throw config_error("Unsafe file name ") << file.name;
}

grading_config parse_grading_config(const json &j, const fs::path &base_dir) {
    grading_config config;
    try {
        j.at("id").get_to(config.id);
        j.at("max_points").get_to(config.max_points);
        if (j.count("time_limit"))
            j.at("time_limit").get_to(config.time_limit);
        if (j.count("resource_class"))
            j.at("resource_class").get_to(config.resource_class);
        if (j.count("sandbox"))
            j.at("sandbox").get_to(config.sandbox);
        if (j.count("files")) {
            for (auto &file : j.at("files")) {
                submission_file f;
                file.at("name").get_to(f.name);
                if (file.count("content"))
                    file.at("content").get_to(f.content);
                else if (!base_dir.empty())
                    f.source_path = base_dir / assert_safe_path(file.at("path").get<string>());
                else
                    throw config_error("File ") << f.name << " requires 'content'";
                config.files.push_back(f);
            }
        }
        for (auto &step : j.at("steps"))
            config.steps.push_back(parse_step(step, base_dir));
    } catch (json::exception &e) {
        throw config_error("Malformed grading config: ") << e.what();
    } catch (invalid_argument &e) {
        throw config_error("Malformed grading config: ") << e.what();
    }

    validate(config);
    return config;
}

grading_config load_grading_config(const fs::path &path) {
    ifstream fin(path);
    if (!fin) throw config_error("Unable to open grading config ") << path.string();
    json j;
    try {
        fin >> j;
    } catch (json::exception &e) {
        throw config_error("Unable to parse grading config ") << path.string() << ": " << e.what();
    }
    auto config = parse_grading_config(j, path.parent_path());
    DLOG(INFO) << "Loaded grading config " << config.id << " with " << config.steps.size() << " step(s)";
    return config;
}

}  // namespace grader
