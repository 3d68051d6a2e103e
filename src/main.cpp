#include <glog/logging.h>
#include <pwd.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <atomic>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "results/aggregator.hpp"
#include "results/result_store.hpp"
#include "scheduler/monitor.hpp"
#include "scheduler/scheduler.hpp"
#include "server/directory_store.hpp"
#include "server/spool.hpp"
using namespace std;

static atomic<bool> stopping{false};

void stop_handler(int /* signum */) {
    stopping = true;
}

/**
 * @brief 从命令行参数或者环境变量中读取目录
 */
static filesystem::path option_or_env(const boost::program_options::variables_map &vm, const char *option, const char *env) {
    if (vm.count(option)) return filesystem::path(vm.at(option).as<string>());
    return filesystem::path(grader::get_env(env, ""));
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the daemon configuration file describing resource pools and retry policy. You can either pass it from environ GRADER_CONFIG")
        ("sandbox-dir", po::value<string>(), "set the directory to create sandboxes in. You can either pass it from environ SANDBOXDIR")
        ("result-dir", po::value<string>(), "set the directory to persist grading results. You can either pass it from environ RESULTDIR")
        ("config-dir", po::value<string>(), "set the directory storing grading configurations. You can either pass it from environ CONFIGDIR")
        ("submission-dir", po::value<string>(), "set the directory storing submissions. You can either pass it from environ SUBMISSIONDIR")
        ("spool-dir", po::value<string>(), "set the directory to receive grading requests from. You can either pass it from environ SPOOLDIR")
        ("runtime", po::value<string>()->default_value("cgroup"), "set the sandbox runtime, cgroup or process")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("poll-interval", po::value<unsigned>()->default_value(200), "set the interval in milliseconds between scanning the spool directory")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode.")
        ("help", "display this help text");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: Grade submissions in isolated sandboxes" << endl
             << "The cgroup runtime requires root privilege" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        grader::DEBUG = true;
    } else if (getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    string runtime_name = vm.at("runtime").as<string>();
    if (getuid() != 0 && runtime_name == "cgroup") {
        cerr << "You should run this program in privileged mode" << endl;
        if (!grader::DEBUG) return EXIT_FAILURE;
        runtime_name = "process";
        LOG(WARNING) << "Falling back to process runtime in debug mode";
    }

    grader::runtime_options options;
    options.sandbox_dir = option_or_env(vm, "sandbox-dir", "SANDBOXDIR");
    CHECK(filesystem::is_directory(options.sandbox_dir))
        << "Sandbox directory " << options.sandbox_dir << " does not exist";
    filesystem::path result_dir = option_or_env(vm, "result-dir", "RESULTDIR");
    CHECK(filesystem::is_directory(result_dir))
        << "Result directory " << result_dir << " does not exist";
    filesystem::path config_dir = option_or_env(vm, "config-dir", "CONFIGDIR");
    CHECK(filesystem::is_directory(config_dir))
        << "Grading configuration directory " << config_dir << " does not exist";
    filesystem::path submission_dir = option_or_env(vm, "submission-dir", "SUBMISSIONDIR");
    CHECK(filesystem::is_directory(submission_dir))
        << "Submission directory " << submission_dir << " does not exist";
    filesystem::path spool_dir = option_or_env(vm, "spool-dir", "SPOOLDIR");
    CHECK(filesystem::is_directory(spool_dir))
        << "Spool directory " << spool_dir << " does not exist";

    string run_user = vm.count("run-user") ? vm["run-user"].as<string>() : grader::get_env("RUNUSER", "");
    if (!run_user.empty()) {
        struct passwd *pw = getpwnam(run_user.c_str());
        CHECK(pw) << "Run user " << run_user << " does not exist";
        options.user_id = pw->pw_uid;
        options.group_id = pw->pw_gid;
    }

    grader::daemon_config config;
    try {
        config = grader::load_daemon_config(option_or_env(vm, "config", "GRADER_CONFIG"));
    } catch (std::exception &e) {
        LOG(FATAL) << "Unable to load configuration: " << e.what();
    }
    options.io_timeout = chrono::duration_cast<chrono::milliseconds>(grader::seconds_to_duration(config.io_timeout));
    options.cgroup_parent = config.cgroup_parent;

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    signal(SIGINT, stop_handler);
    signal(SIGTERM, stop_handler);

    unique_ptr<grader::sandbox_runtime> runtime;
    try {
        runtime = grader::make_sandbox_runtime(runtime_name, options);
    } catch (grader::grader_exception &e) {
        LOG(FATAL) << "Unable to initialize " << runtime_name << " runtime: " << e;
    } catch (std::invalid_argument &e) {
        LOG(FATAL) << e.what();
    }

    grader::server::directory_submission_store store(config_dir, submission_dir);
    grader::file_result_store results(result_dir);
    grader::result_aggregator aggregator(results, config.max_infrastructure_retries);

    grader::scheduler_options scheduler_options;
    scheduler_options.pools = config.pools;
    scheduler_options.provisioning = config.provisioning;

    grader::scheduler scheduler(scheduler_options, *runtime, store, aggregator);
    scheduler.register_monitor(make_unique<grader::log_monitor>());
    scheduler.start();

    grader::server::spool spool(spool_dir, scheduler);
    spool.run(stopping, chrono::milliseconds(vm["poll-interval"].as<unsigned>()));

    LOG(INFO) << "Received stop signal, stopping workers";
    scheduler.stop();
    return EXIT_SUCCESS;
}
