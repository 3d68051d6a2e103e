#include <fstream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "results/aggregator.hpp"
#include "results/result_store.hpp"
#include "server/directory_store.hpp"
#include "server/spool.hpp"
#include "test/environment.hpp"
#include "test/fault_runtime.hpp"

using namespace std;
using namespace grader;
using namespace nlohmann;
namespace fs = std::filesystem;

class ServerTest : public ::testing::Test {
protected:
    ServerTest() : dir("server-test"), config_dir(dir.path() / "configs"), submission_dir(dir.path() / "submissions") {
        fs::create_directories(config_dir);
        fs::create_directories(submission_dir / "sub1" / "files" / "src");

        write_file_content(config_dir / "hw1.json", R"({
            "id": "hw1",
            "max_points": 1,
            "steps": [
                {
                    "type": "diff",
                    "name": "cat",
                    "argv": ["cat", "src/hello.txt"],
                    "expected_file": "hw1.expected",
                    "points": 1
                }
            ]
        })");
        write_file_content(config_dir / "hw1.expected", "hello\n");
        write_file_content(config_dir / "broken.json", R"({"id": "broken", "max_points": 1, "steps": [{"type": "test"}]})");

        write_file_content(submission_dir / "sub1" / "submission.json", R"({"files": [{"name": "notes.txt", "content": "extra"}]})");
        write_file_content(submission_dir / "sub1" / "files" / "src" / "hello.txt", "hello\n");
    }

    test::temp_dir dir;
    fs::path config_dir, submission_dir;
};

TEST_F(ServerTest, DirectoryStoreTest) {
    server::directory_submission_store store(config_dir, submission_dir);

    grading_config config = store.load_config("hw1");
    ASSERT_EQ(config.steps.size(), 1u);
    EXPECT_EQ(get<diff_step>(config.steps[0]).expected, "hello\n");

    submission sub = store.load_submission("sub1");
    ASSERT_EQ(sub.files.size(), 2u);
    EXPECT_EQ(sub.files[0].name, "notes.txt");
    EXPECT_EQ(sub.files[0].content, "extra");
    EXPECT_EQ(sub.files[1].name, "src/hello.txt");
    EXPECT_FALSE(sub.files[1].source_path.empty());

    EXPECT_THROW(store.load_config("missing"), not_found_error);
    EXPECT_THROW(store.load_config("../configs/hw1"), not_found_error);
    EXPECT_THROW(store.load_config("broken"), config_error);
    EXPECT_THROW(store.load_submission("missing"), not_found_error);
}

TEST_F(ServerTest, SpoolTest) {
    fs::path spool_dir = dir.path() / "spool";
    fs::path sandbox_dir = dir.path() / "sandboxes";
    fs::create_directories(sandbox_dir);

    runtime_options options;
    options.sandbox_dir = sandbox_dir;
    test::fault_runtime runtime(options);
    server::directory_submission_store store(config_dir, submission_dir);
    file_result_store results(dir.path() / "results");
    result_aggregator aggregator(results);

    scheduler_options sched_options;
    sched_options.pools.push_back({"default", 1, 600});
    scheduler sched(sched_options, runtime, store, aggregator);
    sched.start();

    server::spool spool(spool_dir, sched);
    write_file_content(spool_dir / "requests" / "001.json", R"({"action": "enqueue", "submission_id": "sub1", "grading_config_id": "hw1"})");
    write_file_content(spool_dir / "requests" / "002.json", R"({"action": "enqueue", "submission_id": "sub1", "grading_config_id": "missing"})");
    write_file_content(spool_dir / "requests" / "003.json", "not json");
    write_file_content(spool_dir / "requests" / "004.tmp", "{}");
    EXPECT_EQ(spool.poll(), 3u);

    json enqueued = json::parse(read_file_content(spool_dir / "responses" / "001.json"));
    ASSERT_TRUE(enqueued.count("ticket")) << enqueued.dump();
    ticket_id ticket = enqueued["ticket"].get<ticket_id>();
    EXPECT_TRUE(json::parse(read_file_content(spool_dir / "responses" / "002.json")).count("error"));
    EXPECT_TRUE(json::parse(read_file_content(spool_dir / "responses" / "003.json")).count("error"));
    EXPECT_TRUE(fs::exists(spool_dir / "processed" / "001.json"));
    EXPECT_FALSE(fs::exists(spool_dir / "requests" / "001.json"));
    EXPECT_TRUE(fs::exists(spool_dir / "requests" / "004.tmp"));

    ASSERT_TRUE(sched.wait(ticket, chrono::milliseconds(20000)));
    json status = spool.handle({{"action", "status"}, {"ticket", ticket}});
    EXPECT_EQ(status["state"], "completed");
    EXPECT_EQ(status["result"]["total_points"], 1);
    EXPECT_EQ(status["persisted_ids"].size(), 1u);

    json history = spool.handle({{"action", "results"}, {"submission_id", "sub1"}});
    ASSERT_EQ(history["results"].size(), 1u) << history.dump();
    EXPECT_EQ(history["results"][0]["id"], status["persisted_ids"][0]);
    EXPECT_EQ(history["results"][0]["result"]["total_points"], 1);
    EXPECT_TRUE(spool.handle({{"action", "results"}, {"submission_id", "../sub1"}}).count("error"));

    json cancelled = spool.handle({{"action", "cancel"}, {"ticket", ticket}});
    EXPECT_EQ(cancelled["cancelled"], false);
    EXPECT_TRUE(spool.handle({{"action", "status"}, {"ticket", 9999}}).count("error"));
    EXPECT_TRUE(spool.handle({{"action", "restart"}}).count("error"));

    sched.stop();
}

TEST_F(ServerTest, DaemonConfigTest) {
    daemon_config defaults = load_daemon_config({});
    ASSERT_EQ(defaults.pools.size(), 1u);
    EXPECT_EQ(defaults.pools[0].name, "default");
    EXPECT_EQ(defaults.max_infrastructure_retries, 2);
    EXPECT_EQ(defaults.provisioning.attempts, 3);
    EXPECT_EQ(defaults.provisioning.backoff, chrono::milliseconds(100));
    // 排队时间总是有上限
    EXPECT_DOUBLE_EQ(defaults.pools[0].queue_wait_limit, 600);

    fs::path path = dir.path() / "grader.json";
    write_file_content(path, R"({
        "pools": [{"name": "default", "slots": 4, "queue_wait_limit": 600}, {"name": "gpu"}],
        "max_infrastructure_retries": 1,
        "provision_backoff": 0.5,
        "io_timeout": 10
    })");
    daemon_config config = load_daemon_config(path);
    ASSERT_EQ(config.pools.size(), 2u);
    EXPECT_EQ(config.pools[0].slots, 4u);
    EXPECT_DOUBLE_EQ(config.pools[0].queue_wait_limit, 600);
    EXPECT_EQ(config.pools[1].slots, 1u);
    EXPECT_EQ(config.max_infrastructure_retries, 1);
    EXPECT_EQ(config.provisioning.backoff, chrono::milliseconds(500));
    EXPECT_DOUBLE_EQ(config.io_timeout, 10);

    write_file_content(path, R"({"pools": [{"name": "a"}, {"name": "a"}]})");
    EXPECT_THROW(load_daemon_config(path), invalid_argument);
    write_file_content(path, R"({"pools": [{"slots": 1}]})");
    EXPECT_THROW(load_daemon_config(path), invalid_argument);
    write_file_content(path, R"({"pools": [{"name": "a", "queue_wait_limit": -1}]})");
    EXPECT_THROW(load_daemon_config(path), invalid_argument);
    write_file_content(path, R"({"pools": [{"name": "a", "queue_wait_limit": 0}]})");
    EXPECT_THROW(load_daemon_config(path), invalid_argument);
}
