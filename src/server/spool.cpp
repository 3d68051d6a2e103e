#include "server/spool.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

spool::spool(const fs::path &spool_dir, scheduler &sched)
    : requests_dir(spool_dir / "requests"),
      responses_dir(spool_dir / "responses"),
      processed_dir(spool_dir / "processed"),
      sched(sched) {
    fs::create_directories(requests_dir);
    fs::create_directories(responses_dir);
    fs::create_directories(processed_dir);
}

json spool::handle(const json &request) {
    json response;
    try {
        string action = request.at("action").get<string>();
        if (action == "enqueue") {
            ticket_id ticket = sched.enqueue(request.at("submission_id").get<string>(),
                                             request.at("grading_config_id").get<string>());
            response["ticket"] = ticket;
            response["state"] = get_display_message(ticket_state::QUEUED);
        } else if (action == "cancel") {
            ticket_id ticket = request.at("ticket").get<ticket_id>();
            response["ticket"] = ticket;
            response["cancelled"] = sched.cancel(ticket);
        } else if (action == "status") {
            ticket_id ticket = request.at("ticket").get<ticket_id>();
            auto status = sched.status(ticket);
            if (!status) throw invalid_argument("Unknown ticket " + to_string(ticket));
            response = *status;
        } else if (action == "results") {
            string submission_id = request.at("submission_id").get<string>();
            if (!is_safe_path(submission_id)) throw invalid_argument("Invalid submission id " + submission_id);
            response["submission_id"] = submission_id;
            response["results"] = json::array();
            for (auto &record : sched.results(submission_id))
                response["results"].push_back({{"id", record.id}, {"result", record.result}});
        } else {
            throw invalid_argument("Unknown action " + action);
        }
    } catch (json::exception &e) {
        response = {{"error", string("Malformed request: ") + e.what()}};
    } catch (config_error &e) {
        response = {{"error", e.what()}};
    } catch (not_found_error &e) {
        response = {{"error", "Grading config not found: " + e.path}};
    } catch (invalid_argument &e) {
        response = {{"error", e.what()}};
    } catch (runtime_error &e) {
        response = {{"error", e.what()}};
    }
    return response;
}

void spool::process(const fs::path &request_path) {
    json response;
    try {
        response = handle(json::parse(read_file_content(request_path)));
    } catch (json::exception &e) {
        response = {{"error", string("Malformed request: ") + e.what()}};
    }
    if (response.count("error"))
        LOG(WARNING) << "Request " << request_path.filename().string() << " rejected: " << response["error"].get<string>();
    else
        DLOG(INFO) << "Request " << request_path.filename().string() << " handled";

    fs::path name = request_path.filename();
    fs::path tmp = responses_dir / ("." + name.string() + ".tmp");
    write_file_content(tmp, response.dump(4, ' ', false, json::error_handler_t::replace));
    fs::rename(tmp, responses_dir / name);
    fs::rename(request_path, processed_dir / name);
}

size_t spool::poll() {
    vector<fs::path> requests;
    for (auto &entry : fs::directory_iterator(requests_dir))
        if (entry.is_regular_file() && entry.path().extension() == ".json")
            requests.push_back(entry.path());
    sort(requests.begin(), requests.end());

    for (auto &request : requests) process(request);
    return requests.size();
}

void spool::run(const atomic<bool> &stopping, chrono::milliseconds interval) {
    LOG(INFO) << "Watching " << requests_dir.string() << " for requests";
    while (!stopping) {
        size_t handled = 0;
        try {
            handled = poll();
        } catch (fs::filesystem_error &e) {
            LOG(ERROR) << "Unable to process spool: " << e.what();
        } catch (system_error &e) {
            LOG(ERROR) << "Unable to process spool: " << e.what();
        }
        if (handled == 0) this_thread::sleep_for(interval);
    }
}

}  // namespace grader::server
