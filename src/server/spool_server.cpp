#include "server/spool_server.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace labjudge::server {
using namespace std;
namespace fs = std::filesystem;

spool_server::spool_server(const fs::path &spool_dir, grading_service &service)
    : inbox(spool_dir / "inbox"), processing(spool_dir / "processing"), outbox(outbox_dir(spool_dir)), rejected(spool_dir / "rejected"), service(service) {
    for (auto &dir : {inbox, processing, outbox, rejected})
        fs::create_directories(dir);
}

fs::path spool_server::outbox_dir(const fs::path &spool_dir) {
    return spool_dir / "outbox";
}

size_t spool_server::in_flight() const {
    return claimed.size();
}

size_t spool_server::recover() {
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(processing)) {
        if (!entry.is_regular_file()) continue;
        error_code ec;
        fs::rename(entry.path(), inbox / entry.path().filename(), ec);
        if (ec) {
            LOG(WARNING) << "Unable to recover request " << entry.path() << ": " << ec.message();
        } else {
            ++count;
        }
    }
    if (count) LOG(INFO) << "Recovered " << count << " unfinished requests";
    return count;
}

void spool_server::reject(const fs::path &request, const string &reason) {
    LOG(WARNING) << "Rejected request " << request.filename() << ": " << reason;
    error_code ec;
    fs::rename(request, rejected / request.filename(), ec);
    if (ec) {
        LOG(ERROR) << "Unable to move " << request << " to rejected: " << ec.message();
        fs::remove(request, ec);
        return;
    }
    write_file_content(rejected / (request.filename().string() + ".reason"), reason);
}

bool spool_server::claim(const fs::path &request) {
    fs::path claimed_path = processing / request.filename();
    error_code ec;
    fs::rename(request, claimed_path, ec);
    if (ec) {
        // 请求已经被其他评测进程认领
        return false;
    }

    shared_ptr<submission> submit;
    shared_ptr<problem> prob;
    try {
        nlohmann::json j = nlohmann::json::parse(read_file_content(claimed_path));
        submit = make_shared<submission>(nlohmann::access(j, "submission").get<submission>());
        prob = make_shared<problem>(nlohmann::access(j, "problem").get<problem>());
    } catch (std::exception &ex) {
        reject(claimed_path, ex.what());
        return false;
    }

    try {
        check_request(*submit, *prob);
    } catch (invalid_submission &ex) {
        reject(claimed_path, ex.what());
        return false;
    }

    LOG(INFO) << "Claimed request " << request.filename() << " for submission " << submit->id;
    claimed.push_back({claimed_path, service.enqueue(submit, prob)});
    return true;
}

void spool_server::reap(bool wait) {
    for (auto it = claimed.begin(); it != claimed.end();) {
        if (wait) it->done.wait();
        if (it->done.wait_for(chrono::seconds(0)) != future_status::ready) {
            ++it;
            continue;
        }
        error_code ec;
        fs::remove(it->path, ec);
        if (ec) LOG(WARNING) << "Unable to remove finished request " << it->path << ": " << ec.message();
        it = claimed.erase(it);
    }
}

size_t spool_server::poll() {
    reap(false);

    vector<fs::path> requests;
    for (auto &entry : fs::directory_iterator(inbox))
        if (entry.is_regular_file() && entry.path().extension() == ".json")
            requests.push_back(entry.path());
    // 按文件名排序，先写入的请求通常先被评测
    sort(requests.begin(), requests.end());

    size_t count = 0;
    for (auto &request : requests)
        if (claim(request)) ++count;
    return count;
}

void spool_server::serve(const atomic<bool> &stop, chrono::milliseconds interval) {
    LOG(INFO) << "Serving spool directory " << inbox.parent_path();
    recover();
    while (!stop) {
        try {
            if (poll() == 0) this_thread::sleep_for(interval);
        } catch (std::system_error &ex) {
            LOG(ERROR) << "Unable to scan spool directory: " << ex.what();
            this_thread::sleep_for(interval);
        }
    }
    reap(true);
    LOG(INFO) << "Spool server stopped";
}

}  // namespace labjudge::server
