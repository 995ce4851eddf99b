#include "worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace labjudge {
using namespace std;

grading_service::grading_service(grading_orchestrator &orchestrator, submission_repository &repository, size_t worker_count,
                                 chrono::milliseconds watchdog_interval)
    : orchestrator(orchestrator), repository(repository), watchdog_interval(watchdog_interval) {
    if (worker_count == 0)
        throw invalid_argument("grading service requires at least one worker");
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    watchdog = thread([this] { watchdog_loop(); });
}

grading_service::~grading_service() {
    stop();
}

future<void> grading_service::enqueue(shared_ptr<submission> submit, shared_ptr<const problem> prob) {
    grading_job job;
    job.submit = move(submit);
    job.prob = move(prob);
    job.done = make_shared<promise<void>>();
    job.done_flag = make_shared<once_flag>();
    future<void> result = job.done->get_future();
    if (!queue.push(job))
        throw internal_error("grading service is stopping");
    return result;
}

size_t grading_service::queued() {
    return queue.size();
}

void grading_service::finish(const grading_job &job) {
    call_once(*job.done_flag, [&] { job.done->set_value(); });
}

void grading_service::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    grading_job job;
    // 队列关闭且为空时退出
    while (queue.pop(job)) {
        const string id = job.submit->id;
        double ceiling = orchestrator.watchdog_ceiling(*job.prob, job.submit->language).count();
        {
            scoped_lock lock(active_mutex);
            auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(ceiling));
            active[id] = {job, deadline, ceiling};
        }
        defer {
            {
                scoped_lock lock(active_mutex);
                active.erase(id);
            }
            finish(job);
        };

        // grade 不会抛出异常
        orchestrator.grade(*job.submit, *job.prob);
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

void grading_service::watchdog_loop() {
    while (!stopped) {
        vector<active_job> expired;
        {
            unique_lock lock(active_mutex);
            active_cv.wait_for(lock, watchdog_interval, [this] { return stopped.load(); });
            auto now = chrono::steady_clock::now();
            for (auto &[id, entry] : active)
                if (now >= entry.deadline)
                    expired.push_back(entry);
        }

        for (auto &entry : expired) {
            auto &submit = *entry.job.submit;
            string message = fmt::format("Grading did not finish within {:.0f} seconds", entry.ceiling_seconds);
            if (submit.abort_with(status::INTERNAL_ERROR, message)) {
                LOG(ERROR) << "Watchdog forced submission " << submit.id << " to internal error: " << message;
                try {
                    repository.save(submit.snapshot());
                } catch (std::exception &ex) {
                    LOG(ERROR) << "Unable to persist submission " << submit.id << ": " << ex.what();
                }
            }
            finish(entry.job);
        }
    }
}

void grading_service::stop() {
    if (stopped) return;
    queue.close();
    for (auto &th : workers)
        if (th.joinable()) th.join();
    {
        scoped_lock lock(active_mutex);
        stopped = true;
    }
    active_cv.notify_all();
    if (watchdog.joinable()) watchdog.join();
}

}  // namespace labjudge
