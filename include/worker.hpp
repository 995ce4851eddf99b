#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/grading_orchestrator.hpp"
#include "judge/repository.hpp"
#include "judge/submission.hpp"

/**
 * 评测服务
 * 评测服务维护一个评测队列和固定数量的 worker 线程，每个 worker 从队列中取出提交并
 * 调用评测器完成评测。同一个提交的测试点在同一个 worker 中顺序执行，不同提交并发评测，
 * 同时运行的沙箱数由沙箱管理器限制。
 *
 * 看门狗线程定期检查正在评测的提交，如果提交在看门狗时限内没有完成，
 * 则强制将其标记为 INTERNAL_ERROR 并持久化，worker 之后的评测结果将被丢弃。
 */
namespace labjudge {

struct grading_job {
    std::shared_ptr<submission> submit;

    std::shared_ptr<const problem> prob;

    /**
     * @brief 提交进入终态时完成，worker 和看门狗只有一个会设置
     */
    std::shared_ptr<std::promise<void>> done;

    std::shared_ptr<std::once_flag> done_flag;
};

struct grading_service {
    /**
     * @param workers worker 线程数
     * @param watchdog_interval 看门狗的检查间隔
     */
    grading_service(grading_orchestrator &orchestrator, submission_repository &repository, size_t workers,
                    std::chrono::milliseconds watchdog_interval = std::chrono::milliseconds(200));

    ~grading_service();

    /**
     * @brief 将提交加入评测队列
     * @return 提交进入终态时完成的 future
     */
    std::future<void> enqueue(std::shared_ptr<submission> submit, std::shared_ptr<const problem> prob);

    /**
     * @brief 停止评测服务
     * 调用该函数后，worker 在评测队列为空时退出。函数会等待所有 worker 和看门狗退出。
     */
    void stop();

    /**
     * @brief 评测队列中等待的提交数
     */
    size_t queued();

private:
    struct active_job {
        grading_job job;
        std::chrono::steady_clock::time_point deadline;
        double ceiling_seconds;
    };

    void worker_loop(size_t worker_id);

    void watchdog_loop();

    static void finish(const grading_job &job);

    grading_orchestrator &orchestrator;
    submission_repository &repository;
    const std::chrono::milliseconds watchdog_interval;

    concurrent_queue<grading_job> queue;
    std::vector<std::thread> workers;
    std::thread watchdog;

    std::atomic<bool> stopped{false};

    std::mutex active_mutex;
    std::condition_variable active_cv;
    std::map<std::string, active_job> active;
};

}  // namespace labjudge
