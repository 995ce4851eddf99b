#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <list>
#include <memory>
#include "worker.hpp"

namespace labjudge::server {

/**
 * @brief 基于目录的评测请求收发
 *
 * SPOOL_DIR
 * ├── inbox // 外部系统写入评测请求 {"submission": {...}, "problem": {...}}
 * ├── processing // 正在评测的请求，评测完成后删除
 * ├── outbox // 持久化的提交 <submission id>.json，先写入 running 状态，再写入终态
 * └── rejected // 格式不正确的请求
 *
 * 外部系统应该先写入临时文件再重命名到 inbox 中，只有扩展名为 .json 的文件会被处理。
 */
struct spool_server {
    spool_server(const std::filesystem::path &spool_dir, grading_service &service);

    /**
     * @brief 评测结果的存放目录，提交仓库应当写入该目录
     */
    static std::filesystem::path outbox_dir(const std::filesystem::path &spool_dir);

    /**
     * @brief 将上次运行遗留在 processing 中的请求移回 inbox
     * @return 恢复的请求数
     */
    size_t recover();

    /**
     * @brief 扫描 inbox，认领所有请求并加入评测队列
     * 同时清理已经评测完成的请求
     * @return 本次认领的请求数
     */
    size_t poll();

    /**
     * @brief 不断扫描 inbox，直到 stop 被设置，退出前等待所有认领的请求评测完成
     */
    void serve(const std::atomic<bool> &stop, std::chrono::milliseconds interval = std::chrono::milliseconds(100));

    /**
     * @brief 正在评测的请求数
     */
    size_t in_flight() const;

private:
    struct claimed_request {
        std::filesystem::path path;
        std::future<void> done;
    };

    /**
     * @brief 认领一个请求
     * @return 是否认领成功，请求被其他进程认领或格式不正确时返回 false
     */
    bool claim(const std::filesystem::path &request);

    void reject(const std::filesystem::path &request, const std::string &reason);

    void reap(bool wait);

    std::filesystem::path inbox, processing, outbox, rejected;
    grading_service &service;
    std::list<claimed_request> claimed;
};

}  // namespace labjudge::server
