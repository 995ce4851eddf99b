#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "sandbox/sandbox.hpp"
#include "toolchain.hpp"

namespace labjudge {

using deadline_t = std::optional<std::chrono::steady_clock::time_point>;

struct sandbox_manager_config {
    /**
     * @brief 存放 box 目录的路径，必须能被沙箱后端访问
     */
    std::filesystem::path run_dir = "/tmp/labjudge";

    /**
     * @brief 同时运行的沙箱数上限，超出的调用将排队等待
     */
    size_t max_sandboxes = 4;

    /**
     * @brief 基础设施错误的重试次数
     */
    int retries = 2;

    /**
     * @brief 两次重试之间的等待时间，单位为毫秒
     */
    int retry_backoff_ms = 200;

    /**
     * @brief 时钟时间限制之外的宽限时间，单位为秒，与沙箱后端的配置一致
     */
    double grace = 1;

    /**
     * @brief 运行时除了时间、内存以外的资源限制（进程数、CPU 配额、/tmp 大小、输出截断长度）
     */
    sandbox_limits defaults;

    /**
     * @brief 编译的时间限制，单位为秒
     */
    double compile_time_limit = 10;

    /**
     * @brief 编译的内存限制，单位为 MB
     */
    int compile_memory_limit = 512;

    /**
     * @brief 若为真，不删除 box 目录
     */
    bool keep_files = false;
};

/**
 * @brief 一次运行分类后的结果
 */
struct execution_outcome {
    /**
     * @brief ACCEPTED 表示程序正常退出（输出还没有比较），
     * 或者为 TIME_LIMIT_EXCEEDED、MEMORY_LIMIT_EXCEEDED、RUNTIME_ERROR、COMPILATION_ERROR
     */
    status stat = status::INTERNAL_ERROR;

    std::string stdout_data;

    std::string stderr_data;

    double execution_time_ms = 0;

    double memory_used_mb = 0;

    std::string compile_output;

    std::string error_message;

    /**
     * @brief 是否因为到达截止时间而被终止
     */
    bool cancelled = false;

    bool output_truncated = false;
};

/**
 * @brief 编译好的程序，持有 box 目录，析构时删除
 */
struct prepared_program {
    prepared_program(const toolchain_profile &profile, const std::filesystem::path &box_dir, bool keep_files);
    prepared_program(const prepared_program &) = delete;
    prepared_program &operator=(const prepared_program &) = delete;
    ~prepared_program();

    /**
     * @brief 编译是否成功，解释型语言总是成功
     */
    bool compiled() const;

    const toolchain_profile &profile;

    const std::filesystem::path box_dir;

    /**
     * @brief ACCEPTED 或 COMPILATION_ERROR
     */
    status compile_status = status::ACCEPTED;

    /**
     * @brief 编译器的标准输出和标准错误
     */
    std::string compile_output;

    double compile_time_ms = 0;

private:
    bool keep_files;
};

/**
 * @brief 根据沙箱的原始结果分类
 * 按顺序判断：时间超限、内存超限、运行时错误，否则为 ACCEPTED
 * @param limits 实际使用的资源限制
 */
status classify(const sandbox_result &result, const sandbox_limits &limits);

/**
 * @brief 计算语言的实际资源限制：请求的限制乘以语言的倍数
 */
sandbox_limits effective_limits(const toolchain_profile &profile, const sandbox_limits &requested);

/**
 * @brief 沙箱管理器
 * 负责限制全局同时运行的沙箱数、重试基础设施错误、编译和运行用户程序。
 * 所有成员函数都是线程安全的。
 */
struct sandbox_manager {
    sandbox_manager(sandbox &backend, const toolchain_registry &registry, const sandbox_manager_config &config);

    /**
     * @brief 准备用户程序：写入源代码并编译（如果需要）
     * 编译失败不会抛出异常，通过 compile_status 表示
     * @throw unsupported_language 语言不受支持时，此时不会创建任何沙箱
     * @throw infrastructure_error 重试后沙箱依然无法运行
     */
    std::unique_ptr<prepared_program> prepare(const std::string &code, const std::string &language, deadline_t deadline = std::nullopt);

    /**
     * @brief 运行编译好的程序
     * @param requested 请求的资源限制，只使用时间和内存限制，实际限制会乘以语言的倍数
     */
    execution_outcome execute(const prepared_program &program, const std::string &stdin_data, const sandbox_limits &requested, deadline_t deadline = std::nullopt);

    /**
     * @brief 编译并运行一次程序，不比较输出
     */
    execution_outcome run(const std::string &code, const std::string &language, const std::string &stdin_data, const sandbox_limits &requested, deadline_t deadline = std::nullopt);

    /**
     * @brief 以 defaults 为基础，设置时间和内存限制
     */
    sandbox_limits make_limits(double time_limit, int memory_limit) const;

    const sandbox_manager_config &config() const;

    const toolchain_registry &toolchains() const;

    sandbox &backend() const;

private:
    /**
     * @brief 占用一个沙箱名额并运行，遇到基础设施错误时有限次重试
     */
    sandbox_result invoke(const sandbox_request &request);

    void acquire_slot();
    void release_slot();

    sandbox &box;
    const toolchain_registry &registry;
    sandbox_manager_config conf;

    std::mutex slot_mutex;
    std::condition_variable slot_cv;
    size_t running = 0;
};

}  // namespace labjudge
