#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace labjudge {

/**
 * @brief 沙箱的资源限制
 */
struct sandbox_limits {
    /**
     * @brief 时钟时间和 CPU 时间限制，单位为秒
     */
    double time_limit = 5;

    /**
     * @brief 内存限制，单位为 MB。超过限制时程序会被 OOM killer 终止
     */
    int memory_limit = 256;

    /**
     * @brief 沙箱内同时存在的进程（线程）数上限
     */
    size_t process_limit = 64;

    /**
     * @brief CPU 配额，1 表示最多使用一个 CPU 核心
     */
    double cpu_quota = 1;

    /**
     * @brief 可写临时目录 /tmp 的大小上限，单位为 MB
     */
    int scratch_size = 64;

    /**
     * @brief 标准输出、标准错误各自的截断长度，单位为 KB
     */
    int output_limit = 65536;
};

/**
 * @brief 一次沙箱调用的请求
 */
struct sandbox_request {
    /**
     * @brief 要运行的命令，命令将在 box_dir 中执行
     */
    std::vector<std::string> command;

    /**
     * @brief 存放源代码和编译产物的目录，沙箱内的工作目录
     */
    std::filesystem::path box_dir;

    /**
     * @brief box_dir 在沙箱中是否可写
     * 编译时需要写入编译产物，运行时 box_dir 只读
     */
    bool writable_box = false;

    /**
     * @brief 容器后端使用的镜像
     */
    std::string image;

    /**
     * @brief 标准输入的内容
     */
    std::string stdin_data;

    sandbox_limits limits;

    /**
     * @brief 外部截止时间，到达截止时间时沙箱会被强制终止
     */
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/**
 * @brief 一次沙箱调用的原始结果，还未分类为评测结果
 */
struct sandbox_result {
    /**
     * @brief 程序返回值，被信号终止时为 -1 或 128 + 信号
     */
    int exitcode = -1;

    /**
     * @brief 终止程序的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief CPU 时间，单位为秒，后端不支持时为 -1
     */
    double cpu_time = -1;

    /**
     * @brief 峰值内存，单位为字节，后端不支持时为 -1
     */
    int64_t memory_bytes = -1;

    /**
     * @brief 是否触发了时间限制（时钟时间或 CPU 时间），程序已被强制终止
     */
    bool time_limit_hit = false;

    /**
     * @brief 是否观察到了 OOM kill
     */
    bool oom_killed = false;

    /**
     * @brief 是否因为到达外部截止时间而被终止
     */
    bool cancelled = false;

    bool output_truncated = false;

    std::string stdout_data;

    std::string stderr_data;
};

/**
 * @brief 隔离运行环境
 *
 * 每次 run 调用都会创建一个全新的隔离环境并在返回前销毁，保证：
 * 1. 没有网络访问
 * 2. 根文件系统只读，只有大小受限的临时目录可写
 * 3. 进程数受限
 * 4. 时钟时间和 CPU 配额受限
 * 5. 内存受限，超过限制时强制终止
 *
 * 实现必须是线程安全的，沙箱管理器会在多个 worker 中并发调用 run。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 后端名称，如 runguard、container
     */
    virtual std::string name() const = 0;

    /**
     * @brief 检查后端是否可用，在启动时调用
     * @throw infrastructure_error 后端不可用时
     */
    virtual void health_check() = 0;

    /**
     * @brief 在隔离环境中运行一条命令
     * 用户程序自身的错误（超时、内存超限、崩溃）通过返回值表示
     * @throw infrastructure_error 隔离环境无法创建或运行时崩溃
     */
    virtual sandbox_result run(const sandbox_request &request) = 0;

    /**
     * @brief 释放后端持有的资源，在评测服务关闭时调用
     */
    virtual void shutdown();
};

}  // namespace labjudge
