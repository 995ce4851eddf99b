#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace labjudge {

/**
 * @brief runguard 写入 meta 文件的监测结果
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加  
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，优先使用 cgroup 统计的整个进程树的 CPU 时间
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief runguard 自身出错时的错误信息，此时其他字段不可信
     */
    std::string internal_error;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为 oom 表示 cgroup 观察到了 OOM kill
     */
    std::string memory_result;

    /**
     * @brief 为空表示没有超时，否则为 soft-timelimit 或 hard-timelimit
     */
    std::string time_result;

    /**
     * @brief 被截断的输出流，如 "stdout,stderr"
     */
    std::string output_truncated;

    /**
     * @brief meta 文件中是否出现了 exitcode，没有出现说明 runguard 没有正常结束
     */
    bool has_exitcode = false;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace labjudge
