#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

/**
 * @brief 软限制和硬限制，单位为秒
 * 超过软限制时结果记为 soft-timelimit，超过硬限制时程序被强制终止
 */
struct time_limit {
    double soft, hard;
};

/**
 * @brief runguard 的命令行参数
 */
struct runguard_options {
    // 受控命令及其重定向
    std::vector<std::string> command;
    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;
    std::string metafile_path;
    bool preserve_sys_env = false;
    std::vector<std::string> env;

    // 运行身份，-1 表示不切换
    int user_id = -1;
    int group_id = -1;

    // 文件系统：box 目录挂载在 /tmp/box 并成为工作目录
    std::string chroot_dir;
    std::string work_dir;
    std::string box_dir;
    bool box_writable = false;
    bool read_only_root = false;
    int64_t scratch_size = -1;  // bytes

    // cgroup 限制
    std::string cgroupname;
    std::string cpuset;
    double cpu_quota = -1;
    size_t nproc = std::numeric_limits<size_t>::max();
    int64_t memory_limit = -1;  // bytes

    // 时间限制
    bool use_wall_limit = false;
    struct time_limit wall_limit;
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;

    // 输出限制
    int64_t file_limit = -1;   // bytes
    int64_t stream_size = -1;  // bytes, -1 means unlimited
    bool no_core_dumps = false;

    bool use_seccomp = false;
};
