#pragma once

#include <cstdint>
#include "runguard_options.hpp"

/**
 * @brief 创建 cgroup，并注册 memory、pids、cpu 等资源管控器
 */
void cgroup_create(const struct runguard_options &);

/**
 * Move current process to the control group.
 *
 * Attach to the control group to change settings
 * and monitor status.
 */
void cgroup_attach(const struct runguard_options &);

/**
 * Kill all processes in the control group.
 *
 * Here, runguard will kill all child processes of
 * the monitored process after exiting.
 */
void cgroup_kill(const struct runguard_options &);

void cgroup_delete(const struct runguard_options &);

struct cgroup_stats {
    /**
     * @brief 峰值内存，单位为字节，内核不支持时为 -1
     */
    int64_t memory_peak = -1;

    /**
     * @brief CPU 时间，单位为秒
     */
    double cpu_time = -1;

    /**
     * @brief 是否发生了 OOM kill
     */
    bool oom_killed = false;
};

/**
 * @brief 读取 cgroup 的监测数据，兼容 cgroup v1 和 v2
 */
cgroup_stats cgroup_read_stats(const struct runguard_options &);

/**
 * @brief 在私有的 mount 命名空间中构建受控程序看到的文件系统
 * 必须在 unshare(CLONE_NEWNS) 之后调用。
 * 1. 将所有挂载点改为 private，避免影响主机
 * 2. 必要时将根目录（或 chroot 目录）下的所有挂载点重新挂载为只读
 * 3. 在 /tmp 挂载大小受限的 tmpfs 作为可写临时目录
 * 4. 将 box 目录绑定挂载到 /tmp/box，编译时可写，运行时只读
 * 5. 用空的只读 tmpfs 遮住 box 目录的上层目录，受控程序无法看到其他沙箱的文件
 * 会将 opt.work_dir 设置为 /tmp/box
 */
void setup_filesystem(struct runguard_options &opt);

/**
 * @brief 在新的 PID 命名空间中挂载 /proc
 * 必须由 PID 命名空间的 1 号进程调用
 */
void mount_proc(const struct runguard_options &opt);

/**
 * Limit current process resources usage.
 */
void set_restrictions(const struct runguard_options &opt);

/**
 * @brief 禁止受控程序调用危险的系统调用
 * 比如 ptrace、mount、unshare、setns、reboot，以及创建新的 user 命名空间。
 * 其余系统调用全部允许，权限控制主要依赖 cgroup、命名空间和运行用户。
 */
void set_seccomp(const struct runguard_options &opt);
