#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

struct cgroup;
struct cgroup_controller;

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_exception : public std::runtime_error {
    cgroup_exception(const std::string &cgroup_op, int err);

    /**
     * @brief libcgroup 的错误码，如 ECGROUPNOTEXIST
     */
    int error() const noexcept;

private:
    int err;
};

/**
 * @brief 表示一个 cgroup 的 controller
 *
 * runguard 使用的 controller 有：
 * 1. memory - 限制内存使用，统计峰值内存，记录 OOM kill 次数
 * 2. pids - 限制 cgroup 内同时存在的进程（线程）数
 * 3. cpu - 通过 CFS 配额限制可以使用的 CPU 数量
 * 4. cpuacct - 统计 CPU 时间（仅 cgroup v1，v2 中由 cpu.stat 提供）
 * 5. cpuset - 给 cgroup 中的任务分配独立 CPU
 *
 * https://www.kernel.org/doc/html/latest/admin-guide/cgroup-v2.html
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void set(const std::string &name, int64_t value);

    void set(const std::string &name, const std::string &value);
};

/**
 * @brief 管理一个 cgroup，析构时释放 libcgroup 的内存（不会删除内核中的 cgroup）
 */
struct cgroup_guard {
    /**
     * @param cgroup_name cgroup 的内核名称，如 /labjudge/runguard_1234_1600000000
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    ~cgroup_guard();

    /**
     * @brief 添加 controller，设定值在 create 时写入内核
     * @throw cgroup_exception 当 controller 不可用时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 在内核中创建 cgroup，并写入 add_controller 添加的设定
     */
    void create();

    /**
     * @brief 从内核中读入已有的 cgroup
     */
    void load();

    /**
     * @brief 将当前进程移入 cgroup
     */
    void attach();

    /**
     * @brief 杀死 cgroup 内的所有进程
     * cgroup v2 优先使用 cgroup.kill，否则不断枚举并杀死 cgroup 内的进程直到为空
     * @return cgroup 是否已经为空
     */
    bool kill_all();

    /**
     * @brief 从内核中删除 cgroup
     * 刚被杀死的进程可能还没有离开 cgroup，删除失败时最多重试 retries 次
     */
    void remove(int retries);

    /**
     * @brief 读取单值统计文件，如 memory.peak
     * @param controller v1 中 controller 的挂载点名称，v2 中忽略
     * @return 文件不存在或者格式不正确时返回 def
     */
    int64_t read_value(const std::string &controller, const std::string &file, int64_t def) const;

    /**
     * @brief 读取 "key value" 形式的多行统计文件中的一项，如 cpu.stat 中的 usage_usec
     */
    int64_t read_keyed_value(const std::string &controller, const std::string &file, const std::string &key, int64_t def) const;

    /**
     * @brief cgroup 在 cgroupfs 中的目录
     */
    std::filesystem::path path(const std::string &controller) const;

    const std::string &name() const;

    static void init();

    /**
     * @brief 系统是否使用 cgroup v2（unified hierarchy）
     * 通过 /sys/fs/cgroup/cgroup.controllers 是否存在判断
     */
    static bool unified();

    /**
     * @brief cgroup 挂载点下的文件，如 v1 中的 memory/memory.memsw.limit_in_bytes
     */
    static std::filesystem::path root(const std::string &controller);

private:
    std::string cgroup_name;
    struct cgroup *cg;
};
