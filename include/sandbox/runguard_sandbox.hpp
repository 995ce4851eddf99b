#pragma once

#include <filesystem>
#include <string>
#include "sandbox/sandbox.hpp"

namespace labjudge {

/**
 * @brief runguard 沙箱的配置
 */
struct runguard_config {
    /**
     * @brief runguard 可执行文件的路径，需要 root 权限或者 setuid
     */
    std::filesystem::path runguard = "runguard";

    /**
     * @brief 每次运行的临时目录都创建在该目录下
     * RUN_DIR
     * ├── run-[uuid] // 一次运行的临时目录，运行结束后删除
     * │   ├── stdin // 标准输入
     * │   ├── stdout // 标准输出
     * │   ├── stderr // 标准错误
     * │   └── meta // runguard 的监测结果
     * └── box-[uuid] // 一次提交的 box 目录，包含源代码和编译产物
     */
    std::filesystem::path run_dir = "/tmp/labjudge";

    /**
     * @brief 受控程序的运行用户和用户组，不能为 root
     */
    std::string run_user = "nobody";
    std::string run_group = "nogroup";

    /**
     * @brief 受控程序的根目录，为空表示使用主机的根目录（只读挂载）
     */
    std::filesystem::path chroot_dir;

    /**
     * @brief 受控程序可以使用的 CPU 核心，如 "0,2-3"，为空表示不限制
     */
    std::string cpuset;

    /**
     * @brief 时钟时间限制的宽限时间，单位为秒
     * 到达时间限制后程序不会立刻被杀死，超过 time_limit + grace 才强制终止
     */
    double grace = 1;

    /**
     * @brief 是否加载 seccomp 过滤器
     */
    bool seccomp = true;

    /**
     * @brief 若为真，不删除运行产生的临时文件，便于调试
     */
    bool keep_files = false;
};

/**
 * @brief 通过 runguard 进程监狱运行程序的沙箱
 * 每次运行都会启动一个 runguard 进程，runguard 负责创建 cgroup、命名空间，
 * 构建只读根目录和大小受限的 /tmp，运行结束后清理 cgroup。
 */
struct runguard_sandbox : public sandbox {
    explicit runguard_sandbox(const runguard_config &config);

    std::string name() const override;

    void health_check() override;

    sandbox_result run(const sandbox_request &request) override;

    const runguard_config &config() const;

private:
    runguard_config conf;
};

}  // namespace labjudge
