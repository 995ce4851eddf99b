#pragma once

#include <filesystem>
#include <string>
#include "sandbox/sandbox.hpp"

namespace labjudge {

struct container_config {
    /**
     * @brief 容器运行时的命令行程序，如 docker、podman
     */
    std::filesystem::path runtime = "docker";

    /**
     * @brief 每次运行的临时文件（标准输入、输出）的存放目录
     */
    std::filesystem::path run_dir = "/tmp/labjudge";

    /**
     * @brief 容器内运行程序的用户，默认为 nobody
     */
    std::string user = "65534:65534";

    /**
     * @brief 时钟时间限制的宽限时间，单位为秒
     */
    double grace = 1;

    /**
     * @brief 容器运行时命令（create、inspect、rm）本身的超时时间，单位为秒
     */
    double command_timeout = 30;

    bool keep_files = false;
};

/**
 * @brief 通过容器运行时的命令行运行程序的沙箱
 * 每次运行都会 create、start、inspect、rm 一个全新的容器。
 * 容器运行时不提供峰值内存，memory_bytes 总是 -1，内存超限只能通过 OOMKilled 判断。
 * 容器运行时也不提供 CPU 时间，以下情况视为超时：
 * 1. 容器内进程的运行时间（FinishedAt - StartedAt）超过时间限制加宽限时间
 * 2. 进程被 CPU 时间的 rlimit 终止（SIGXCPU，或捕获 SIGXCPU 后的 SIGKILL）
 * 3. start 在时间限制加宽限时间和启动时间内没有返回
 */
struct container_sandbox : public sandbox {
    explicit container_sandbox(const container_config &config);

    std::string name() const override;

    void health_check() override;

    sandbox_result run(const sandbox_request &request) override;

private:
    /**
     * @brief 执行容器运行时的命令，标准输出写入 output
     * @return 命令的返回值
     */
    int runtime_command(const std::vector<std::string> &args, const std::filesystem::path &output, double timeout);

    container_config conf;
};

}  // namespace labjudge
