#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "judge/grading_orchestrator.hpp"
#include "sandbox/container_sandbox.hpp"
#include "sandbox/runguard_sandbox.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "toolchain.hpp"

namespace labjudge {

/**
 * @brief 评测系统的配置
 * 可以通过 JSON 配置文件设置，命令行参数和环境变量会覆盖配置文件中的值。
 * 配置文件中的键与字段名相同，如：
 * @code{.json}
 * {
 *     "backend": "runguard",
 *     "run_dir": "/var/lib/labjudge/run",
 *     "workers": 4,
 *     "max_sandboxes": 4,
 *     "toolchains": "/etc/labjudge/toolchains.json"
 * }
 * @endcode
 */
struct labjudge_config {
    /**
     * @brief 选手程序编译及运行的根目录
     * RUN_DIR
     * ├── box-[uuid] // 一次提交的源代码和编译产物
     * └── run-[uuid] // 一次运行的标准输入、输出和 runguard 的监测结果
     */
    std::filesystem::path run_dir = "/tmp/labjudge";

    /**
     * @brief runguard 可执行文件的路径
     */
    std::filesystem::path runguard = "runguard";

    std::string run_user = "nobody";

    std::string run_group = "nogroup";

    /**
     * @brief 配置好的 chroot 路径，为空时使用只读挂载的主机根目录
     */
    std::filesystem::path chroot_dir;

    /**
     * @brief 沙箱后端，runguard 或 container
     */
    std::string backend = "runguard";

    std::filesystem::path container_runtime = "docker";

    /**
     * @brief 受控程序可以使用的 CPU 核心，如 "0,2-3"
     */
    std::string cpuset;

    size_t workers = 2;

    size_t max_sandboxes = 4;

    int sandbox_retries = 2;

    int retry_backoff_ms = 200;

    double grace_seconds = 1;

    size_t process_limit = 64;

    double cpu_quota = 1;

    int scratch_size_mb = 64;

    int output_limit_kb = 65536;

    double compile_time_limit = 10;

    int compile_memory_limit_mb = 512;

    double deadline_factor = 3;

    double watchdog_factor = 6;

    double deadline_slack_seconds = 10;

    double watchdog_slack_seconds = 30;

    /**
     * @brief 额外的语言配置，可以是 JSON 文件路径或者内联的 JSON 对象
     */
    nlohmann::json toolchains;

    /**
     * @brief 是否开启 DEBUG 模式
     * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行，
     * 并且不会删除产生的 box 目录和运行目录，以便手动检查文件内容是否符合预期。
     */
    bool debug = false;

    /**
     * @brief 检查配置是否合法
     * @throw std::invalid_argument 配置不合法时
     */
    void validate() const;

    runguard_config make_runguard_config() const;

    container_config make_container_config() const;

    sandbox_manager_config make_sandbox_manager_config() const;

    grading_config make_grading_config() const;

    /**
     * @brief 创建内置语言并加载额外的语言配置
     */
    toolchain_registry make_toolchains() const;

    /**
     * @brief 根据 backend 创建沙箱后端
     */
    std::unique_ptr<sandbox> make_sandbox() const;
};

/**
 * @brief 读取配置，没有出现的键保留原值
 */
void from_json(const nlohmann::json &j, labjudge_config &config);

/**
 * @brief 读取 JSON 配置文件
 * @throw std::invalid_argument 配置文件格式不正确时
 */
labjudge_config load_config(const std::filesystem::path &config_path);

}  // namespace labjudge
