#include "config.hpp"
#include <fmt/core.h>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace labjudge {
using namespace std;
namespace fs = std::filesystem;

void from_json(const nlohmann::json &j, labjudge_config &config) {
    using nlohmann::get_value_def;
    config.run_dir = get_value_def<string>(j, config.run_dir.string(), "run_dir");
    config.runguard = get_value_def<string>(j, config.runguard.string(), "runguard");
    config.run_user = get_value_def<string>(j, config.run_user, "run_user");
    config.run_group = get_value_def<string>(j, config.run_group, "run_group");
    config.chroot_dir = get_value_def<string>(j, config.chroot_dir.string(), "chroot_dir");
    config.backend = get_value_def<string>(j, config.backend, "backend");
    config.container_runtime = get_value_def<string>(j, config.container_runtime.string(), "container_runtime");
    config.cpuset = get_value_def<string>(j, config.cpuset, "cpuset");
    config.workers = get_value_def<size_t>(j, config.workers, "workers");
    config.max_sandboxes = get_value_def<size_t>(j, config.max_sandboxes, "max_sandboxes");
    config.sandbox_retries = get_value_def<int>(j, config.sandbox_retries, "sandbox_retries");
    config.retry_backoff_ms = get_value_def<int>(j, config.retry_backoff_ms, "retry_backoff_ms");
    config.grace_seconds = get_value_def<double>(j, config.grace_seconds, "grace_seconds");
    config.process_limit = get_value_def<size_t>(j, config.process_limit, "process_limit");
    config.cpu_quota = get_value_def<double>(j, config.cpu_quota, "cpu_quota");
    config.scratch_size_mb = get_value_def<int>(j, config.scratch_size_mb, "scratch_size_mb");
    config.output_limit_kb = get_value_def<int>(j, config.output_limit_kb, "output_limit_kb");
    config.compile_time_limit = get_value_def<double>(j, config.compile_time_limit, "compile_time_limit");
    config.compile_memory_limit_mb = get_value_def<int>(j, config.compile_memory_limit_mb, "compile_memory_limit_mb");
    config.deadline_factor = get_value_def<double>(j, config.deadline_factor, "deadline_factor");
    config.watchdog_factor = get_value_def<double>(j, config.watchdog_factor, "watchdog_factor");
    config.deadline_slack_seconds = get_value_def<double>(j, config.deadline_slack_seconds, "deadline_slack_seconds");
    config.watchdog_slack_seconds = get_value_def<double>(j, config.watchdog_slack_seconds, "watchdog_slack_seconds");
    if (nlohmann::exists(j, "toolchains")) config.toolchains = nlohmann::access(j, "toolchains");
    config.debug = get_value_def<bool>(j, config.debug, "debug");
}

labjudge_config load_config(const fs::path &config_path) {
    labjudge_config config;
    try {
        nlohmann::json j = nlohmann::json::parse(read_file_content(config_path));
        j.get_to(config);
    } catch (nlohmann::json::exception &ex) {
        throw invalid_argument(fmt::format("Configuration file {} is malformed: {}", config_path, ex.what()));
    }
    // 相对路径相对于配置文件所在的目录
    if (config.toolchains.is_string()) {
        fs::path toolchains = config.toolchains.get<string>();
        if (toolchains.is_relative())
            config.toolchains = (config_path.parent_path() / toolchains).string();
    }
    return config;
}

void labjudge_config::validate() const {
    if (backend != "runguard" && backend != "container")
        throw invalid_argument(fmt::format("Unknown sandbox backend {}", backend));
    if (workers == 0) throw invalid_argument("workers must be positive");
    if (max_sandboxes == 0) throw invalid_argument("max_sandboxes must be positive");
    if (sandbox_retries < 0) throw invalid_argument("sandbox_retries must not be negative");
    if (retry_backoff_ms < 0) throw invalid_argument("retry_backoff_ms must not be negative");
    if (grace_seconds < 0) throw invalid_argument("grace_seconds must not be negative");
    if (process_limit == 0) throw invalid_argument("process_limit must be positive");
    if (cpu_quota <= 0) throw invalid_argument("cpu_quota must be positive");
    if (scratch_size_mb <= 0) throw invalid_argument("scratch_size_mb must be positive");
    if (output_limit_kb <= 0) throw invalid_argument("output_limit_kb must be positive");
    if (compile_time_limit <= 0) throw invalid_argument("compile_time_limit must be positive");
    if (compile_memory_limit_mb <= 0) throw invalid_argument("compile_memory_limit_mb must be positive");
    if (deadline_factor < 1) throw invalid_argument("deadline_factor must be at least 1");
    if (watchdog_factor < deadline_factor) throw invalid_argument("watchdog_factor must not be less than deadline_factor");
    if (deadline_slack_seconds < 0) throw invalid_argument("deadline_slack_seconds must not be negative");
    if (watchdog_slack_seconds <= deadline_slack_seconds)
        throw invalid_argument("watchdog_slack_seconds must be greater than deadline_slack_seconds");
    if (!toolchains.is_null() && !toolchains.is_string() && !toolchains.is_object())
        throw invalid_argument("toolchains must be a file path or an object");
}

runguard_config labjudge_config::make_runguard_config() const {
    runguard_config config;
    config.runguard = runguard;
    config.run_dir = run_dir;
    config.run_user = run_user;
    config.run_group = run_group;
    config.chroot_dir = chroot_dir;
    config.cpuset = cpuset;
    config.grace = grace_seconds;
    config.keep_files = debug;
    return config;
}

container_config labjudge_config::make_container_config() const {
    container_config config;
    config.runtime = container_runtime;
    config.run_dir = run_dir;
    config.grace = grace_seconds;
    config.keep_files = debug;
    return config;
}

sandbox_manager_config labjudge_config::make_sandbox_manager_config() const {
    sandbox_manager_config config;
    config.run_dir = run_dir;
    config.max_sandboxes = max_sandboxes;
    config.retries = sandbox_retries;
    config.retry_backoff_ms = retry_backoff_ms;
    config.grace = grace_seconds;
    config.defaults.process_limit = process_limit;
    config.defaults.cpu_quota = cpu_quota;
    config.defaults.scratch_size = scratch_size_mb;
    config.defaults.output_limit = output_limit_kb;
    config.compile_time_limit = compile_time_limit;
    config.compile_memory_limit = compile_memory_limit_mb;
    config.keep_files = debug;
    return config;
}

grading_config labjudge_config::make_grading_config() const {
    grading_config config;
    config.deadline_factor = deadline_factor;
    config.watchdog_factor = watchdog_factor;
    config.deadline_slack = deadline_slack_seconds;
    config.watchdog_slack = watchdog_slack_seconds;
    return config;
}

toolchain_registry labjudge_config::make_toolchains() const {
    toolchain_registry registry = toolchain_registry::builtin();
    if (toolchains.is_string())
        registry.load_file(toolchains.get<string>());
    else if (toolchains.is_object())
        registry.load(toolchains);
    return registry;
}

unique_ptr<sandbox> labjudge_config::make_sandbox() const {
    if (backend == "container")
        return make_unique<container_sandbox>(make_container_config());
    return make_unique<runguard_sandbox>(make_runguard_config());
}

}  // namespace labjudge
