#include "sandbox/container_sandbox.hpp"
#include <signal.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace labjudge {
using namespace std;
namespace fs = std::filesystem;

// 容器启动所需的额外时间
static const double CONTAINER_STARTUP = 2;

/**
 * @brief 根据 inspect 给出的 StartedAt 和 FinishedAt 计算容器内进程的运行时间
 * 容器没有启动或没有结束时，运行时会给出 0001-01-01T00:00:00Z
 */
static optional<double> container_runtime(const string &started_at, const string &finished_at) {
    try {
        auto started = parse_time(started_at), finished = parse_time(finished_at);
        if (started.time_since_epoch().count() <= 0 || finished < started) return nullopt;
        return chrono::duration<double>(finished - started).count();
    } catch (invalid_argument &) {
        return nullopt;
    }
}

container_sandbox::container_sandbox(const container_config &config)
    : conf(config) {}

string container_sandbox::name() const {
    return "container";
}

int container_sandbox::runtime_command(const vector<string> &args, const fs::path &output, double timeout) {
    process_options opt;
    opt.stdin_file = "/dev/null";
    opt.stdout_file = output;
    opt.stderr_file = output;
    opt.timeout = timeout;
    process_result ret = call_process_opts(opt, conf.runtime, args);
    if (ret.timed_out)
        throw infrastructure_error(fmt::format("{} {} timed out", conf.runtime, args.empty() ? "" : args[0]));
    return ret.exitcode;
}

void container_sandbox::health_check() {
    fs::create_directories(conf.run_dir);
    fs::path output = conf.run_dir / ("health-" + generate_uuid() + ".log");
    defer {
        error_code ec;
        fs::remove(output, ec);
    };

    if (int ret = runtime_command({"version"}, output, conf.command_timeout); ret != 0)
        throw infrastructure_error(fmt::format("container runtime {} is unavailable: {}", conf.runtime, read_file_content(output, "")));
}

sandbox_result container_sandbox::run(const sandbox_request &request) {
    if (request.command.empty())
        throw internal_error("Cannot run an empty command");
    if (request.image.empty())
        throw internal_error("Container sandbox requires an image");

    sandbox_result result;
    const sandbox_limits &limits = request.limits;
    double hard_limit = limits.time_limit + conf.grace;

    double timeout = hard_limit + CONTAINER_STARTUP;
    bool limited_by_deadline = false;
    if (request.deadline) {
        double remaining = chrono::duration<double>(*request.deadline - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.cancelled = true;
            return result;
        }
        if (remaining < timeout) {
            timeout = remaining;
            limited_by_deadline = true;
        }
    }

    fs::path dir = conf.run_dir / ("run-" + generate_uuid());
    fs::create_directories(dir);
    string container = "labjudge-" + dir.filename().string().substr(4);
    fs::path stdin_file = dir / "stdin";
    fs::path stdout_file = dir / "stdout";
    fs::path stderr_file = dir / "stderr";
    fs::path log_file = dir / "runtime.log";
    write_file_content(stdin_file, request.stdin_data);

    defer {
        // 容器可能没有创建成功，忽略 rm 的返回值
        try {
            runtime_command({"rm", "-f", container}, dir / "rm.log", conf.command_timeout);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to remove container " << container << ": " << ex.what();
        }
        if (!conf.keep_files) {
            error_code ec;
            fs::remove_all(dir, ec);
        }
    };

    // 软限制到达时内核发送 SIGXCPU，程序捕获 SIGXCPU 后在硬限制处被 SIGKILL
    int cpu_soft = max(1, (int)ceil(limits.time_limit));
    vector<string> create_args = {
        "create",
        "--name", container,
        "--network", "none",
        "--read-only",
        "--tmpfs", fmt::format("/tmp:rw,nosuid,noexec,size={}m", limits.scratch_size),
        "--pids-limit", to_string(limits.process_limit),
        "--memory", fmt::format("{}m", limits.memory_limit),
        "--memory-swap", fmt::format("{}m", limits.memory_limit),
        "--cpus", fmt::format("{:.3f}", limits.cpu_quota),
        "--ulimit", fmt::format("cpu={}:{}", cpu_soft, cpu_soft + max(1, (int)ceil(conf.grace))),
        "--user", conf.user,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-v", fmt::format("{}:/box:{}", fs::absolute(request.box_dir).string(), request.writable_box ? "rw" : "ro"),
        "-w", "/box",
        "-i",
        request.image};
    create_args.insert(create_args.end(), request.command.begin(), request.command.end());

    if (int ret = runtime_command(create_args, log_file, conf.command_timeout); ret != 0)
        throw infrastructure_error(fmt::format("Unable to create container: {}", read_file_content(log_file, "")));

    process_options opt;
    opt.stdin_file = stdin_file;
    opt.stdout_file = stdout_file;
    opt.stderr_file = stderr_file;
    opt.timeout = timeout;

    elapsed_time timer;
    process_result ret = call_process_opts(opt, conf.runtime, "start", "-a", "-i", container);
    result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;

    if (ret.timed_out) {
        runtime_command({"kill", container}, log_file, conf.command_timeout);
        if (limited_by_deadline) {
            LOG(WARNING) << "Container " << container << " cancelled by deadline";
            result.cancelled = true;
            return result;
        }
        result.time_limit_hit = true;
    }

    fs::path inspect_file = dir / "inspect";
    if (int code = runtime_command({"inspect", "--format", "{{.State.ExitCode}} {{.State.OOMKilled}} {{.State.StartedAt}} {{.State.FinishedAt}}", container}, inspect_file, conf.command_timeout); code != 0)
        throw infrastructure_error(fmt::format("Unable to inspect container: {}", read_file_content(inspect_file, "")));

    vector<string> state;
    string inspect = boost::algorithm::trim_copy(read_file_content(inspect_file));
    boost::algorithm::split(state, inspect, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    if (state.size() != 4)
        throw infrastructure_error("Unexpected container state: " + inspect);
    try {
        result.exitcode = boost::lexical_cast<int>(state[0]);
    } catch (boost::bad_lexical_cast &) {
        throw infrastructure_error("Unexpected container exitcode: " + state[0]);
    }
    result.oom_killed = state[1] == "true";
    if (result.exitcode > 128) result.signal = result.exitcode - 128;

    // start -a 的耗时包含了容器的启动和挂载，以容器内进程的起止时间为准
    if (optional<double> runtime = container_runtime(state[2], state[3]))
        result.wall_time = *runtime;
    else
        LOG(WARNING) << "Container " << container << " reported no usable run time: " << inspect;

    if (!result.oom_killed) {
        if (result.signal == SIGXCPU)
            result.time_limit_hit = true;
        // SIGKILL 也可能是程序自己发出的，只有 CPU 时间可能已经用完时才认为是硬限制
        else if (result.signal == SIGKILL && result.wall_time * max(1.0, limits.cpu_quota) >= limits.time_limit)
            result.time_limit_hit = true;
    }
    if (result.wall_time > hard_limit)
        result.time_limit_hit = true;

    size_t output_limit = (size_t)limits.output_limit * 1024;
    bool stdout_truncated = false, stderr_truncated = false;
    result.stdout_data = read_file_prefix(stdout_file, output_limit, stdout_truncated);
    result.stderr_data = read_file_prefix(stderr_file, output_limit, stderr_truncated);
    result.output_truncated = stdout_truncated || stderr_truncated;

    return result;
}

}  // namespace labjudge
