#include "sandbox/runguard_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "runguard.hpp"

namespace labjudge {
using namespace std;
namespace fs = std::filesystem;

// runguard 在时间限制之外还需要创建 cgroup、挂载文件系统，额外给予的时间
static const double RUNGUARD_OVERHEAD = 5;

runguard_sandbox::runguard_sandbox(const runguard_config &config)
    : conf(config) {}

string runguard_sandbox::name() const {
    return "runguard";
}

const runguard_config &runguard_sandbox::config() const {
    return conf;
}

void runguard_sandbox::health_check() {
    if (conf.runguard.has_parent_path() && !fs::is_regular_file(conf.runguard))
        throw infrastructure_error(fmt::format("runguard executable {} does not exist", conf.runguard));

    fs::create_directories(conf.run_dir);

    fs::path box = conf.run_dir / ("health-" + generate_uuid());
    fs::create_directories(box);
    defer {
        error_code ec;
        fs::remove_all(box, ec);
    };

    sandbox_request request;
    request.command = {"true"};
    request.box_dir = box;
    request.limits.time_limit = 5;
    sandbox_result result = run(request);
    if (result.exitcode != 0)
        throw infrastructure_error(fmt::format("runguard health check failed with exitcode {}: {}", result.exitcode, result.stderr_data));
}

sandbox_result runguard_sandbox::run(const sandbox_request &request) {
    if (request.command.empty())
        throw internal_error("Cannot run an empty command");

    sandbox_result result;
    const sandbox_limits &limits = request.limits;
    double hard_limit = limits.time_limit + conf.grace;

    process_options opt;
    opt.timeout = hard_limit + RUNGUARD_OVERHEAD;
    bool limited_by_deadline = false;
    if (request.deadline) {
        double remaining = chrono::duration<double>(*request.deadline - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.cancelled = true;
            return result;
        }
        if (remaining < opt.timeout) {
            opt.timeout = remaining;
            limited_by_deadline = true;
        }
    }

    fs::path dir = conf.run_dir / ("run-" + generate_uuid());
    fs::create_directories(dir);
    defer {
        if (!conf.keep_files) {
            error_code ec;
            fs::remove_all(dir, ec);
            if (ec) LOG(WARNING) << "Unable to remove run directory " << dir << ": " << ec.message();
        }
    };

    fs::path stdin_file = dir / "stdin";
    fs::path stdout_file = dir / "stdout";
    fs::path stderr_file = dir / "stderr";
    fs::path meta_file = dir / "meta";
    fs::path log_file = dir / "runguard.log";
    write_file_content(stdin_file, request.stdin_data);

    string time_limit = fmt::format("{:.3f}:{:.3f}", limits.time_limit, hard_limit);

    vector<string> args = {
        "--wall-time", time_limit,
        "--cpu-time", time_limit,
        "--memory-limit", to_string((int64_t)limits.memory_limit * 1024),
        "--file-limit", to_string((int64_t)limits.scratch_size * 1024),
        "--nproc", to_string(limits.process_limit),
        "--cpu-quota", fmt::format("{:.3f}", limits.cpu_quota),
        "--scratch-size", to_string(limits.scratch_size),
        "--stream-size", to_string(limits.output_limit),
        "--no-core-dumps",
        "--read-only-root",
        "--box", request.box_dir.string(),
        "--standard-input-file", stdin_file.string(),
        "--standard-output-file", stdout_file.string(),
        "--standard-error-file", stderr_file.string(),
        "--out-meta", meta_file.string()};
    if (request.writable_box) args.push_back("--box-writable");
    if (conf.seccomp) args.push_back("--seccomp");
    if (!conf.run_user.empty()) args.insert(args.end(), {"--user", conf.run_user});
    if (!conf.run_group.empty()) args.insert(args.end(), {"--group", conf.run_group});
    if (!conf.chroot_dir.empty()) args.insert(args.end(), {"--root", conf.chroot_dir.string()});
    if (!conf.cpuset.empty()) args.insert(args.end(), {"--cpuset", conf.cpuset});
    args.push_back("--");

    opt.stdin_file = "/dev/null";
    opt.stdout_file = log_file;
    opt.stderr_file = log_file;

    process_result ret = call_process_opts(opt, conf.runguard, args, request.command);

    if (ret.timed_out) {
        if (limited_by_deadline) {
            // 部分输出没有意义，直接丢弃
            LOG(WARNING) << "Sandbox run of " << request.command[0] << " cancelled by deadline";
            result.cancelled = true;
            result.wall_time = opt.timeout;
            return result;
        }
        throw infrastructure_error(fmt::format("runguard did not exit within {:.3f} seconds: {}",
                                               opt.timeout, read_file_content(log_file, "")));
    }

    if (!fs::exists(meta_file))
        throw infrastructure_error(fmt::format("runguard exited with {} without writing metadata: {}",
                                               ret.exitcode, read_file_content(log_file, "")));

    runguard_result meta = read_runguard_result(meta_file);
    if (!meta.internal_error.empty())
        throw infrastructure_error("runguard: " + meta.internal_error);
    if (!meta.has_exitcode)
        throw infrastructure_error(fmt::format("runguard exited with {} without reporting exitcode: {}",
                                               ret.exitcode, read_file_content(log_file, "")));

    result.exitcode = meta.exitcode;
    result.signal = meta.signal;
    result.wall_time = max(meta.wall_time, 0.0);
    result.cpu_time = meta.cpu_time;
    result.memory_bytes = meta.memory;
    result.time_limit_hit = !meta.time_result.empty();
    result.oom_killed = meta.memory_result == "oom";

    size_t output_limit = (size_t)limits.output_limit * 1024;
    bool stdout_truncated = false, stderr_truncated = false;
    result.stdout_data = read_file_prefix(stdout_file, output_limit, stdout_truncated);
    result.stderr_data = read_file_prefix(stderr_file, output_limit, stderr_truncated);
    result.output_truncated = !meta.output_truncated.empty() || stdout_truncated || stderr_truncated;

    return result;
}

}  // namespace labjudge
