#include "sandbox/sandbox_manager.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <cmath>
#include <cstring>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace labjudge {
using namespace std;
namespace fs = std::filesystem;

prepared_program::prepared_program(const toolchain_profile &profile, const fs::path &box_dir, bool keep_files)
    : profile(profile), box_dir(box_dir), keep_files(keep_files) {}

prepared_program::~prepared_program() {
    if (keep_files) return;
    error_code ec;
    fs::remove_all(box_dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove box directory " << box_dir << ": " << ec.message();
}

bool prepared_program::compiled() const {
    return compile_status == status::ACCEPTED;
}

status classify(const sandbox_result &result, const sandbox_limits &limits) {
    if (result.cancelled || result.time_limit_hit)
        return status::TIME_LIMIT_EXCEEDED;
    if (result.cpu_time >= 0 && result.cpu_time > limits.time_limit)
        return status::TIME_LIMIT_EXCEEDED;
    if (result.oom_killed)
        return status::MEMORY_LIMIT_EXCEEDED;
    if (result.memory_bytes >= 0 && result.memory_bytes > (int64_t)limits.memory_limit * 1024 * 1024)
        return status::MEMORY_LIMIT_EXCEEDED;
    if (result.exitcode != 0 || result.signal > 0)
        return status::RUNTIME_ERROR;
    return status::ACCEPTED;
}

sandbox_limits effective_limits(const toolchain_profile &profile, const sandbox_limits &requested) {
    sandbox_limits limits = requested;
    limits.time_limit = requested.time_limit * profile.time_multiplier;
    limits.memory_limit = (int)ceil(requested.memory_limit * profile.memory_multiplier);
    return limits;
}

sandbox_manager::sandbox_manager(sandbox &backend, const toolchain_registry &registry, const sandbox_manager_config &config)
    : box(backend), registry(registry), conf(config) {
    if (conf.max_sandboxes == 0)
        throw invalid_argument("max_sandboxes must be positive");
}

const sandbox_manager_config &sandbox_manager::config() const {
    return conf;
}

const toolchain_registry &sandbox_manager::toolchains() const {
    return registry;
}

sandbox &sandbox_manager::backend() const {
    return box;
}

sandbox_limits sandbox_manager::make_limits(double time_limit, int memory_limit) const {
    sandbox_limits limits = conf.defaults;
    limits.time_limit = time_limit;
    limits.memory_limit = memory_limit;
    return limits;
}

void sandbox_manager::acquire_slot() {
    unique_lock<mutex> lock(slot_mutex);
    slot_cv.wait(lock, [this] { return running < conf.max_sandboxes; });
    ++running;
}

void sandbox_manager::release_slot() {
    {
        scoped_lock lock(slot_mutex);
        --running;
    }
    slot_cv.notify_one();
}

sandbox_result sandbox_manager::invoke(const sandbox_request &request) {
    acquire_slot();
    defer { release_slot(); };

    for (int attempt = 0;; ++attempt) {
        try {
            return box.run(request);
        } catch (infrastructure_error &ex) {
            if (attempt >= conf.retries) {
                LOG(ERROR) << "Sandbox " << box.name() << " failed after " << attempt + 1 << " attempts: " << ex.what();
                throw;
            }
            LOG(WARNING) << "Sandbox " << box.name() << " failed, retrying (" << attempt + 1 << "/" << conf.retries << "): " << ex.what();
        }
        this_thread::sleep_for(chrono::milliseconds(conf.retry_backoff_ms));
    }
}

unique_ptr<prepared_program> sandbox_manager::prepare(const string &code, const string &language, deadline_t deadline) {
    const toolchain_profile &profile = registry.lookup(language);

    fs::path box_dir = conf.run_dir / ("box-" + generate_uuid());
    fs::create_directories(box_dir);
    auto program = make_unique<prepared_program>(profile, box_dir, conf.keep_files);

    // 受控程序以非特权用户运行，编译时需要写入 box 目录
    fs::permissions(box_dir, fs::perms::all);
    fs::path source = box_dir / assert_safe_path(profile.source_name);
    write_file_content(source, code);
    fs::permissions(source, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read);

    if (!profile.needs_compilation()) return program;

    sandbox_request request;
    request.command = profile.compile_args();
    request.box_dir = box_dir;
    request.writable_box = true;
    request.image = profile.image;
    request.limits = make_limits(conf.compile_time_limit, conf.compile_memory_limit);
    request.deadline = deadline;

    sandbox_result result = invoke(request);
    program->compile_time_ms = result.wall_time * 1000;
    program->compile_output = result.stdout_data + result.stderr_data;

    status stat = classify(result, request.limits);
    if (stat != status::ACCEPTED) {
        program->compile_status = status::COMPILATION_ERROR;
        if (result.cancelled)
            program->compile_output += "\nCompilation cancelled: grading deadline reached";
        else if (stat == status::TIME_LIMIT_EXCEEDED)
            program->compile_output += fmt::format("\nCompilation time limit exceeded ({} seconds)", conf.compile_time_limit);
        else if (stat == status::MEMORY_LIMIT_EXCEEDED)
            program->compile_output += fmt::format("\nCompilation memory limit exceeded ({} MB)", conf.compile_memory_limit);
        LOG(INFO) << "Compilation of " << profile.language << " program failed with exitcode " << result.exitcode;
    } else if (!profile.output_name.empty() && !fs::exists(box_dir / profile.output_name) &&
               !fs::exists(box_dir / (profile.output_name + ".class"))) {
        program->compile_status = status::COMPILATION_ERROR;
        program->compile_output += "\nCompiler did not produce " + profile.output_name;
    }
    return program;
}

execution_outcome sandbox_manager::execute(const prepared_program &program, const string &stdin_data, const sandbox_limits &requested, deadline_t deadline) {
    execution_outcome outcome;
    outcome.compile_output = program.compile_output;
    if (!program.compiled()) {
        outcome.stat = status::COMPILATION_ERROR;
        outcome.error_message = "Compilation failed";
        return outcome;
    }

    sandbox_request request;
    request.command = program.profile.run_args();
    request.box_dir = program.box_dir;
    request.writable_box = false;
    request.image = program.profile.image;
    request.stdin_data = stdin_data;
    request.limits = effective_limits(program.profile, requested);
    request.deadline = deadline;

    sandbox_result result = invoke(request);

    outcome.stat = classify(result, request.limits);
    outcome.cancelled = result.cancelled;
    outcome.output_truncated = result.output_truncated;
    outcome.execution_time_ms = result.wall_time * 1000;
    outcome.memory_used_mb = result.memory_bytes < 0 ? 0 : result.memory_bytes / 1024.0 / 1024.0;
    if (!result.cancelled) {
        outcome.stdout_data = move(result.stdout_data);
        outcome.stderr_data = move(result.stderr_data);
    }

    switch (outcome.stat) {
        case status::TIME_LIMIT_EXCEEDED:
            outcome.error_message = result.cancelled
                                        ? "Grading deadline reached"
                                        : fmt::format("Time limit exceeded ({} seconds)", request.limits.time_limit);
            break;
        case status::MEMORY_LIMIT_EXCEEDED:
            outcome.error_message = fmt::format("Memory limit exceeded ({} MB)", request.limits.memory_limit);
            break;
        case status::RUNTIME_ERROR:
            if (result.signal > 0)
                outcome.error_message = fmt::format("Program killed by signal {} ({})", result.signal, strsignal(result.signal));
            else
                outcome.error_message = fmt::format("Program exited with code {}", result.exitcode);
            break;
        default:
            break;
    }
    return outcome;
}

execution_outcome sandbox_manager::run(const string &code, const string &language, const string &stdin_data, const sandbox_limits &requested, deadline_t deadline) {
    auto program = prepare(code, language, deadline);
    return execute(*program, stdin_data, requested, deadline);
}

}  // namespace labjudge
