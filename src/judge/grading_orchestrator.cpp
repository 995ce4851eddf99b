#include "judge/grading_orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "judge/comparator.hpp"
#include "judge/verdict.hpp"

namespace labjudge {
using namespace std;

void to_json(nlohmann::json &j, const sample_result &result) {
    j = {{"test_case_id", result.test_case_id},
         {"name", result.name},
         {"status", get_status_name(result.stat)},
         {"passed", result.passed},
         {"output", result.output},
         {"error", result.error},
         {"execution_time_ms", result.execution_time_ms},
         {"memory_used_mb", result.memory_used_mb}};
}

void to_json(nlohmann::json &j, const execution_outcome &outcome) {
    j = {{"status", get_status_name(outcome.stat)},
         {"stdout", outcome.stdout_data},
         {"stderr", outcome.stderr_data},
         {"execution_time_ms", outcome.execution_time_ms},
         {"memory_used_mb", outcome.memory_used_mb},
         {"compile_output", outcome.compile_output},
         {"error_message", outcome.error_message}};
}

grading_orchestrator::grading_orchestrator(sandbox_manager &manager, submission_repository &repository, const grading_config &config)
    : manager(manager), repository(repository), conf(config) {}

sandbox_limits grading_orchestrator::limits_of(const problem &prob, const test_case &tc) const {
    double time_limit = tc.time_limit ? min(prob.time_limit, *tc.time_limit) : prob.time_limit;
    int memory_limit = tc.memory_limit ? min(prob.memory_limit, *tc.memory_limit) : prob.memory_limit;
    return manager.make_limits(time_limit, memory_limit);
}

double grading_orchestrator::nominal_seconds(const problem &prob, const string &language) const {
    double multiplier = 1;
    if (manager.toolchains().supports(language))
        multiplier = manager.toolchains().lookup(language).time_multiplier;

    double sum = 0;
    for (auto &tc : prob.test_cases)
        sum += limits_of(prob, tc).time_limit * multiplier + manager.config().grace;
    return sum;
}

chrono::duration<double> grading_orchestrator::grading_ceiling(const problem &prob, const string &language) const {
    return chrono::duration<double>(conf.deadline_factor * nominal_seconds(prob, language) + manager.config().compile_time_limit + conf.deadline_slack);
}

chrono::duration<double> grading_orchestrator::watchdog_ceiling(const problem &prob, const string &language) const {
    return chrono::duration<double>(conf.watchdog_factor * nominal_seconds(prob, language) + manager.config().compile_time_limit + conf.watchdog_slack);
}

void grading_orchestrator::persist(const submission &submit) {
    try {
        repository.save(submit.snapshot());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to persist submission " << submit.id << ": " << ex.what();
    }
}

void grading_orchestrator::grade_locally(submission &graded, const problem &prob) {
    graded.max_score = prob.max_score();

    if (prob.test_cases.empty()) {
        graded.stat = status::INTERNAL_ERROR;
        graded.error_message = fmt::format("Problem {} has no test cases", prob.id);
        return;
    }

    auto deadline = chrono::steady_clock::now() +
                    chrono::duration_cast<chrono::steady_clock::duration>(grading_ceiling(prob, graded.language));

    auto program = manager.prepare(graded.code, graded.language, deadline);
    graded.compile_output = program->compile_output;
    if (!program->compiled()) {
        graded.stat = status::COMPILATION_ERROR;
        graded.error_message = "Compilation error";
        return;
    }

    for (const test_case *tc : prob.ordered_test_cases()) {
        execution_outcome outcome = manager.execute(*program, tc->input_data, limits_of(prob, *tc), deadline);

        execution_result result;
        result.test_case_id = tc->id;
        result.expected_output = tc->expected_output;
        result.actual_output = outcome.stdout_data;
        result.execution_time_ms = outcome.execution_time_ms;
        result.memory_used_mb = outcome.memory_used_mb;
        if (outcome.stat == status::ACCEPTED) {
            result.passed = outputs_match(outcome.stdout_data, tc->expected_output);
            result.stat = result.passed ? status::ACCEPTED : status::WRONG_ANSWER;
            if (!result.passed) result.error_message = "Output does not match expected output";
        } else {
            result.stat = outcome.stat;
            result.error_message = outcome.error_message;
        }
        result.points_earned = result.passed ? tc->points : 0;

        if (result.stat == status::RUNTIME_ERROR && graded.runtime_output.empty())
            graded.runtime_output = outcome.stderr_data;

        graded.results.push_back(move(result));

        if (outcome.cancelled) {
            LOG(WARNING) << "Submission " << graded.id << " reached grading deadline on test case " << tc->id;
            break;
        }
    }

    aggregate_results(graded);
}

void grading_orchestrator::grade(submission &submit, const problem &prob) {
    try {
        submit.begin();
    } catch (illegal_transition &ex) {
        LOG(WARNING) << "Submission " << submit.id << " cannot be graded: " << ex.what();
        return;
    }
    persist(submit);

    LOG(INFO) << "Grading submission " << submit.id << " of problem " << prob.id << " in " << submit.language;

    submission graded = submit.snapshot();
    graded.score = 0;
    graded.test_cases_passed = 0;
    graded.test_cases_total = 0;
    graded.error_message.clear();
    graded.compile_output.clear();
    graded.runtime_output.clear();
    graded.results.clear();

    try {
        grade_locally(graded, prob);
    } catch (unsupported_language &ex) {
        graded.stat = status::INTERNAL_ERROR;
        graded.error_message = ex.what();
    } catch (judge_exception &ex) {
        LOG(ERROR) << "Grading submission " << submit.id << " failed: " << ex;
        graded.stat = status::INTERNAL_ERROR;
        graded.error_message = fmt::format("Internal error: {}", ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Grading submission " << submit.id << " failed: " << boost::diagnostic_information(ex);
        graded.stat = status::INTERNAL_ERROR;
        graded.error_message = fmt::format("Internal error: {}", ex.what());
    }

    if (graded.stat == status::INTERNAL_ERROR && !graded.results.empty()) {
        // 保留已经完成的测试点的分数
        string message = graded.error_message;
        aggregate_results(graded);
        graded.stat = status::INTERNAL_ERROR;
        graded.error_message = message;
    }
    graded.test_cases_total = (int)graded.results.size();
    graded.evaluated_at = chrono::system_clock::now();

    if (!submit.complete(graded)) {
        LOG(WARNING) << "Submission " << submit.id << " was already finished before grading completed";
        return;
    }

    LOG(INFO) << "Submission " << submit.id << " finished with " << get_display_message(graded.stat)
              << ", score " << graded.score << "/" << graded.max_score;
    persist(submit);
}

vector<sample_result> grading_orchestrator::run_samples(const string &code, const string &language, const problem &prob) {
    vector<const test_case *> samples;
    for (const test_case *tc : prob.ordered_test_cases())
        if (tc->is_sample || tc->visibility == visibility::PUBLIC)
            samples.push_back(tc);
    if (samples.empty())
        throw internal_error(fmt::format("Problem {} has no sample test cases", prob.id));

    problem sample_problem = prob;
    sample_problem.test_cases.clear();
    for (const test_case *tc : samples) sample_problem.test_cases.push_back(*tc);
    auto deadline = chrono::steady_clock::now() +
                    chrono::duration_cast<chrono::steady_clock::duration>(grading_ceiling(sample_problem, language));

    auto program = manager.prepare(code, language, deadline);

    vector<sample_result> results;
    bool cancelled = false;
    for (const test_case *tc : samples) {
        sample_result result;
        result.test_case_id = tc->id;
        result.name = tc->name;
        if (!program->compiled()) {
            result.stat = status::COMPILATION_ERROR;
            result.error = program->compile_output;
        } else if (cancelled) {
            result.stat = status::TIME_LIMIT_EXCEEDED;
            result.error = "Grading deadline reached";
        } else {
            execution_outcome outcome = manager.execute(*program, tc->input_data, limits_of(prob, *tc), deadline);
            result.output = outcome.stdout_data;
            result.execution_time_ms = outcome.execution_time_ms;
            result.memory_used_mb = outcome.memory_used_mb;
            if (outcome.stat == status::ACCEPTED) {
                result.passed = outputs_match(outcome.stdout_data, tc->expected_output);
                result.stat = result.passed ? status::ACCEPTED : status::WRONG_ANSWER;
            } else {
                result.stat = outcome.stat;
                result.error = outcome.stderr_data.empty() ? outcome.error_message : outcome.stderr_data;
            }
            cancelled = outcome.cancelled;
        }
        results.push_back(move(result));
    }
    return results;
}

execution_outcome grading_orchestrator::execute(const string &code, const string &language, const string &stdin_data, double time_limit, int memory_limit) {
    if (time_limit <= 0 || memory_limit <= 0)
        throw invalid_argument("Time limit and memory limit must be positive");

    problem adhoc;
    adhoc.time_limit = time_limit;
    adhoc.memory_limit = memory_limit;
    adhoc.test_cases.emplace_back();
    auto deadline = chrono::steady_clock::now() +
                    chrono::duration_cast<chrono::steady_clock::duration>(grading_ceiling(adhoc, language));

    return manager.run(code, language, stdin_data, manager.make_limits(time_limit, memory_limit), deadline);
}

}  // namespace labjudge
