#include "judge/submission.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace labjudge {
using namespace std;

int problem::max_score() const {
    int sum = 0;
    for (auto &tc : test_cases) sum += tc.points;
    return sum;
}

vector<const test_case *> problem::ordered_test_cases() const {
    vector<const test_case *> ordered;
    for (auto &tc : test_cases) ordered.push_back(&tc);
    stable_sort(ordered.begin(), ordered.end(), [](const test_case *a, const test_case *b) {
        return a->order_index < b->order_index;
    });
    return ordered;
}

submission::submission() {}

submission::submission(const submission &other) {
    copy_from(other);
}

submission &submission::operator=(const submission &other) {
    if (this != &other) {
        scoped_lock lock(mut);
        copy_from(other);
    }
    return *this;
}

void submission::copy_from(const submission &other) {
    scoped_lock lock(other.mut);
    id = other.id;
    problem_id = other.problem_id;
    user_id = other.user_id;
    code = other.code;
    language = other.language;
    stat = other.stat;
    score = other.score;
    max_score = other.max_score;
    execution_time_ms = other.execution_time_ms;
    memory_used_mb = other.memory_used_mb;
    test_cases_passed = other.test_cases_passed;
    test_cases_total = other.test_cases_total;
    error_message = other.error_message;
    compile_output = other.compile_output;
    runtime_output = other.runtime_output;
    attempt_number = other.attempt_number;
    is_final_submission = other.is_final_submission;
    submitted_at = other.submitted_at;
    evaluated_at = other.evaluated_at;
    results = other.results;
}

void submission::transition(status to) {
    scoped_lock lock(mut);
    if (!can_transition(stat, to))
        throw illegal_transition(stat, to);
    stat = to;
}

void submission::begin() {
    transition(status::RUNNING);
}

bool submission::complete(const submission &graded) {
    if (!labjudge::is_terminal(graded.stat))
        throw internal_error(fmt::format("Cannot complete submission {} with status {}", id, get_status_name(graded.stat)));

    scoped_lock lock(mut);
    if (labjudge::is_terminal(stat)) return false;

    stat = graded.stat;
    score = graded.score;
    max_score = graded.max_score;
    execution_time_ms = graded.execution_time_ms;
    memory_used_mb = graded.memory_used_mb;
    test_cases_passed = graded.test_cases_passed;
    test_cases_total = graded.test_cases_total;
    error_message = graded.error_message;
    compile_output = graded.compile_output;
    runtime_output = graded.runtime_output;
    results = graded.results;
    evaluated_at = graded.evaluated_at ? graded.evaluated_at : chrono::system_clock::now();
    return true;
}

bool submission::abort_with(status to, const string &message) {
    scoped_lock lock(mut);
    if (labjudge::is_terminal(stat)) return false;
    if (!can_transition(stat, to))
        throw illegal_transition(stat, to);
    stat = to;
    error_message = message;
    evaluated_at = chrono::system_clock::now();
    return true;
}

submission submission::snapshot() const {
    return submission(*this);
}

bool submission::is_terminal() const {
    scoped_lock lock(mut);
    return labjudge::is_terminal(stat);
}

static nlohmann::json time_to_json(const optional<time_point> &time) {
    if (!time) return nullptr;
    return format_time(*time);
}

static optional<time_point> time_from_json(const nlohmann::json &j, const char *key) {
    auto text = nlohmann::get_optional<string>(j, key);
    if (!text) return nullopt;
    return parse_time(*text);
}

static const char *visibility_name(visibility v) {
    return v == visibility::PUBLIC ? "public" : "hidden";
}

void check_request(const submission &submit, const problem &prob) {
    if (submit.problem_id != prob.id)
        throw invalid_submission(fmt::format("Submission is for problem {} but problem {} is given", submit.problem_id, prob.id));
    if (submit.stat != status::PENDING)
        throw invalid_submission(fmt::format("Submission {} is {}, only pending submissions can be graded", submit.id, get_status_name(submit.stat)));
    // 评测结果以 <submission id>.json 持久化
    try {
        assert_safe_path(submit.id);
    } catch (runtime_error &) {
        throw invalid_submission(fmt::format("Submission id '{}' cannot be used as a result file name", submit.id));
    }
}

void from_json(const nlohmann::json &j, test_case &tc) {
    tc.id = nlohmann::get_value<string>(j, "id");
    tc.name = nlohmann::get_value_def<string>(j, tc.id, "name");
    string vis = nlohmann::get_value_def<string>(j, "hidden", "visibility");
    if (vis == "public")
        tc.visibility = visibility::PUBLIC;
    else if (vis == "hidden")
        tc.visibility = visibility::HIDDEN;
    else
        throw invalid_argument(fmt::format("Test case {} has unknown visibility {}", tc.id, vis));
    tc.input_data = nlohmann::get_value_def<string>(j, "", "input_data");
    tc.expected_output = nlohmann::get_value_def<string>(j, "", "expected_output");
    tc.points = nlohmann::get_value_def<int>(j, 10, "points");
    if (tc.points < 0)
        throw invalid_argument(fmt::format("Test case {} has negative points {}", tc.id, tc.points));
    tc.time_limit = nlohmann::get_optional<double>(j, "time_limit_seconds");
    tc.memory_limit = nlohmann::get_optional<int>(j, "memory_limit_mb");
    if (tc.time_limit && *tc.time_limit <= 0)
        throw invalid_argument(fmt::format("Test case {} has non-positive time limit", tc.id));
    if (tc.memory_limit && *tc.memory_limit <= 0)
        throw invalid_argument(fmt::format("Test case {} has non-positive memory limit", tc.id));
    tc.order_index = nlohmann::get_value_def<int>(j, 0, "order_index");
    tc.is_sample = nlohmann::get_value_def<bool>(j, false, "is_sample");
}

void to_json(nlohmann::json &j, const test_case &tc) {
    j = {{"id", tc.id},
         {"name", tc.name},
         {"visibility", visibility_name(tc.visibility)},
         {"input_data", tc.input_data},
         {"expected_output", tc.expected_output},
         {"points", tc.points},
         {"time_limit_seconds", tc.time_limit ? nlohmann::json(*tc.time_limit) : nlohmann::json()},
         {"memory_limit_mb", tc.memory_limit ? nlohmann::json(*tc.memory_limit) : nlohmann::json()},
         {"order_index", tc.order_index},
         {"is_sample", tc.is_sample}};
}

void from_json(const nlohmann::json &j, problem &prob) {
    prob.id = nlohmann::get_value<string>(j, "id");
    prob.time_limit = nlohmann::get_value_def<double>(j, 5, "time_limit_seconds");
    prob.memory_limit = nlohmann::get_value_def<int>(j, 256, "memory_limit_mb");
    if (prob.time_limit <= 0 || prob.memory_limit <= 0)
        throw invalid_argument(fmt::format("Problem {} has non-positive limits", prob.id));
    prob.test_cases = nlohmann::get_value_def<vector<test_case>>(j, {}, "test_cases");
}

void to_json(nlohmann::json &j, const problem &prob) {
    j = {{"id", prob.id},
         {"time_limit_seconds", prob.time_limit},
         {"memory_limit_mb", prob.memory_limit},
         {"test_cases", prob.test_cases}};
}

void from_json(const nlohmann::json &j, execution_result &result) {
    result.test_case_id = nlohmann::get_value<string>(j, "test_case_id");
    result.passed = nlohmann::get_value_def<bool>(j, false, "passed");
    result.stat = parse_status(nlohmann::get_value<string>(j, "status"));
    result.actual_output = nlohmann::get_value_def<string>(j, "", "actual_output");
    result.expected_output = nlohmann::get_value_def<string>(j, "", "expected_output");
    result.error_message = nlohmann::get_value_def<string>(j, "", "error_message");
    result.execution_time_ms = nlohmann::get_value_def<double>(j, 0, "execution_time_ms");
    result.memory_used_mb = nlohmann::get_value_def<double>(j, 0, "memory_used_mb");
    result.points_earned = nlohmann::get_value_def<int>(j, 0, "points_earned");
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"test_case_id", result.test_case_id},
         {"passed", result.passed},
         {"status", get_status_name(result.stat)},
         {"actual_output", result.actual_output},
         {"expected_output", result.expected_output},
         {"error_message", result.error_message},
         {"execution_time_ms", result.execution_time_ms},
         {"memory_used_mb", result.memory_used_mb},
         {"points_earned", result.points_earned}};
}

void from_json(const nlohmann::json &j, submission &submit) {
    submit.id = nlohmann::get_value_def<string>(j, "", "id");
    if (submit.id.empty()) submit.id = generate_uuid();
    submit.problem_id = nlohmann::get_value<string>(j, "problem_id");
    submit.user_id = nlohmann::get_value_def<string>(j, "", "user_id");
    submit.code = nlohmann::get_value<string>(j, "code");
    submit.language = nlohmann::get_value<string>(j, "language");
    submit.stat = parse_status(nlohmann::get_value_def<string>(j, "pending", "status"));
    submit.score = nlohmann::get_value_def<int>(j, 0, "score");
    submit.max_score = nlohmann::get_value_def<int>(j, 0, "max_score");
    submit.execution_time_ms = nlohmann::get_value_def<double>(j, 0, "execution_time_ms");
    submit.memory_used_mb = nlohmann::get_value_def<double>(j, 0, "memory_used_mb");
    submit.test_cases_passed = nlohmann::get_value_def<int>(j, 0, "test_cases_passed");
    submit.test_cases_total = nlohmann::get_value_def<int>(j, 0, "test_cases_total");
    submit.error_message = nlohmann::get_value_def<string>(j, "", "error_message");
    submit.compile_output = nlohmann::get_value_def<string>(j, "", "compile_output");
    submit.runtime_output = nlohmann::get_value_def<string>(j, "", "runtime_output");
    submit.attempt_number = nlohmann::get_value_def<int>(j, 1, "attempt_number");
    // 提交请求中使用 is_final，持久化的提交中使用 is_final_submission
    submit.is_final_submission = nlohmann::get_value_def<bool>(j, nlohmann::get_value_def<bool>(j, false, "is_final"), "is_final_submission");
    submit.submitted_at = time_from_json(j, "submitted_at");
    if (!submit.submitted_at) submit.submitted_at = chrono::system_clock::now();
    submit.evaluated_at = time_from_json(j, "evaluated_at");
    submit.results = nlohmann::get_value_def<vector<execution_result>>(j, {}, "results");
}

void to_json(nlohmann::json &j, const submission &submit) {
    j = {{"id", submit.id},
         {"problem_id", submit.problem_id},
         {"user_id", submit.user_id},
         {"code", submit.code},
         {"language", submit.language},
         {"status", get_status_name(submit.stat)},
         {"score", submit.score},
         {"max_score", submit.max_score},
         {"execution_time_ms", submit.execution_time_ms},
         {"memory_used_mb", submit.memory_used_mb},
         {"test_cases_passed", submit.test_cases_passed},
         {"test_cases_total", submit.test_cases_total},
         {"error_message", submit.error_message},
         {"compile_output", submit.compile_output},
         {"runtime_output", submit.runtime_output},
         {"attempt_number", submit.attempt_number},
         {"is_final_submission", submit.is_final_submission},
         {"submitted_at", time_to_json(submit.submitted_at)},
         {"evaluated_at", time_to_json(submit.evaluated_at)},
         {"results", submit.results}};
}

}  // namespace labjudge
