#include "judge/verdict.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace labjudge {
using namespace std;

status overall_status(const vector<execution_result> &results) {
    if (results.empty()) return status::INTERNAL_ERROR;

    status worst = status::ACCEPTED;
    for (auto &result : results) {
        status stat = result.passed ? status::ACCEPTED : result.stat;
        // 没有通过但程序正常结束的测试点是答案错误
        if (!result.passed && stat == status::ACCEPTED) stat = status::WRONG_ANSWER;
        if (get_status_priority(stat) > get_status_priority(worst))
            worst = stat;
    }
    return worst;
}

string describe_verdict(status stat, size_t test_case_number) {
    switch (stat) {
        case status::ACCEPTED:
            return "";
        case status::WRONG_ANSWER:
            return fmt::format("Wrong answer on test case {}", test_case_number);
        case status::TIME_LIMIT_EXCEEDED:
            return fmt::format("Time limit exceeded on test case {}", test_case_number);
        case status::MEMORY_LIMIT_EXCEEDED:
            return fmt::format("Memory limit exceeded on test case {}", test_case_number);
        case status::RUNTIME_ERROR:
            return fmt::format("Runtime error on test case {}", test_case_number);
        case status::COMPILATION_ERROR:
            return "Compilation error";
        default:
            return fmt::format("Internal error on test case {}", test_case_number);
    }
}

void aggregate_results(submission &graded) {
    graded.score = 0;
    graded.test_cases_passed = 0;
    graded.test_cases_total = (int)graded.results.size();
    graded.execution_time_ms = 0;
    graded.memory_used_mb = 0;
    for (auto &result : graded.results) {
        graded.score += result.points_earned;
        if (result.passed) ++graded.test_cases_passed;
        graded.execution_time_ms = max(graded.execution_time_ms, result.execution_time_ms);
        graded.memory_used_mb = max(graded.memory_used_mb, result.memory_used_mb);
    }

    graded.stat = overall_status(graded.results);
    graded.error_message.clear();
    for (size_t i = 0; i < graded.results.size(); ++i) {
        auto &result = graded.results[i];
        status stat = result.stat == status::ACCEPTED && !result.passed ? status::WRONG_ANSWER : result.stat;
        if (stat == graded.stat && !result.passed) {
            graded.error_message = describe_verdict(stat, i + 1);
            break;
        }
    }
}

}  // namespace labjudge
