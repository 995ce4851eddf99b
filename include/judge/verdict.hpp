#pragma once

#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"

namespace labjudge {

/**
 * @brief 根据测试点结果推导提交的评测结果
 * 存在时间超限、内存超限、运行时错误的测试点时按照优先级取最高的，
 * 否则所有测试点都通过为 ACCEPTED，有未通过的为 WRONG_ANSWER。
 * 没有测试点结果时为 INTERNAL_ERROR。
 */
status overall_status(const std::vector<execution_result> &results);

/**
 * @brief 汇总测试点结果到提交中
 * 设置 score、test_cases_passed、test_cases_total、execution_time_ms、memory_used_mb、stat、error_message
 */
void aggregate_results(submission &graded);

/**
 * @brief 生成评测结果的说明，如 "Wrong answer on test case 2"
 * @param test_case_number 第一个出现该评测结果的测试点序号，从 1 开始
 */
std::string describe_verdict(status stat, size_t test_case_number);

}  // namespace labjudge
