#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "judge/repository.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox_manager.hpp"

namespace labjudge {

struct grading_config {
    /**
     * @brief 评测器截止时间的倍数
     * 截止时间 = deadline_factor × Σ(测试点时间限制 + 宽限时间) + 编译时间限制 + deadline_slack
     */
    double deadline_factor = 3;

    /**
     * @brief 看门狗的倍数，看门狗的时限总是比评测器的截止时间长
     * 看门狗时限 = watchdog_factor × Σ(测试点时间限制 + 宽限时间) + 编译时间限制 + watchdog_slack
     */
    double watchdog_factor = 6;

    /**
     * @brief 单位为秒
     */
    double deadline_slack = 10;

    double watchdog_slack = 30;
};

/**
 * @brief 样例的运行结果，不会持久化
 */
struct sample_result {
    std::string test_case_id;

    std::string name;

    status stat = status::PENDING;

    bool passed = false;

    std::string output;

    std::string error;

    double execution_time_ms = 0;

    double memory_used_mb = 0;
};

void to_json(nlohmann::json &j, const sample_result &result);

void to_json(nlohmann::json &j, const execution_outcome &outcome);

/**
 * @brief 评测器：编译一次提交，按顺序运行所有测试点，比较输出并汇总评测结果
 *
 * 一个提交的所有测试点顺序执行，不同提交可以在多个线程中并发评测。
 */
struct grading_orchestrator {
    grading_orchestrator(sandbox_manager &manager, submission_repository &repository, const grading_config &config = {});

    /**
     * @brief 评测一个提交，并将结果持久化
     * 开始评测时持久化 RUNNING 状态，结束时持久化终态和 evaluated_at。
     * 评测过程中的任何异常都会转换为 INTERNAL_ERROR，本函数不会抛出异常。
     */
    void grade(submission &submit, const problem &prob);

    /**
     * @brief 在样例（is_sample 或公开的测试点）上运行代码，不创建提交
     * @throw internal_error 题目没有样例时
     * @throw unsupported_language 语言不受支持时
     */
    std::vector<sample_result> run_samples(const std::string &code, const std::string &language, const problem &prob);

    /**
     * @brief 使用任意输入运行代码，不比较输出，不持久化
     * @param time_limit 时间限制，单位为秒
     * @param memory_limit 内存限制，单位为 MB
     */
    execution_outcome execute(const std::string &code, const std::string &language, const std::string &stdin_data, double time_limit, int memory_limit);

    /**
     * @brief 评测该提交的截止时间（相对于开始评测）
     */
    std::chrono::duration<double> grading_ceiling(const problem &prob, const std::string &language) const;

    /**
     * @brief 看门狗强制终止该提交的时限（相对于开始评测）
     */
    std::chrono::duration<double> watchdog_ceiling(const problem &prob, const std::string &language) const;

    /**
     * @brief 测试点的实际时间和内存限制，取题目限制和测试点限制中较严格的
     */
    sandbox_limits limits_of(const problem &prob, const test_case &tc) const;

private:
    /**
     * @brief Σ(测试点实际时间限制 + 宽限时间)，单位为秒
     */
    double nominal_seconds(const problem &prob, const std::string &language) const;

    void grade_locally(submission &graded, const problem &prob);

    void persist(const submission &submit);

    sandbox_manager &manager;
    submission_repository &repository;
    grading_config conf;
};

}  // namespace labjudge
