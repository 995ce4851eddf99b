#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/status.hpp"

namespace labjudge {

using time_point = std::chrono::system_clock::time_point;

enum class visibility {
    PUBLIC,
    HIDDEN
};

/**
 * @brief 题目的一个测试点，对评测核心只读
 */
struct test_case {
    std::string id;

    std::string name;

    labjudge::visibility visibility = labjudge::visibility::HIDDEN;

    std::string input_data;

    std::string expected_output;

    /**
     * @brief 测试点的分数，不能为负数
     */
    int points = 10;

    /**
     * @brief 测试点的时间限制，单位为秒，不存在时使用题目的时间限制
     */
    std::optional<double> time_limit;

    /**
     * @brief 测试点的内存限制，单位为 MB，不存在时使用题目的内存限制
     */
    std::optional<int> memory_limit;

    /**
     * @brief 测试点的评测顺序，相同时按照声明顺序
     */
    int order_index = 0;

    /**
     * @brief 是否为样例，样例可以在提交前运行
     */
    bool is_sample = false;
};

/**
 * @brief 题目
 */
struct problem {
    std::string id;

    /**
     * @brief 默认时间限制，单位为秒
     */
    double time_limit = 5;

    /**
     * @brief 默认内存限制，单位为 MB
     */
    int memory_limit = 256;

    std::vector<test_case> test_cases;

    /**
     * @brief 所有测试点分数之和
     */
    int max_score() const;

    /**
     * @brief 按照评测顺序排列的测试点
     */
    std::vector<const test_case *> ordered_test_cases() const;
};

/**
 * @brief 一个测试点的评测结果，创建后不再修改
 */
struct execution_result {
    std::string test_case_id;

    bool passed = false;

    status stat = status::PENDING;

    std::string actual_output;

    /**
     * @brief 标准输出的副本
     */
    std::string expected_output;

    std::string error_message;

    double execution_time_ms = 0;

    double memory_used_mb = 0;

    /**
     * @brief 获得的分数，通过时为测试点的分数，否则为 0
     */
    int points_earned = 0;
};

/**
 * @brief 一次选手提交
 *
 * 提交的状态只能按照 PENDING -> (RUNNING) -> 终态 的顺序改变，
 * 设置 evaluated_at 之后评测结果不再改变。
 * 评测器和看门狗可能同时修改提交，所有修改都需要在 mut 的保护下进行。
 */
struct submission {
    submission();
    submission(const submission &other);
    submission &operator=(const submission &other);

    std::string id;

    std::string problem_id;

    std::string user_id;

    std::string code;

    std::string language;

    status stat = status::PENDING;

    int score = 0;

    int max_score = 0;

    /**
     * @brief 所有测试点中最长的运行时间
     */
    double execution_time_ms = 0;

    /**
     * @brief 所有测试点中最大的内存使用
     */
    double memory_used_mb = 0;

    int test_cases_passed = 0;

    int test_cases_total = 0;

    std::string error_message;

    std::string compile_output;

    /**
     * @brief 第一个运行时错误的测试点的标准错误
     */
    std::string runtime_output;

    int attempt_number = 1;

    bool is_final_submission = false;

    std::optional<time_point> submitted_at;

    std::optional<time_point> evaluated_at;

    std::vector<execution_result> results;

    /**
     * @brief 状态转换，非法转换时抛出 illegal_transition
     */
    void transition(status to);

    /**
     * @brief 标记为 RUNNING
     * @throw illegal_transition 如果提交不是 PENDING 状态
     */
    void begin();

    /**
     * @brief 将评测完成的结果写入提交，并设置 evaluated_at
     * @param graded 评测完成的提交副本，状态必须是终态
     * @return 若提交已经是终态（比如被看门狗终止），返回 false 且不修改提交
     */
    bool complete(const submission &graded);

    /**
     * @brief 强制将没有完成的提交标记为终态，看门狗使用
     * @return 若提交已经是终态，返回 false
     */
    bool abort_with(status stat, const std::string &message);

    /**
     * @brief 在锁的保护下复制提交
     */
    submission snapshot() const;

    bool is_terminal() const;

private:
    void copy_from(const submission &other);

    mutable std::mutex mut;
};

/**
 * @brief 检查评测请求能否被评测
 * 提交必须是 PENDING 状态、属于给定的题目，并且提交编号可以作为结果文件名
 * @throw invalid_submission 请求不能被评测时
 */
void check_request(const submission &submit, const problem &prob);

void from_json(const nlohmann::json &j, test_case &tc);
void to_json(nlohmann::json &j, const test_case &tc);

void from_json(const nlohmann::json &j, problem &prob);
void to_json(nlohmann::json &j, const problem &prob);

void from_json(const nlohmann::json &j, execution_result &result);
void to_json(nlohmann::json &j, const execution_result &result);

void from_json(const nlohmann::json &j, submission &submit);
void to_json(nlohmann::json &j, const submission &submit);

}  // namespace labjudge
