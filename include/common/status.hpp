#pragma once

#include <string>

namespace labjudge {

/**
 * @brief 表示数据点或整个提交的评测结果
 *
 * 提交的生命周期为 PENDING -> (RUNNING) -> 终态，终态之间不允许互相转换。
 */
enum class status {
    /**
     * @brief 提交正在等待队列中，还未开始评测
     */
    PENDING = 0,

    /**
     * @brief 提交正在评测
     * 编译完成且所有测试数据点还没有完成评测
     */
    RUNNING = 1,

    /**
     * @brief 所有测试点都通过。
     * 对于单个测试点，表示程序正常退出且输出与标准输出匹配
     */
    ACCEPTED = 2,

    /**
     * @brief 答案错误
     * 程序正常退出，但规范化后的输出与标准输出不一致
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 用户程序运行时间超出限制
     * 超过时钟时间限制（加上宽限时间）或者 CPU 时间限制，程序被强制终止
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序运行内存超限
     * cgroup 观察到 OOM kill，或者运行结束后峰值内存超过限制
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零或者被信号终止
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 用户程序编译错误
     * 编译器返回值非零、编译超时或编译内存超限
     */
    COMPILATION_ERROR = 7,

    /**
     * @brief 内部错误，评测系统出错
     * 比如沙箱无法启动、语言不支持、题目没有测试点、评测超时被看门狗终止
     */
    INTERNAL_ERROR = 8
};

/**
 * @brief 获得评测结果的展示名称，如 "Wrong Answer"
 */
const char *get_display_message(status);

/**
 * @brief 获得评测结果在 JSON 中的名称，如 "wrong_answer"
 */
const char *get_status_name(status);

/**
 * @brief 根据 JSON 中的名称解析评测结果
 * @throw std::invalid_argument 如果名称不合法
 */
status parse_status(const std::string &name);

/**
 * @brief 判断评测结果是否是终态
 * PENDING 和 RUNNING 以外的评测结果都是终态
 */
bool is_terminal(status stat);

/**
 * @brief 判断提交状态能否从 from 转换为 to
 * 允许 PENDING -> RUNNING，PENDING -> 终态，RUNNING -> 终态
 */
bool can_transition(status from, status to);

/**
 * @brief 评测结果的优先级，用于从测试点结果推导整个提交的结果
 * INTERNAL_ERROR > COMPILATION_ERROR > TIME_LIMIT_EXCEEDED > MEMORY_LIMIT_EXCEEDED
 * > RUNTIME_ERROR > WRONG_ANSWER > ACCEPTED
 */
int get_status_priority(status stat);

}  // namespace labjudge
