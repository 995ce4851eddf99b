#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include "common/status.hpp"

namespace labjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如题目没有测试点、请求格式错误
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示提交的语言不受支持
 * 在创建任何沙箱之前抛出，提交将直接标记为 INTERNAL_ERROR
 */
struct unsupported_language : public judge_exception {
    explicit unsupported_language(const std::string &language);

    std::string language;
};

/**
 * @brief 表示沙箱基础设施故障
 * 比如 runguard 崩溃、容器运行时无法访问、cgroup 创建失败。
 * 沙箱管理器会有限次重试该错误，用户程序本身的错误不会导致该异常。
 */
struct infrastructure_error : public judge_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 表示评测请求不能被评测
 * 比如提交与题目不对应、提交已经评测过、提交编号不能作为文件名
 */
struct invalid_submission : public judge_exception {
    explicit invalid_submission(const std::string &message);
};

/**
 * @brief 表示提交状态机的非法状态转换，比如从终态转换为其他状态
 */
struct illegal_transition : public judge_exception {
    illegal_transition(status from, status to);

    status from, to;
};

}  // namespace labjudge
