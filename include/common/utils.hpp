#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace labjudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部命令的执行选项
 */
struct process_options {
    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 重定向标准输入、标准输出、标准错误的文件，为空则继承当前进程
     */
    std::filesystem::path stdin_file, stdout_file, stderr_file;

    /**
     * @brief 外部命令的时钟时间限制，单位为秒，小于 0 表示不限制
     * 超时后先向进程组发送 SIGTERM，再过 kill_delay 秒发送 SIGKILL
     */
    double timeout = -1;

    double kill_delay = 1;
};

struct process_result {
    /**
     * @brief 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 终止外部命令的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 外部命令是否因为超时被终止
     */
    bool timed_out = false;
};

/**
 * @brief 执行外部命令
 * 外部命令运行在独立的进程组中，超时时整个进程组都会被终止
 * @param opt 执行选项
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @throw std::system_error 如果 fork 失败
 */
process_result exec_program(const process_options &opt, const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::filesystem::path docker("docker");
 *     process_options opt;
 *     opt.timeout = 10;
 *     auto result = call_process_opts(opt, docker, "version");
 * @endcode
 */
template <typename... Args>
process_result call_process_opts(const process_options &opt, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv(list.size() + 1);
    for (size_t i = 0; i < list.size(); ++i)
        argv[i] = list[i].data();
    argv[list.size()] = nullptr;

#ifndef NDEBUG
    std::stringstream ss;
    for (size_t i = 0; i < list.size(); ++i)
        ss << argv[i] << ' ';
    LOG(INFO) << ss.str();
#endif

    return exec_program(opt, argv.data());
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 生成随机的 uuid 字符串，用于沙箱目录名、容器名等
 */
std::string generate_uuid();

/**
 * @brief 将时间点格式化为 ISO-8601 UTC 字符串，如 2026-10-17T08:00:00Z
 */
std::string format_time(std::chrono::system_clock::time_point time);

/**
 * @brief 解析 format_time 生成的时间字符串，允许带有小数秒
 * @throw std::invalid_argument 如果格式不正确
 */
std::chrono::system_clock::time_point parse_time(const std::string &text);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace labjudge
