#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace labjudge {

/**
 * @brief 一种语言的编译运行配置
 *
 * 命令模板是 argv 列表，不经过 shell 解释。每个参数中的占位符会被替换：
 * {source} 源文件名，{output} 编译产物名，{dir} 工作目录（沙箱内为当前目录）
 */
struct toolchain_profile {
    /**
     * @brief 语言名称，如 cpp、python
     */
    std::string language;

    /**
     * @brief 容器后端使用的镜像，如 gcc:latest
     */
    std::string image;

    /**
     * @brief 源文件扩展名，如 .cpp
     */
    std::string extension;

    /**
     * @brief 源文件名，如 main.cpp、Main.java
     */
    std::string source_name;

    /**
     * @brief 编译产物名，如 main
     */
    std::string output_name;

    /**
     * @brief 编译命令模板，解释型语言为空
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_command;

    /**
     * @brief 时间限制倍数，比如 Java 程序启动较慢，允许运行更长时间
     */
    double time_multiplier = 1;

    /**
     * @brief 内存限制倍数
     */
    double memory_multiplier = 1;

    bool needs_compilation() const;

    std::vector<std::string> compile_args() const;

    std::vector<std::string> run_args() const;
};

/**
 * @brief 替换命令模板中的占位符
 */
std::vector<std::string> expand_command(const std::vector<std::string> &tmpl, const toolchain_profile &profile);

/**
 * @brief 语言到编译运行配置的映射
 * 构造后只读，可以在多个线程中并发查询
 */
struct toolchain_registry {
    /**
     * @brief 创建空的注册表
     */
    toolchain_registry();

    /**
     * @brief 创建包含内置语言（python、java、c、cpp、javascript）的注册表
     */
    static toolchain_registry builtin();

    /**
     * @brief 注册（或覆盖）一种语言
     */
    void add(const toolchain_profile &profile);

    /**
     * @brief 为语言添加别名，如 py -> python
     */
    void add_alias(const std::string &alias, const std::string &language);

    /**
     * @brief 从 JSON 配置中加载语言，已有的语言会被覆盖
     * @code{.json}
     * {
     *     "languages": [{"language": "cpp", "image": "gcc:latest", ...}],
     *     "aliases": {"c++": "cpp"}
     * }
     * @endcode
     * @throw std::invalid_argument 配置不合法时
     */
    void load(const nlohmann::json &config);

    /**
     * @brief 从 JSON 文件中加载语言
     */
    void load_file(const std::filesystem::path &config_path);

    /**
     * @brief 查找语言的配置，大小写不敏感，支持别名
     * @throw unsupported_language 如果语言不存在
     */
    const toolchain_profile &lookup(const std::string &language) const;

    bool supports(const std::string &language) const;

    std::vector<std::string> languages() const;

private:
    const toolchain_profile *find(const std::string &language) const;

    std::map<std::string, toolchain_profile> profiles;
    std::map<std::string, std::string> aliases;
};

void from_json(const nlohmann::json &j, toolchain_profile &profile);

void to_json(nlohmann::json &j, const toolchain_profile &profile);

}  // namespace labjudge
