#pragma once

#include <filesystem>
#include <string>

namespace labjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 * 用户程序的输出可能非常大，读入内存前需要截断
 * @param truncated 若文件长度超过 limit，设置为 true
 */
std::string read_file_prefix(const std::filesystem::path &path, size_t limit, bool &truncated);

/**
 * @brief 将内容写入文件，文件已存在时覆盖
 * @throw std::system_error 写入失败时
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 先写入同目录下的临时文件再重命名，保证读者不会读到写了一半的文件
 */
void write_file_atomically(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是单层文件名，一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于评测系统
 * 运行时需要 root 权限，如果拿到的文件名包含 "../"，那么
 * 最后有可能导致系统重要文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace labjudge
