#pragma once

#include <string>

namespace labjudge {

/**
 * @brief 规范化程序输出
 * 1. 将 \r\n 替换为 \n
 * 2. 删除每行行末的空白字符
 * 3. 删除文末的空行
 * 其余字符（包括行首空白和行内空白）保持不变
 */
std::string normalize_output(const std::string &output);

/**
 * @brief 比较规范化后的程序输出和标准输出是否完全一致
 */
bool outputs_match(const std::string &actual, const std::string &expected);

}  // namespace labjudge
