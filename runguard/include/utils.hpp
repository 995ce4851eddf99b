#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 根据用户名查找用户 id
 * @return 用户 id，用户不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据组名查找组 id
 * @return 组 id，组不存在时返回 -1
 */
int get_groupid(const char *name);
