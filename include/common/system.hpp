#pragma once

/**
 * @brief 根据用户名查找用户编号
 * @return 用户编号，不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据用户组名查找用户组编号
 * @return 用户组编号，不存在时返回 -1
 */
int get_groupid(const char *name);
