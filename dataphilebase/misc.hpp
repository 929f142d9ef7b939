// 杂项工具函数头文件
#pragma once

#include <atomic>
#include <string>
#include <string_view>

// 检查字符串前缀
static inline bool str_starts(std::string_view s, std::string_view ss) {
    return s.size() >= ss.size() && s.compare(0, ss.size(), ss) == 0;
}

// 去掉首尾空白
std::string_view trim(std::string_view s);

// 环境变量为"true"或"1"时返回true
bool check_env(const char *name);

// 路径是已存在的普通文件时返回true
bool is_file(const char *path);

// 调用install_interrupt_handler()之后由SIGINT/SIGTERM置位。
// 阻塞调用返回EINTR而不是自动重启。
extern std::atomic_bool interrupted;
void install_interrupt_handler();
