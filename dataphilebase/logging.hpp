// 日志接口头文件，所有dataphile组件共用
#pragma once

#include <cerrno>
#include <cstdarg>
#include <cstring>

// 日志级别
enum log_type {
    L_DEBUG,         // 调试
    L_INFO,          // 信息
    L_WARN,          // 警告
    L_ERR,           // 错误
    LOG_TYPE_NUM     // 级别数量
};

// 每个级别的输出函数。LOGE输出L_ERR消息之后调用ex。
struct log_callback {
    int (*d)(const char *fmt, va_list ap);    // 调试输出
    int (*i)(const char *fmt, va_list ap);    // 信息输出
    int (*w)(const char *fmt, va_list ap);    // 警告输出
    int (*e)(const char *fmt, va_list ap);    // 错误输出
    void (*ex)(int code);                     // 致命错误后的退出函数
};

// LOG*宏使用的进程级日志表
extern log_callback log_cb;

int log_with(const log_callback &cb, log_type t, const char *fmt, ...)
    __attribute__((format(printf, 3, 4)));
int vlog_with(const log_callback &cb, log_type t, const char *fmt, va_list ap);

#define LOGD(...) log_with(log_cb, L_DEBUG, __VA_ARGS__)
#define LOGI(...) log_with(log_cb, L_INFO, __VA_ARGS__)
#define LOGW(...) log_with(log_cb, L_WARN, __VA_ARGS__)
#define LOGE(...) do { log_with(log_cb, L_ERR, __VA_ARGS__); log_cb.ex(1); } while (0)
#define PLOGE(fmt, args...) \
    log_with(log_cb, L_ERR, fmt " failed with %d: %s\n", ##args, errno, std::strerror(errno))

// 什么都不做的输出函数，日志表的默认值
int nop_log(const char *fmt, va_list ap);
void nop_ex(int code);

// 全部输出到stderr；只有verbose时才输出调试消息
void cmdline_logging(bool verbose = false);
