// 日志实现文件

#include <cstdio>
#include <cstdlib>

#include "logging.hpp"

int nop_log(const char *, va_list) {
    return 0;
}

void nop_ex(int) {}

// 默认静默，由前端决定输出到哪里
log_callback log_cb = { nop_log, nop_log, nop_log, nop_log, nop_ex };

// 输出到stderr
static int vprintfe(const char *fmt, va_list ap) {
    return vfprintf(stderr, fmt, ap);
}

// 带级别前缀输出到stderr
static int vprintfe_tagged(const char *tag, const char *fmt, va_list ap) {
    fputs(tag, stderr);
    return vfprintf(stderr, fmt, ap);
}

static int log_warn(const char *fmt, va_list ap) {
    return vprintfe_tagged("warning: ", fmt, ap);
}

static int log_err(const char *fmt, va_list ap) {
    return vprintfe_tagged("error: ", fmt, ap);
}

// 命令行日志设置
void cmdline_logging(bool verbose) {
    log_cb.d = verbose ? vprintfe : nop_log;
    log_cb.i = vprintfe;
    log_cb.w = log_warn;
    log_cb.e = log_err;
    log_cb.ex = exit;    // 致命错误直接退出
}

// 按级别分发到日志表
int vlog_with(const log_callback &cb, log_type t, const char *fmt, va_list ap) {
    switch (t) {
    case L_DEBUG:
        return cb.d(fmt, ap);
    case L_INFO:
        return cb.i(fmt, ap);
    case L_WARN:
        return cb.w(fmt, ap);
    case L_ERR:
        return cb.e(fmt, ap);
    default:
        return 0;
    }
}

int log_with(const log_callback &cb, log_type t, const char *fmt, ...) {
    va_list argv;
    va_start(argv, fmt);
    int ret = vlog_with(cb, t, fmt, argv);
    va_end(argv);
    return ret;
}
