// 系统调用包装头文件
#pragma once

#include <sys/types.h>
#include <poll.h>
#include <signal.h>
#include <cstdio>

// 带检查的包装函数：失败时通过PLOGE报告，原始结果原样返回给调用方
FILE *xfopen(const char *pathname, const char *mode);          // 打开文件
ssize_t xread(int fd, void *buf, size_t count);                // 读取，EINTR不报告
ssize_t xwrite(int fd, const void *buf, size_t count);         // 写满整个缓冲区
int xpoll(struct pollfd *fds, nfds_t nfds, int timeout);       // 等待描述符，EINTR不报告
// 安装信号处理函数
int xsigaction(int signum, const struct sigaction *act, struct sigaction *oldact);
