// 系统调用包装实现文件

#include <signal.h>
#include <unistd.h>
#include <cstddef>

#include <base.hpp>

using namespace std;

FILE *xfopen(const char *pathname, const char *mode) {
    FILE *fp = fopen(pathname, mode);
    if (fp == nullptr) {
        PLOGE("fopen: %s", pathname);
    }
    return fp;
}

ssize_t xread(int fd, void *buf, size_t count) {
    ssize_t ret = read(fd, buf, count);
    if (ret < 0 && errno != EINTR) {
        PLOGE("read");
    }
    return ret;
}

ssize_t xwrite(int fd, const void *buf, size_t count) {
    size_t write_sz = 0;
    ssize_t ret;
    do {
        ret = write(fd, (byte *) buf + write_sz, count - write_sz);
        if (ret < 0) {
            if (errno == EINTR)
                continue;    // 被信号打断，重试
            PLOGE("write");
            return ret;
        }
        write_sz += ret;
    } while (write_sz != count && ret != 0);
    // 对端不再接收数据
    if (write_sz != count) {
        PLOGE("write (%zu != %zu)", count, write_sz);
    }
    return write_sz;
}

int xpoll(struct pollfd *fds, nfds_t nfds, int timeout) {
    int ret = poll(fds, nfds, timeout);
    if (ret < 0 && errno != EINTR) {
        PLOGE("poll");
    }
    return ret;
}

int xsigaction(int signum, const struct sigaction *act, struct sigaction *oldact) {
    int ret = sigaction(signum, act, oldact);
    if (ret < 0) {
        PLOGE("sigaction %d", signum);
    }
    return ret;
}
