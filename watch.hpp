// 监视器头文件：根据控制通道实时更新数据源集合的成员
#pragma once

#include <unistd.h>
#include <string>
#include <vector>

#include <base.hpp>

#include "source.hpp"

#define WATCH_TIMEOUT_MS 1000    // 等待控制通道的超时时间

// 监视器
class watcher {
public:
    // fd是控制通道，每行一个路径。这里永远不会关闭它。
    explicit watcher(int fd = STDIN_FILENO, int timeout_ms = WATCH_TIMEOUT_MS,
                     const log_callback *log = nullptr)
    : fd(fd), timeout_ms(timeout_ms), log(log ? *log : log_cb), eof(false) {}

    // 收集通道上已经到达的完整行。等待timeout_ms仍无新数据时返回，
    // 不完整的行留给下一次调用。
    std::vector<std::string> poll_new_paths();

    // 添加存在且未跟踪的路径，移除文件已消失的路径，忽略其他
    void apply(const std::vector<std::string> &paths, source_set &set);

    // 移除所有已不存在的文件，默认源除外
    void sweep_missing(source_set &set);

    // 先apply()轮询到的路径，再sweep_missing()
    void update(source_set &set);

    // 控制通道已到达文件末尾
    bool closed() const { return eof; }

private:
    int fd;                       // 控制通道描述符
    int timeout_ms;               // 轮询超时
    const log_callback &log;      // 注入的日志表
    std::string pending;          // 尚未读到换行的部分
    bool eof;                     // 通道已关闭
};
