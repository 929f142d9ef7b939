// 监视器实现文件

#include "watch.hpp"

using namespace std;

// 从控制通道读取新路径
vector<string> watcher::poll_new_paths() {
    vector<string> paths;
    char buf[4096];
    while (!eof) {
        pollfd pfd = { fd, POLLIN, 0 };
        int ret = xpoll(&pfd, 1, timeout_ms);
        if (ret <= 0)
            break;
        // 可读，或者对端已挂断但可能还有数据
        ssize_t len = xread(fd, buf, sizeof(buf));
        if (len < 0)
            break;
        if (len == 0) {
            log_with(log, L_DEBUG, "Control channel closed\n");
            eof = true;                   // 之后不再轮询
        }
        pending.append(buf, len);
        size_t pos;
        while ((pos = pending.find('\n')) != string::npos) {
            auto path = trim(string_view(pending).substr(0, pos));
            if (!path.empty())
                paths.emplace_back(path);
            pending.erase(0, pos + 1);    // 丢弃已处理的行
        }
    }
    if (eof && !pending.empty()) {
        // 最后一行没有换行符
        auto path = trim(pending);
        if (!path.empty())
            paths.emplace_back(path);
        pending.clear();
    }
    return paths;
}

// 根据路径列表更新集合
void watcher::apply(const vector<string> &paths, source_set &set) {
    for (auto &path : paths) {
        bool tracked = set.contains(path);
        if (!is_file(path.data())) {
            if (tracked) {
                log_with(log, L_WARN, "Removing [%s], the file no longer exists\n", path.data());
                set.remove(path);         // 文件已被删除
            } else {
                log_with(log, L_WARN, "Ignoring [%s], it is not a file\n", path.data());
            }
        } else if (tracked) {
            log_with(log, L_DEBUG, "Ignoring [%s], it is already a source\n", path.data());
        } else if (set.add(path)) {
            log_with(log, L_INFO, "Watching [%s]\n", path.data());
        } else {
            log_with(log, L_WARN, "Ignoring [%s], it can not be opened\n", path.data());
        }
    }
}

// 清理已删除的文件
void watcher::sweep_missing(source_set &set) {
    // 默认源不是文件，不参与清理
    for (auto &path : set.paths(false)) {
        if (!is_file(path.data())) {
            log_with(log, L_WARN, "Removing [%s], the file no longer exists\n", path.data());
            set.remove(path);
        }
    }
}

// 每轮读取之后更新集合
void watcher::update(source_set &set) {
    // 重新发来的缺失路径先经过apply()，这样只报告一次
    apply(poll_new_paths(), set);
    sweep_missing(set);
}
