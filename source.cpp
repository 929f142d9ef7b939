// 数据源集合实现文件

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

#include "source.hpp"

using namespace std;

// 打开一个文件源
unique_ptr<file_source> file_source::open(const string &path) {
    FILE *fp = xfopen(path.data(), "re");
    if (fp == nullptr)
        return nullptr;
    return unique_ptr<file_source>(new file_source(path, make_unique<fp_stream>(fp), true));
}

// 包装默认描述符，不拥有它
unique_ptr<file_source> file_source::stdio(int fd) {
    return unique_ptr<file_source>(new file_source(STDIN_NAME, make_unique<fd_stream>(fd), false));
}

// 从源读取数据
ssize_t file_source::read(void *buf, size_t len) {
    if (!strm)
        return 0;                           // 已关闭
    if (!lookahead.empty()) {
        // 先交出行读取时多读的数据
        len = std::min(len, lookahead.size());
        memcpy(buf, lookahead.data(), len);
        lookahead.erase(0, len);
        return len;
    }
    return strm->read(buf, len);
}

// 读取一行，行长度可以超过len
ssize_t file_source::read_line(string &out, size_t len) {
    out.resize(len);
    ssize_t ret = read(out.data(), len);
    if (ret <= 0) {
        out.clear();
        return ret;
    }
    out.resize(ret);
    char buf[256];
    while (out.back() != '\n') {
        ssize_t n = read(buf, sizeof(buf));
        if (n <= 0)
            // 源在行中间结束；读取错误会在下一次调用时出现
            break;
        auto nl = static_cast<const char *>(memchr(buf, '\n', n));
        size_t take = nl ? nl - buf + 1 : n;
        out.append(buf, take);
        lookahead.insert(0, buf + take, n - take);   // 换行之后的部分放回去
    }
    return out.size();
}

// 关闭源
void file_source::close() {
    if (owned)
        strm.reset();                       // 默认描述符保持打开
}

// 校验选项并打开所有数据源
unique_ptr<source_set> source_set::open(const source_opts &opts, err_t *err) {
    auto set_err = [=](err_t e) { if (err) *err = e; };
    const log_callback &log = opts.log ? *opts.log : log_cb;

    // 校验选项
    if (opts.watch && !opts.live && opts.paths.empty()) {
        log_with(log, L_ERR, "Watching for sources requires live mode\n");
        set_err(ERR_CONFIG);
        return nullptr;
    }
    if (opts.latency < 0) {
        log_with(log, L_ERR, "Invalid latency (%g)\n", opts.latency);
        set_err(ERR_CONFIG);
        return nullptr;
    }
    if (opts.watch && !opts.live)
        log_with(log, L_DEBUG, "Not live, new sources will not be watched\n");

    unique_ptr<source_set> set(new source_set(opts));
    if (opts.paths.empty()) {
        // watch模式下标准输入是控制通道，所以不绑定默认源
        if (!opts.watch)
            set->sources.push_back(file_source::stdio(opts.default_fd));
    } else {
        // 按顺序立即打开所有路径，任何一个失败都不返回半成品
        for (auto &path : opts.paths) {
            if (set->contains(path)) {
                log_with(log, L_DEBUG, "Ignoring duplicate source [%s]\n", path.data());
                continue;
            }
            if (!is_file(path.data())) {
                log_with(log, L_ERR, "No such file [%s]\n", path.data());
                set_err(ERR_NOT_FOUND);
                return nullptr;
            }
            auto src = file_source::open(path);
            if (!src) {
                set_err(ERR_NOT_FOUND);
                return nullptr;
            }
            set->sources.push_back(std::move(src));
        }
    }
    set_err(ERR_NONE);
    return set;
}

// 析构函数，关闭所有源
source_set::~source_set() {
    close_all();
}

// 表示文件已经消失的错误码
static bool vanished(int code) {
    return code == ENOENT || code == ESTALE || code == ENODEV || code == ENXIO;
}

// 对当前源执行op，读完就切换到下一个源
ssize_t source_set::next(const function<ssize_t(file_source &)> &op) {
    for (;;) {
        if (closed || stopped())
            return 0;
        if (active >= sources.size()) {
            if (!opts.live)
                return 0;                   // 所有源都读完了
            // 一轮结束：等待新数据，让watcher更新成员，
            // 然后从第一个源重新开始
            if (!nap())
                return 0;
            if (cycle_cb)
                cycle_cb();
            active = 0;
            if (sources.empty() && !opts.watch) {
                log_with(log, L_DEBUG, "No sources left\n");
                return 0;
            }
            continue;
        }
        file_source &src = *sources[active];
        ssize_t ret = op(src);
        if (ret > 0)
            return ret;                     // 读到数据
        if (ret < 0) {
            int code = errno;
            if (code == EINTR)
                continue;                   // 被信号打断，检查stop后重试
            if (!vanished(code)) {
                log_with(log, L_ERR, "Read from [%s] failed: %s\n", src.path().data(), strerror(code));
                err = ERR_IO;
                return -1;
            }
            log_with(log, L_WARN, "Removing [%s], it is no longer readable\n", src.path().data());
            src.close();
            sources.erase(sources.begin() + active);
            continue;
        }
        ++active;                           // 当前源暂时没有数据
    }
}

// 睡眠latency秒，分成小段以便及时响应取消
bool source_set::nap() {
    using namespace std::chrono;
    auto until = steady_clock::now() + duration_cast<steady_clock::duration>(duration<float>(opts.latency));
    while (!stopped()) {
        auto now = steady_clock::now();
        if (now >= until)
            return true;
        this_thread::sleep_for(std::min<steady_clock::duration>(until - now, milliseconds(10)));
    }
    return false;
}

// 读取一块数据
ssize_t source_set::read(void *buf, size_t len) {
    if (len == 0) {
        err = ERR_CONFIG;                   // 缓冲区大小必须为正
        return -1;
    }
    return next([&](file_source &src) { return src.read(buf, len); });
}

// 读取一行
ssize_t source_set::read_line(string &out, size_t len) {
    if (len == 0) {
        err = ERR_CONFIG;
        return -1;
    }
    ssize_t ret = next([&](file_source &src) { return src.read_line(out, len); });
    if (ret <= 0)
        out.clear();
    return ret;
}

// 逐块读取直到结束
bool source_set::read_buffers(size_t bufsz, const function<bool(const void *, size_t)> &fn) {
    if (bufsz == 0) {
        err = ERR_CONFIG;
        return false;
    }
    vector<char> buf(bufsz);
    ssize_t len;
    while ((len = read(buf.data(), bufsz)) > 0) {
        if (!fn(buf.data(), len))
            break;                          // 调用方要求停止
    }
    return len >= 0;
}

// 逐行读取直到结束
bool source_set::read_lines(size_t bufsz, const function<bool(const string &)> &fn) {
    string line;
    ssize_t len;
    while ((len = read_line(line, bufsz)) > 0) {
        if (!fn(line))
            break;
    }
    return len >= 0;
}

// 查找路径的下标，不存在返回-1
ssize_t source_set::find(const string &path) const {
    for (size_t i = 0; i < sources.size(); ++i) {
        if (sources[i]->path() == path)
            return i;
    }
    return -1;
}

bool source_set::contains(const string &path) const {
    return find(path) >= 0;
}

// 添加一个源
bool source_set::add(const string &path) {
    if (contains(path))
        return true;                        // 已经在集合中
    auto src = file_source::open(path);
    if (!src)
        return false;
    log_with(log, L_DEBUG, "Adding source [%s]\n", path.data());
    sources.push_back(std::move(src));
    return true;
}

// 移除一个源
bool source_set::remove(const string &path) {
    ssize_t idx = find(path);
    if (idx < 0)
        return false;
    sources[idx]->close();
    sources.erase(sources.begin() + idx);
    // 移除的源在当前源之前时，保持同一个源为当前源
    if ((size_t) idx < active)
        --active;
    return true;
}

// 列出所有源的路径
vector<string> source_set::paths(bool with_default) const {
    vector<string> names;
    for (auto &src : sources) {
        if (with_default || !src->is_default())
            names.push_back(src->path());
    }
    return names;
}

// 关闭所有源
void source_set::close_all() {
    for (auto &src : sources)
        src->close();
    closed = true;                          // 之后的读取都返回哨兵
}
