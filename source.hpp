// 数据源集合头文件：按顺序把多个字节源当作一个逻辑流读取
#pragma once

#include <unistd.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <base.hpp>

#include "dataphile.hpp"

// 由source_set::open校验一次，之后不再改变
struct source_opts {
    std::vector<std::string> paths;           // 按读取顺序排列的文件路径
    bool live = false;                        // 读完后等待新数据而不是结束
    bool watch = false;                       // live模式下接受新路径
    float latency = DEFAULT_LATENCY;          // 两轮live读取之间的秒数
    int default_fd = STDIN_FILENO;            // 没有路径时读取的描述符
    const std::atomic_bool *stop = nullptr;   // 置位后取消阻塞中的读取
    const log_callback *log = nullptr;        // nullptr：使用进程的日志表
};

// 一个带名字的字节源
class file_source {
public:
    // 文件无法打开时返回nullptr
    static std::unique_ptr<file_source> open(const std::string &path);
    // 包装默认描述符，这里永远不会关闭它
    static std::unique_ptr<file_source> stdio(int fd);

    // 当前没有更多数据（或已关闭）时返回0
    ssize_t read(void *buf, size_t len);
    // 先读最多len字节，再继续读到该行结尾
    ssize_t read_line(std::string &out, size_t len);
    void close();

    const std::string &path() const { return _path; }
    bool is_default() const { return !owned; }

private:
    file_source(std::string path, stream_ptr &&strm, bool owned)
    : _path(std::move(path)), strm(std::move(strm)), owned(owned) {}

    std::string _path;          // 路径，默认源为STDIN_NAME
    stream_ptr strm;            // 读取句柄，关闭后为空
    std::string lookahead;      // 行读取时多读出的数据
    bool owned;                 // 由本对象打开并负责关闭
};

// 数据源集合
class source_set {
public:
    static std::unique_ptr<source_set> open(const source_opts &opts, err_t *err = nullptr);
    ~source_set();

    source_set(const source_set &) = delete;
    source_set &operator=(const source_set &) = delete;

    /*
     * 从当前源读取最多len字节，读完的源交给下一个源。
     * 所有源都读完时返回0（哨兵），live模式下只有取消时才返回0；
     * 出错返回-1。
     */
    ssize_t read(void *buf, size_t len);
    ssize_t read_line(std::string &out, size_t len);

    // 把每个缓冲区交给fn，直到哨兵、取消或fn返回false。
    // 出错时返回false。
    bool read_buffers(size_t bufsz, const std::function<bool(const void *, size_t)> &fn);
    bool read_lines(size_t bufsz, const std::function<bool(const std::string &)> &fn);

    // 打开并追加一个路径。无法打开时返回false。
    bool add(const std::string &path);
    // 关闭并移除一个源。不在集合中时返回false。
    bool remove(const std::string &path);
    bool contains(const std::string &path) const;
    size_t size() const { return sources.size(); }
    // 按读取顺序的路径；with_default为false时不含默认源
    std::vector<std::string> paths(bool with_default = true) const;

    // 关闭所有不是默认描述符的源
    void close_all();

    // 每轮live读取之后、下一轮开始之前调用
    void on_cycle(std::function<void()> fn) { cycle_cb = std::move(fn); }

    err_t error() const { return err; }
    bool stopped() const { return opts.stop && opts.stop->load(); }

private:
    explicit source_set(const source_opts &opts)
    : opts(opts), log(opts.log ? *opts.log : log_cb), active(0), closed(false), err(ERR_NONE) {}

    ssize_t next(const std::function<ssize_t(file_source &)> &op);
    bool nap();
    ssize_t find(const std::string &path) const;

    const source_opts opts;                             // 校验过的选项
    const log_callback &log;                            // 注入的日志表
    std::vector<std::unique_ptr<file_source>> sources;  // 插入顺序即读取顺序
    std::function<void()> cycle_cb;                     // 每轮结束的回调
    size_t active;                                      // 当前源的下标
    bool closed;                                        // close_all()已调用
    err_t err;                                          // 最近一次错误
};
