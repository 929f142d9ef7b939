// 流抽象头文件
#pragma once

#include <sys/types.h>
#include <cstdio>
#include <memory>
#include <string>

using sFILE = std::unique_ptr<FILE, decltype(&fclose)>;

// 用智能指针管理FILE，析构时自动关闭
static inline sFILE make_file(FILE *fp) {
    return sFILE(fp, [](FILE *fp) { return fp ? fclose(fp) : 1; });
}

// 流基类
class stream {
public:
    // 返回读取的字节数，暂无数据时返回0，出错返回-1
    virtual ssize_t read(void *buf, size_t len);
    virtual bool write(const void *buf, size_t len);
    virtual ~stream() = default;
};

using stream_ptr = std::unique_ptr<stream>;

// 过滤流：所有操作委托给下层流
class filter_stream : public stream {
public:
    filter_stream(stream_ptr &&base) : base(std::move(base)) {}

    ssize_t read(void *buf, size_t len) override;
    bool write(const void *buf, size_t len) override;

protected:
    stream_ptr base;    // 下层流
};

// 字节流，数据存放在调用方持有的字符串中
class byte_stream : public stream {
public:
    byte_stream(std::string &data) : _data(data), _pos(0) {}

    ssize_t read(void *buf, size_t len) override;
    bool write(const void *buf, size_t len) override;

private:
    std::string &_data;    // 数据
    size_t _pos;           // 读取位置
};

// 文件流基类，负责写满整个缓冲区
class file_stream : public stream {
public:
    bool write(const void *buf, size_t len) final;
protected:
    virtual ssize_t do_write(const void *buf, size_t len) = 0;
};

// 文件描述符流，任何时候都不会关闭描述符
class fd_stream : public file_stream {
public:
    fd_stream(int fd) : fd(fd) {}
    ssize_t read(void *buf, size_t len) override;
protected:
    ssize_t do_write(const void *buf, size_t len) override;
private:
    int fd;    // 文件描述符
};

/* ****************************************
 * 流类与C stdio之间的桥接
 * ****************************************/

// FILE -> stream_ptr
class fp_stream final : public file_stream {
public:
    fp_stream(FILE *fp = nullptr) : fp(make_file(fp)) {}

    // 读到文件末尾后，下一次读取会重新开始，
    // 这样写入方之后追加的数据也能读到
    ssize_t read(void *buf, size_t len) override;
protected:
    ssize_t do_write(const void *buf, size_t len) override;
private:
    sFILE fp;    // 文件句柄
};
