// 格式检测与名称转换实现文件

#include <cctype>
#include <string>

#include <base.hpp>

#include "dataphile.hpp"
#include "format.hpp"

using namespace std;

// 全局转换对象
Name2Fmt name2fmt;
Fmt2Name fmt2name;

// 检查缓冲区的格式
format_t check_fmt(const void *buf, size_t len) {
    if (len >= 2 && (BUFFER_MATCH(buf, GZIP1_MAGIC) || BUFFER_MATCH(buf, GZIP2_MAGIC))) {
        return GZIP;
    } else if (len >= 3 && BUFFER_MATCH(buf, BZIP_MAGIC)) {
        return BZIP2;
    } else if (len >= 6 && BUFFER_MATCH(buf, XZ_MAGIC)) {
        return LZMA;
    } else if (len >= 13 && BUFFER_MATCH(buf, LZMA_MAGIC)
            && (((char *) buf)[12] == '\xff' || ((char *) buf)[12] == '\x00')) {
        // 旧.lzma头部：属性字节、字典大小，然后是64位的原始大小
        return LZMA;
    } else {
        return UNKNOWN;
    }
}

// 检查文件扩展名，不区分大小写
format_t check_ext(string_view path) {
    auto dot = path.rfind('.');
    if (dot == string_view::npos)
        return UNKNOWN;                    // 没有扩展名
    string ext(path.substr(dot));
    for (auto &c : ext)
        c = tolower((unsigned char) c);
    if (ext == ".gz")
        return GZIP;
    if (ext == ".bz" || ext == ".bz2")
        return BZIP2;
    if (ext == ".xz" || ext == ".lzma")
        return LZMA;
    return UNKNOWN;
}

// 格式到名称的转换
const char *Fmt2Name::operator[](format_t fmt) {
    switch (fmt) {
        case GZIP:
            return "gzip";
        case BZIP2:
            return "bzip";
        case LZMA:
            return "lzma";
        default:
            return "raw";      // 未压缩
    }
}

// 名称匹配宏
#define CHECKED_MATCH(s) (name == s)

// 名称到格式的转换，包括别名
format_t Name2Fmt::operator[](std::string_view name) {
    if (CHECKED_MATCH("gzip") || CHECKED_MATCH("gz"))
        return GZIP;
    else if (CHECKED_MATCH("bzip") || CHECKED_MATCH("bzip2") || CHECKED_MATCH("bz2"))
        return BZIP2;
    else if (CHECKED_MATCH("lzma") || CHECKED_MATCH("xz"))
        return LZMA;
    else
        return UNKNOWN;
}

// 错误码的可读名称
const char *err2str(err_t err) {
    switch (err) {
        case ERR_NONE:
            return "success";
        case ERR_CONFIG:
            return "invalid configuration";
        case ERR_NOT_FOUND:
            return "source not found";
        case ERR_UNSUPPORTED:
            return "unsupported algorithm";
        case ERR_CORRUPT:
            return "corrupt stream";
        case ERR_IO:
            return "I/O error";
        default:
            return "unknown error";
    }
}
