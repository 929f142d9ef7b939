// 格式定义头文件，定义压缩格式的枚举和常量
#pragma once

#include <cstring>
#include <string_view>

// 格式类型枚举
typedef enum {
    UNKNOWN,        // 未知格式
    GZIP,           // Gzip压缩
    BZIP2,          // Bzip2压缩
    LZMA,           // XZ/LZMA压缩
} format_t;

// 格式检查宏定义
#define SUPPORTED(fmt) ((fmt) >= GZIP && (fmt) <= LZMA)      // 检查是否为支持的压缩格式

// 缓冲区匹配宏定义
#define BUFFER_MATCH(buf, s) (memcmp(buf, s, sizeof(s) - 1) == 0)   // 缓冲区头部匹配

// 各种格式的魔数定义
#define GZIP1_MAGIC     "\x1f\x8b"     // Gzip魔数1
#define GZIP2_MAGIC     "\x1f\x9e"     // Gzip魔数2
#define BZIP_MAGIC      "BZh"          // Bzip2魔数
#define XZ_MAGIC        "\xfd""7zXZ"   // XZ魔数
#define LZMA_MAGIC      "\x5d\x00\x00" // 旧LZMA魔数

// 格式到名称的转换类
class Fmt2Name {
public:
    const char *operator[](format_t fmt);
};

// 名称到格式的转换类，支持别名
class Name2Fmt {
public:
    format_t operator[](std::string_view name);
};

// 根据压缩流开头的字节检测格式
format_t check_fmt(const void *buf, size_t len);

// 根据文件扩展名检测格式
format_t check_ext(std::string_view path);

// 全局转换对象
extern Name2Fmt name2fmt;
extern Fmt2Name fmt2name;
