// dataphile公共头文件，核心功能与命令行共用的声明
#pragma once

#include <sys/types.h>

#define DEFAULT_BUFSZ   (256 * 1024)   // 每次读取的字节数
#define DEFAULT_LATENCY 0.1f           // 两轮实时读取之间的秒数
#define DEFAULT_LEVEL   6              // 默认压缩级别
#define STDIN_NAME      "<stdin>"      // 默认源的路径名

// 所有核心操作返回的状态码
enum err_t {
    ERR_NONE,          // 成功
    ERR_CONFIG,        // 选项组合无效
    ERR_NOT_FOUND,     // 数据源不存在
    ERR_UNSUPPORTED,   // 未知的压缩算法
    ERR_CORRUPT,       // 压缩数据或编码文本损坏
    ERR_IO,            // 系统读写失败
};

const char *err2str(err_t err);    // 状态码的可读名称

// 命令行动作
int stream_files(int argc, char *argv[]);
int compress_files(const char *method, int argc, char *argv[]);
int decompress_files(const char *method, int argc, char *argv[]);
