// dataphile主程序：命令行入口

#include <getopt.h>
#include <unistd.h>
#include <cstdlib>

#include <base.hpp>

#include "dataphile.hpp"
#include "compress.hpp"
#include "source.hpp"
#include "watch.hpp"

using namespace std;

// 打印支持的格式列表
static void print_formats() {
    for (int fmt = GZIP; fmt <= LZMA; ++fmt) {
        fprintf(stderr, "%s ", fmt2name[(format_t) fmt]);
    }
}

// 打印使用说明并退出
static void usage(char *arg0) {
    fprintf(stderr,
R"EOF(dataphile - stream, compress and decompress data

Usage: %s <action> [args...]

Supported actions:
  stream [-l] [-w] [-L] [-b SIZE] [-t LATENCY] [FILE...]
    Concatenate the FILEs (or STDIN when none are given) to STDOUT.
    -l  live: keep the files open and wait for more data, cycling
        through them every LATENCY seconds (default 0.1)
    -w  watch (with -l): read new file paths from STDIN, one per
        line; paths whose file disappeared are dropped
    -L  emit whole lines only
    -b  buffer size in KiB (default 256)

  compress[=format] [-l LEVEL] [-e ENCODING] [-b SIZE] [FILE...]
    Compress the FILEs (or STDIN) to STDOUT with [format].
    If [format] is not specified, then gzip will be used.
    LEVEL is passed to the algorithm unchanged (default 6).
    With ENCODING the input is UTF-8 text converted to ENCODING
    before compression.

  decompress[=format] [-e ENCODING] [-b SIZE] [FILE...]
    Decompress the FILEs (or STDIN) to STDOUT.
    If [format] is not specified, it is taken from the extension of
    the first FILE, or detected from the data.
    With ENCODING the output is decoded from ENCODING to UTF-8.

  formats
    List the supported formats.

  Supported formats: )EOF", arg0);

    print_formats();

    fprintf(stderr, "\n\n");
    exit(1);
}

// 解析以KiB为单位的缓冲区大小
static bool parse_size(const char *s, size_t &out) {
    char *end;
    long val = strtol(s, &end, 10);
    if (*s == '\0' || *end != '\0' || val <= 0)
        return false;
    out = (size_t) val * 1024;    // 转换为字节
    return true;
}

// 打开数据源集合，失败时记录错误
static unique_ptr<source_set> open_sources(const source_opts &opts) {
    err_t err;
    auto set = source_set::open(opts, &err);
    if (!set)
        LOGE("Cannot open sources: %s\n", err2str(err));
    return set;
}

// stream命令：把所有数据源连接输出到标准输出
int stream_files(int argc, char *argv[]) {
    source_opts opts;
    size_t bufsz = DEFAULT_BUFSZ;    // 缓冲区大小
    bool lines = false;              // 只输出完整的行
    int opt;
    while ((opt = getopt(argc, argv, "lwLb:t:")) != -1) {
        switch (opt) {
        case 'l':                       // 实时模式
            opts.live = true;
            break;
        case 'w':                       // 监视控制通道
            opts.watch = true;
            break;
        case 'L':                       // 按行输出
            lines = true;
            break;
        case 'b':                       // 缓冲区大小
            if (!parse_size(optarg, bufsz))
                return 1;
            break;
        case 't': {                     // 轮询间隔
            char *end;
            opts.latency = strtof(optarg, &end);
            if (*end != '\0')
                return 1;
            break;
        }
        default:
            return 1;
        }
    }
    for (int i = optind; i < argc; ++i)
        opts.paths.emplace_back(argv[i]);
    opts.stop = &interrupted;                // 收到信号时停止读取

    auto set = open_sources(opts);
    watcher w;    // 标准输入作为控制通道
    if (opts.live && opts.watch)
        set->on_cycle([&] { w.update(*set); });

    fd_stream out(STDOUT_FILENO);
    bool ok = lines
              ? set->read_lines(bufsz, [&](const string &line) {
                    return out.write(line.data(), line.size());
                })
              : set->read_buffers(bufsz, [&](const void *buf, size_t len) {
                    return out.write(buf, len);
                });
    set->close_all();    // 输出结束，关闭所有源
    if (!ok)
        LOGE("Stream failed: %s\n", err2str(set->error()));
    return 0;
}

// 编解码管道的输入端。为检测格式而预先读取的第一块数据最先交出。
static chunk_source pull_from(source_set &set, size_t bufsz, string &first, bool &failed) {
    return [&set, bufsz, &first, &failed](string &chunk) {
        if (!first.empty()) {
            chunk.swap(first);
            first.clear();           // 只交出一次
            return true;
        }
        chunk.resize(bufsz);
        ssize_t len = set.read(chunk.data(), bufsz);
        if (len < 0)
            failed = true;           // 读取出错
        chunk.resize(len > 0 ? len : 0);
        return len > 0;
    };
}

// compress命令：压缩数据源到标准输出
int compress_files(const char *method, int argc, char *argv[]) {
    format_t fmt = name2fmt[method];
    if (fmt == UNKNOWN)
        LOGE("Unknown compression method: [%s]\n", method);

    source_opts opts;
    size_t bufsz = DEFAULT_BUFSZ;
    int level = DEFAULT_LEVEL;           // 压缩级别
    const char *encoding = nullptr;      // 文本字符集
    int opt;
    while ((opt = getopt(argc, argv, "l:e:b:")) != -1) {
        switch (opt) {
        case 'l': {
            char *end;
            level = strtol(optarg, &end, 10);
            if (*optarg == '\0' || *end != '\0')
                return 1;
            break;
        }
        case 'e':
            encoding = optarg;
            break;
        case 'b':
            if (!parse_size(optarg, bufsz))
                return 1;
            break;
        default:
            return 1;
        }
    }
    for (int i = optind; i < argc; ++i)
        opts.paths.emplace_back(argv[i]);
    opts.stop = &interrupted;

    auto set = open_sources(opts);
    fd_stream out(STDOUT_FILENO);
    string first;
    bool failed = false;
    err_t err = compress(
            pull_from(*set, bufsz, first, failed),
            [&](const string &chunk) { return chunk.empty() || out.write(chunk.data(), chunk.size()); },
            fmt, encoding, level);
    set->close_all();
    if (failed)
        LOGE("Read failed: %s\n", err2str(set->error()));
    if (err != ERR_NONE)
        LOGE("Compression failed: %s\n", err2str(err));
    return 0;
}

// decompress命令：解压数据源到标准输出
int decompress_files(const char *method, int argc, char *argv[]) {
    format_t fmt = UNKNOWN;
    if (method) {
        fmt = name2fmt[method];
        if (fmt == UNKNOWN)
            LOGE("Unknown compression method: [%s]\n", method);
    }

    source_opts opts;
    size_t bufsz = DEFAULT_BUFSZ;
    const char *encoding = nullptr;
    int opt;
    while ((opt = getopt(argc, argv, "e:b:")) != -1) {
        switch (opt) {
        case 'e':
            encoding = optarg;
            break;
        case 'b':
            if (!parse_size(optarg, bufsz))
                return 1;
            break;
        default:
            return 1;
        }
    }
    for (int i = optind; i < argc; ++i)
        opts.paths.emplace_back(argv[i]);
    opts.stop = &interrupted;

    // 未指定格式时先看第一个文件的扩展名
    if (fmt == UNKNOWN && !opts.paths.empty())
        fmt = check_ext(opts.paths[0]);

    auto set = open_sources(opts);
    string first;
    if (fmt == UNKNOWN) {
        // 再根据数据开头的魔数检测
        first.resize(bufsz);
        ssize_t len = set->read(first.data(), bufsz);
        if (len < 0)
            LOGE("Read failed: %s\n", err2str(set->error()));
        first.resize(len > 0 ? len : 0);
        if (first.empty())
            return 0;                    // 没有输入
        fmt = check_fmt(first.data(), first.size());
        if (fmt == UNKNOWN)
            LOGE("Input is not a supported compressed type!\n");
    }
    LOGD("Decompressing [%s]\n", fmt2name[fmt]);

    fd_stream out(STDOUT_FILENO);
    bool failed = false;
    err_t err = decompress(
            pull_from(*set, bufsz, first, failed),
            [&](const string &chunk) { return chunk.empty() || out.write(chunk.data(), chunk.size()); },
            fmt, encoding);
    set->close_all();
    if (failed)
        LOGE("Read failed: %s\n", err2str(set->error()));
    if (err != ERR_NONE)
        LOGE("Decompression failed: %s\n", err2str(err));
    return 0;
}

// 主函数
int main(int argc, char *argv[]) {
    cmdline_logging(check_env("DATAPHILE_DEBUG"));    // 设置命令行日志
    install_interrupt_handler();                      // SIGINT/SIGTERM取消读取

    if (argc < 2)
        usage(argv[0]);

    // 为了向后兼容，跳过'--'前缀
    string_view action(argv[1]);
    if (str_starts(action, "--"))
        action = argv[1] + 2;

    int ret = 1;
    // 根据命令分发
    if (action == "stream") {
        ret = stream_files(argc - 1, argv + 1);
    } else if (action == "compress" || str_starts(action, "compress=")) {
        ret = compress_files(action.size() > 8 ? &action[9] : "gzip", argc - 1, argv + 1);
    } else if (action == "decompress" || str_starts(action, "decompress=")) {
        ret = decompress_files(action.size() > 10 ? &action[11] : nullptr, argc - 1, argv + 1);
    } else if (action == "formats") {
        print_formats();
        fprintf(stderr, "\n");
        ret = 0;
    }

    if (ret)
        usage(argv[0]);
    return 0;
}
