// 压缩/解压缩实现文件，支持 gzip、bzip2 与 xz 三种格式

#include <memory>
#include <functional>

#include <zlib.h>      // gzip
#include <bzlib.h>     // bzip2
#include <lzma.h>      // xz / lzma

#include <base.hpp>

#include "compress.hpp"

using namespace std;

// 写入下层流
#define bwrite this->base->write

// 常量定义
constexpr size_t CHUNK = 0x40000;           // 256KB输出块大小
constexpr unsigned BZ_HEADER_SIZE = 4;      // "BZh" 加一个块大小字符

// 仅供解码器使用：输入结束时还有未完成的流
// 没有任何输入视为空流，否则就是被截断的流
static bool end_of_input(const char *name, uint64_t total_in, bool ended, err_t &err) {
    if (ended || total_in == 0)
        return true;
    LOGW("%s: unexpected end of compressed stream\n", name);
    err = ERR_CORRUPT;
    return false;
}

// gzip流处理类
class gz_strm : public codec_stream {
public:
    // 写入一块数据
    bool write(const void *buf, size_t len) override {
        if (finished || err != ERR_NONE)
            return false;                   // 已结束或出错后拒绝写入
        total_in += len;                    // 累计输入大小
        return len == 0 || do_write(buf, len, Z_NO_FLUSH);
    }

    // 完成压缩/解压缩
    bool finish() override {
        if (finished)
            return err == ERR_NONE;         // 只执行一次
        finished = true;
        if (err != ERR_NONE)
            return false;
        if (mode == ENCODE)
            return do_write(nullptr, 0, Z_FINISH);  // 输出剩余数据和gzip尾部
        if (mode == WAIT)
            // 最后只剩一个0x1f，不可能是新的gzip头部
            LOGW("gzip: discarding trailing byte after %d stream(s)\n", streams);
        return end_of_input("gzip", total_in, ended, err);
    }

    // 析构函数，完成压缩/解压缩
    ~gz_strm() override {
        finish();
        if (mode == ENCODE)
            deflateEnd(&strm);     // 结束压缩
        else
            inflateEnd(&strm);     // 结束解压缩
    }

protected:
    // 流模式枚举
    enum mode_t {
        DECODE,  // 解码模式
        ENCODE,  // 编码模式
        WAIT,    // 等待模式，上一个成员结束于单独的0x1f，由下一个字节决定
        COPY     // 丢弃模式，尾部垃圾数据直接丢弃
    } mode;

    // 构造函数，初始化流
    gz_strm(mode_t mode, stream_ptr &&base, int level) :
        codec_stream(std::move(base)), mode(mode), strm{}, outbuf{0},
        total_in(0), streams(0), ended(false) {
        int code;
        switch(mode) {
        case DECODE:
            // 自动识别gzip或zlib头部
            code = inflateInit2(&strm, 15 | 32);
            break;
        case ENCODE:
            // 负数级别使用zlib默认值
            code = deflateInit2(&strm, level < 0 ? Z_DEFAULT_COMPRESSION : level,
                                Z_DEFLATED, 15 | 16, 8, Z_DEFAULT_STRATEGY);
            break;
        default:
            code = Z_STREAM_ERROR;
            break;
        }
        if (code != Z_OK) {
            LOGW("gzip initialization failed (%d)\n", code);
            err = ERR_CONFIG;           // 级别不被接受
        }
    }

private:
    z_stream strm;           // zlib流结构
    uint8_t outbuf[CHUNK];   // 输出缓冲区
    uint64_t total_in;       // 累计输入大小
    int streams;             // 已完整解码的成员数
    bool ended;              // 当前没有正在解码的成员

    // 切换到丢弃模式
    void drop_trailing() {
        LOGW("gzip: discarding trailing data after %d stream(s)\n", streams);
        mode = COPY;
    }

    // 执行写入操作
    bool do_write(const void *buf, size_t len, int flush) {
        if (mode == WAIT) {
            if (len == 0) return true;
            Bytef b[1] = {0x1f};
            if (*(Bytef *)buf == 0x8b) {
                // 确认是新的gzip成员，先把保留的0x1f送进去
                mode = DECODE;
                ended = false;
                inflateReset(&strm);
                strm.next_in = b;
                strm.avail_in = 1;
                strm.next_out = outbuf;
                strm.avail_out = sizeof(outbuf);
                inflate(&strm, flush);
            } else {
                drop_trailing();
                return true;
            }
        }
        if (mode == COPY)
            return true;                     // 直接丢弃
        strm.next_in = (Bytef *) buf;
        strm.avail_in = len;
        int code;
        do {
            strm.next_out = outbuf;
            strm.avail_out = sizeof(outbuf);
            code = mode == ENCODE ? deflate(&strm, flush) : inflate(&strm, flush);
            if (code == Z_STREAM_ERROR || code == Z_DATA_ERROR ||
                code == Z_NEED_DICT || code == Z_MEM_ERROR) {
                LOGW("gzip %s failed (%d)\n", mode == ENCODE ? "encode" : "decode", code);
                err = mode == ENCODE ? ERR_IO : ERR_CORRUPT;
                return false;
            }
            if (!bwrite(outbuf, sizeof(outbuf) - strm.avail_out)) {
                err = ERR_IO;                // 下层流拒绝写入
                return false;
            }
            if (mode == DECODE && code == Z_STREAM_END) {
                if (!ended) {
                    ended = true;            // 当前成员的CRC和长度已校验
                    ++streams;
                }
                if (strm.avail_in > 1) {
                    if (strm.next_in[0] == 0x1f && strm.next_in[1] == 0x8b) {
                        // 流中还有另一个gzip成员，需要重置流并继续解码
                        inflateReset(&strm);
                        ended = false;
                        strm.avail_out = 0;
                        continue;
                    }
                } else if (strm.avail_in == 1) {
                    if (strm.next_in[0] == 0x1f) {
                        // 如果只剩一个字节，需要等待下一个字节
                        // 来确定是否为gzip头部
                        mode = WAIT;
                        return true;
                    }
                } else {
                    // 全部消耗完毕。下一次inflate不会消耗任何数据，
                    // 但会回退到前面两个条件
                    return true;
                }
                // 剩余数据不是gzip成员
                drop_trailing();
                return true;
            }
        } while (strm.avail_out == 0 || (flush == Z_FINISH && code != Z_STREAM_END));
        return true;
    }
};

// gzip解码器类
class gz_decoder : public gz_strm {
public:
    explicit gz_decoder(stream_ptr &&base) : gz_strm(DECODE, std::move(base), -1) {};
};

// gzip编码器类
class gz_encoder : public gz_strm {
public:
    gz_encoder(stream_ptr &&base, int level) : gz_strm(ENCODE, std::move(base), level) {};
};

// bzip2流处理类
class bz_strm : public codec_stream {
public:
    // 写入一块数据
    bool write(const void *buf, size_t len) override {
        if (finished || err != ERR_NONE)
            return false;
        total_in += len;
        return len == 0 || do_write(buf, len, BZ_RUN);
    }

    // 完成压缩/解压缩
    bool finish() override {
        if (finished)
            return err == ERR_NONE;
        finished = true;
        if (err != ERR_NONE)
            return false;
        if (mode == ENCODE)
            return do_write(nullptr, 0, BZ_FINISH);   // 输出最后一个块和流尾部
        if (!ended && streams > 0 && strm.total_in_lo32 < BZ_HEADER_SIZE) {
            // 新流的头部都没收全，按尾部垃圾处理
            LOGW("bzip2: discarding trailing data after %d stream(s)\n", streams);
            return true;
        }
        return end_of_input("bzip2", total_in, ended, err);
    }

    // 析构函数，完成压缩/解压缩
    ~bz_strm() override {
        finish();
        if (mode == ENCODE)
            BZ2_bzCompressEnd(&strm);     // 结束压缩
        else
            BZ2_bzDecompressEnd(&strm);   // 结束解压缩
    }

protected:
    // bzip2模式枚举
    enum mode_t {
        DECODE,  // 解码模式
        ENCODE,  // 编码模式
        COPY     // 丢弃模式，尾部垃圾数据直接丢弃
    } mode;

    // 构造函数，初始化bzip2流
    bz_strm(mode_t mode, stream_ptr &&base, int level) :
        codec_stream(std::move(base)), mode(mode), strm{}, outbuf{0},
        total_in(0), streams(0), ended(false) {
        int code;
        switch(mode) {
        case DECODE:
            code = BZ2_bzDecompressInit(&strm, 0, 0);     // 初始化bzip2解压缩
            break;
        case ENCODE:
            // 负数级别使用默认的9（900k块）
            code = BZ2_bzCompressInit(&strm, level < 0 ? 9 : level, 0, 0);
            break;
        default:
            code = BZ_PARAM_ERROR;
            break;
        }
        if (code != BZ_OK) {
            LOGW("bzip2 initialization failed (%d)\n", code);
            err = ERR_CONFIG;
        }
    }

private:
    bz_stream strm;        // bzip2流结构
    char outbuf[CHUNK];    // 输出缓冲区
    uint64_t total_in;     // 累计输入大小
    int streams;           // 已完整解码的流数
    bool ended;            // 当前没有正在解码的流

    // 换一个新的解码器继续解下一个流，保留未消耗的输入
    bool restart() {
        char *next_in = strm.next_in;
        unsigned avail_in = strm.avail_in;
        BZ2_bzDecompressEnd(&strm);
        strm = bz_stream{};
        int code = BZ2_bzDecompressInit(&strm, 0, 0);
        if (code != BZ_OK) {
            LOGW("bzip2 initialization failed (%d)\n", code);
            err = ERR_CONFIG;
            return false;
        }
        strm.next_in = next_in;
        strm.avail_in = avail_in;
        return true;
    }

    // 执行写入操作
    bool do_write(const void *buf, size_t len, int flush) {
        if (mode == COPY)
            return true;                              // 直接丢弃
        if (mode == DECODE && len > 0)
            ended = false;                            // 有新数据，流未结束
        strm.next_in = (char *) buf;
        strm.avail_in = len;
        int code;
        do {
            strm.avail_out = sizeof(outbuf);
            strm.next_out = outbuf;
            code = mode == ENCODE ? BZ2_bzCompress(&strm, flush) : BZ2_bzDecompress(&strm);
            if (code == BZ_DATA_ERROR_MAGIC && streams > 0) {
                // 完整流之后的数据不是bzip2头部
                LOGW("bzip2: discarding trailing data after %d stream(s)\n", streams);
                mode = COPY;
                ended = true;
                return true;
            }
            if (code < 0) {
                LOGW("bzip2 %s failed (%d)\n", mode == ENCODE ? "encode" : "decode", code);
                err = mode == ENCODE ? ERR_IO : ERR_CORRUPT;
                return false;
            }
            if (!bwrite(outbuf, sizeof(outbuf) - strm.avail_out)) {
                err = ERR_IO;
                return false;
            }
            if (mode == DECODE && code == BZ_STREAM_END) {
                // 多个连接在一起的流按一个流解码
                ended = strm.avail_in == 0;
                ++streams;
                if (!restart())
                    return false;
                strm.avail_out = 0;
                continue;
            }
            if (mode == ENCODE && flush == BZ_RUN && strm.avail_in == 0)
                // 输入已全部接收，没有进展时BZ_RUN会返回BZ_PARAM_ERROR，
                // 剩余输出留到下一次写入或BZ_FINISH
                break;
        } while (strm.avail_out == 0 || (flush == BZ_FINISH && code != BZ_STREAM_END));
        return true;
    }
};

// bzip2解码器类
class bz_decoder : public bz_strm {
public:
    explicit bz_decoder(stream_ptr &&base) : bz_strm(DECODE, std::move(base), -1) {};
};

// bzip2编码器类
class bz_encoder : public bz_strm {
public:
    bz_encoder(stream_ptr &&base, int level) : bz_strm(ENCODE, std::move(base), level) {};
};

// LZMA/XZ流处理类
class lzma_strm : public codec_stream {
public:
    // 写入一块数据
    bool write(const void *buf, size_t len) override {
        if (finished || err != ERR_NONE)
            return false;
        total_in += len;
        return len == 0 || do_write(buf, len, LZMA_RUN);
    }

    // 完成压缩/解压缩
    bool finish() override {
        if (finished)
            return err == ERR_NONE;
        finished = true;
        if (err != ERR_NONE)
            return false;
        if (mode == DECODE && total_in == 0)
            return true;                           // 空输入即空流
        // 解码时由LZMA_FINISH确认最后一个流已完整
        return do_write(nullptr, 0, LZMA_FINISH);
    }

    // 析构函数，完成压缩/解压缩
    ~lzma_strm() override {
        finish();
        lzma_end(&strm);                           // 释放编解码器
    }

protected:
    // LZMA模式枚举
    enum mode_t {
        DECODE,  // 解码模式
        ENCODE   // 编码模式
    } mode;

    // 构造函数，初始化LZMA流
    lzma_strm(mode_t mode, stream_ptr &&base, int level) :
        codec_stream(std::move(base)), mode(mode), strm(LZMA_STREAM_INIT), outbuf{0},
        total_in(0) {
        lzma_ret code;
        switch(mode) {
        case DECODE:
            // 同时支持.xz与旧的.lzma，连接的流和流之间的填充由liblzma处理
            code = lzma_auto_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED);
            break;
        case ENCODE: {
            lzma_options_lzma opt;
            // 负数级别使用默认预设
            if (lzma_lzma_preset(&opt, level < 0 ? LZMA_PRESET_DEFAULT : level)) {
                code = LZMA_OPTIONS_ERROR;
                break;
            }
            lzma_filter filters[2];
            filters[0].id = LZMA_FILTER_LZMA2;      // 单一LZMA2过滤器
            filters[0].options = &opt;
            filters[1].id = LZMA_VLI_UNKNOWN;       // 过滤器链结束
            filters[1].options = nullptr;
            code = lzma_stream_encoder(&strm, filters, LZMA_CHECK_CRC64);
            break;
        }
        default:
            code = LZMA_PROG_ERROR;
            break;
        }
        if (code != LZMA_OK) {
            LOGW("LZMA initialization failed (%d)\n", code);
            err = ERR_CONFIG;
        }
    }

private:
    lzma_stream strm;        // LZMA流结构
    uint8_t outbuf[CHUNK];   // 输出缓冲区
    uint64_t total_in;       // 累计输入大小

    // 执行写入操作
    bool do_write(const void *buf, size_t len, lzma_action flush) {
        strm.next_in = (const uint8_t *) buf;
        strm.avail_in = len;
        lzma_ret code;
        do {
            strm.avail_out = sizeof(outbuf);
            strm.next_out = outbuf;
            code = lzma_code(&strm, flush);
            // LZMA_RUN下没有进展的LZMA_BUF_ERROR只表示需要更多输入；
            // LZMA_FINISH下则说明流被截断
            if (code != LZMA_OK && code != LZMA_STREAM_END &&
                (code != LZMA_BUF_ERROR || flush == LZMA_FINISH)) {
                LOGW("LZMA %s failed (%d)\n", mode == ENCODE ? "encode" : "decode", code);
                err = mode == ENCODE ? ERR_IO : ERR_CORRUPT;
                return false;
            }
            if (!bwrite(outbuf, sizeof(outbuf) - strm.avail_out)) {
                err = ERR_IO;
                return false;
            }
        } while (strm.avail_out == 0 || (flush == LZMA_FINISH && code != LZMA_STREAM_END));
        return true;
    }
};

// LZMA解码器类
class lzma_decoder : public lzma_strm {
public:
    explicit lzma_decoder(stream_ptr &&base) : lzma_strm(DECODE, std::move(base), -1) {}
};

// XZ编码器类
class xz_encoder : public lzma_strm {
public:
    xz_encoder(stream_ptr &&base, int level) : lzma_strm(ENCODE, std::move(base), level) {}
};

// 根据格式创建编码器
codec_strm_ptr get_encoder(format_t type, stream_ptr &&base, int level) {
    codec_strm_ptr strm;
    switch (type) {
        case GZIP:
            strm = make_unique<gz_encoder>(std::move(base), level);
            break;
        case BZIP2:
            strm = make_unique<bz_encoder>(std::move(base), level);
            break;
        case LZMA:
            strm = make_unique<xz_encoder>(std::move(base), level);
            break;
        default:
            LOGW("Unsupported compression format\n");
            return nullptr;
    }
    if (strm->error() != ERR_NONE) {
        // 初始化失败只可能是级别不被接受
        LOGW("Invalid %s compression level (%d)\n", fmt2name[type], level);
        return nullptr;
    }
    return strm;
}

// 根据格式创建解码器
codec_strm_ptr get_decoder(format_t type, stream_ptr &&base) {
    codec_strm_ptr strm;
    switch (type) {
        case GZIP:
            strm = make_unique<gz_decoder>(std::move(base));
            break;
        case BZIP2:
            strm = make_unique<bz_decoder>(std::move(base));
            break;
        case LZMA:
            strm = make_unique<lzma_decoder>(std::move(base));
            break;
        default:
            LOGW("Unsupported compression format\n");
            return nullptr;
    }
    if (strm->error() != ERR_NONE)
        return nullptr;
    return strm;
}

unique_ptr<chunk_codec> chunk_codec::make(format_t fmt, codec_dir dir, int level,
                                          const char *encoding, err_t *err) {
    auto set_err = [=](err_t e) { if (err) *err = e; };
    if (!SUPPORTED(fmt)) {
        LOGW("Unsupported compression format\n");
        set_err(ERR_UNSUPPORTED);
        return nullptr;
    }
    unique_ptr<chunk_codec> codec(new chunk_codec(dir));
    if (encoding) {
        // 压缩时 UTF-8 -> encoding，解压时 encoding -> UTF-8
        codec->text = dir == COMPRESS
                      ? transcoder::make("UTF-8", encoding)
                      : transcoder::make(encoding, "UTF-8");
        if (!codec->text) {
            set_err(ERR_CONFIG);
            return nullptr;
        }
    }
    // 编解码流的输出都落到sink里
    auto base = make_unique<byte_stream>(codec->sink);
    codec->strm = dir == COMPRESS
                  ? get_encoder(fmt, std::move(base), level)
                  : get_decoder(fmt, std::move(base));
    if (!codec->strm) {
        set_err(ERR_CONFIG);
        return nullptr;
    }
    set_err(ERR_NONE);
    return codec;
}

// 记录错误，ERR_NONE说明是下层流失败
bool chunk_codec::fail(err_t e) {
    err = e == ERR_NONE ? ERR_IO : e;
    return false;
}

// 取走编解码流自上次以来产生的输出
bool chunk_codec::take(string &out) {
    if (dir == DECOMPRESS && text) {
        bool ok = text->feed(sink.data(), sink.size(), out);
        sink.clear();
        if (!ok)
            return fail(ERR_CORRUPT);
    } else {
        out.swap(sink);
        sink.clear();
    }
    return true;
}

bool chunk_codec::feed(const void *buf, size_t len, string &out) {
    out.clear();
    if (flushed || err != ERR_NONE)
        return false;
    if (dir == COMPRESS && text) {
        // 先转换字符集再压缩
        text_buf.clear();
        if (!text->feed(buf, len, text_buf))
            return fail(ERR_CORRUPT);
        buf = text_buf.data();
        len = text_buf.size();
    }
    if (!strm->write(buf, len))
        return fail(strm->error());
    return take(out);
}

bool chunk_codec::flush(string &out) {
    out.clear();
    if (flushed)
        return false;                     // 只能调用一次
    flushed = true;
    if (err != ERR_NONE)
        return false;
    if (dir == COMPRESS && text) {
        // 字符集转换的剩余部分（移位序列等）
        text_buf.clear();
        if (!text->flush(text_buf))
            return fail(ERR_CORRUPT);
        if (!strm->write(text_buf.data(), text_buf.size()))
            return fail(strm->error());
    }
    if (!strm->finish())
        return fail(strm->error());
    if (!take(out))
        return false;
    if (dir == DECOMPRESS && text && !text->flush(out))
        return fail(ERR_CORRUPT);         // 文本末尾有不完整的多字节序列
    return true;
}

// 拉取输入、逐块转换、推送输出，最后输出一次flush的结果
static err_t run_codec(const chunk_source &next, const chunk_sink &emit, format_t fmt,
                       codec_dir dir, int level, const char *encoding) {
    err_t err;
    auto codec = chunk_codec::make(fmt, dir, level, encoding, &err);
    if (!codec)
        return err;                       // 在第一次拉取之前失败
    string in, out;
    while (next(in)) {
        if (!codec->feed(in, out))
            return codec->error();
        if (!emit(out))
            return ERR_IO;
    }
    if (!codec->flush(out))
        return codec->error();
    return emit(out) ? ERR_NONE : ERR_IO;
}

err_t compress(const chunk_source &next, const chunk_sink &emit, format_t fmt,
               const char *encoding, int level) {
    return run_codec(next, emit, fmt, COMPRESS, level, encoding);
}

err_t decompress(const chunk_source &next, const chunk_sink &emit, format_t fmt,
                 const char *encoding) {
    return run_codec(next, emit, fmt, DECOMPRESS, -1, encoding);
}
