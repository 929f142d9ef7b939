// 压缩/解压缩头文件，增量编解码接口
#pragma once

#include <functional>
#include <memory>
#include <string>

#include <stream.hpp>

#include "dataphile.hpp"
#include "format.hpp"
#include "transcode.hpp"

// 编解码流基类：写入的数据经过变换后推入下层流。
// 后端状态是顺序的，一个逻辑流对应一个实例，不会重新开始。
class codec_stream : public filter_stream {
public:
    using filter_stream::filter_stream;
    using stream::read;

    // 输出后端剩余的全部数据。在最后一次写入之后调用一次，
    // 之后的写入都会被拒绝。
    virtual bool finish() = 0;

    err_t error() const { return err; }

protected:
    err_t err = ERR_NONE;      // 最近一次错误
    bool finished = false;     // finish()已经调用过
};

using codec_strm_ptr = std::unique_ptr<codec_stream>;

// 负数级别使用后端默认值。格式不支持或后端不接受级别时返回nullptr。
codec_strm_ptr get_encoder(format_t type, stream_ptr &&base, int level = -1);
codec_strm_ptr get_decoder(format_t type, stream_ptr &&base);

// 编解码方向
enum codec_dir {
    COMPRESS,     // 压缩
    DECOMPRESS,   // 解压缩
};

// 在编解码流之上的“输入一块、输出一块”适配器
class chunk_codec {
public:
    // encoding是文本边界的字符集：压缩时输入从UTF-8转换到它，
    // 解压时输出从它转换到UTF-8。
    static std::unique_ptr<chunk_codec> make(format_t fmt, codec_dir dir, int level = -1,
                                             const char *encoding = nullptr, err_t *err = nullptr);

    chunk_codec(const chunk_codec &) = delete;
    chunk_codec &operator=(const chunk_codec &) = delete;

    // 变换一块数据。out被替换为后端产生的输出，可能为空。
    bool feed(const void *buf, size_t len, std::string &out);
    bool feed(const std::string &buf, std::string &out) {
        return feed(buf.data(), buf.size(), out);
    }

    // 最终输出；在最后一次feed之后恰好调用一次
    bool flush(std::string &out);

    err_t error() const { return err; }

private:
    explicit chunk_codec(codec_dir dir) : dir(dir), flushed(false), err(ERR_NONE) {}

    bool fail(err_t e);
    bool take(std::string &out);

    codec_dir dir;                        // 编解码方向
    bool flushed;                         // flush()已经调用过
    err_t err;                            // 最近一次错误
    std::string sink;                     // 编解码流的输出
    std::string text_buf;                 // 压缩前转换好的文本
    codec_strm_ptr strm;                  // 后端编解码流
    std::unique_ptr<transcoder> text;     // 字符集转换，可为空
};

// 拉取下一块输入；输入结束时返回false
using chunk_source = std::function<bool(std::string &chunk)>;
// 接收一块输出；输出端无法接收时返回false
using chunk_sink = std::function<bool(const std::string &chunk)>;

// 每块输入输出一块（可能为空），最后恰好输出一块flush的结果。
// 不支持的格式在第一次拉取之前就失败。
err_t compress(const chunk_source &next, const chunk_sink &emit, format_t fmt,
               const char *encoding = nullptr, int level = DEFAULT_LEVEL);
err_t decompress(const chunk_source &next, const chunk_sink &emit, format_t fmt,
                 const char *encoding = nullptr);
