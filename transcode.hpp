// 字符集转换头文件，在编解码的文本边界上增量转换
#pragma once

#include <iconv.h>
#include <memory>
#include <string>

// 字符集转换器
class transcoder {
public:
    // iconv不认识其中一个字符集时返回nullptr
    static std::unique_ptr<transcoder> make(const char *from, const char *to);
    ~transcoder();

    transcoder(const transcoder &) = delete;
    transcoder &operator=(const transcoder &) = delete;

    // 转换一块数据。被块边界截断的多字节序列留到下一次调用，
    // 遇到无效序列时失败。
    bool feed(const void *buf, size_t len, std::string &out);

    // 留下的序列最终不完整时失败
    bool flush(std::string &out);

private:
    explicit transcoder(iconv_t cd) : cd(cd) {}

    bool convert(char **in, size_t *inleft, std::string &out);

    iconv_t cd;            // iconv转换描述符
    std::string carry;     // 尚未转换的字节
};
