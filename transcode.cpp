// 字符集转换实现文件

#include <cerrno>

#include <base.hpp>

#include "transcode.hpp"

using namespace std;

// 创建转换器
unique_ptr<transcoder> transcoder::make(const char *from, const char *to) {
    iconv_t cd = iconv_open(to, from);
    if (cd == (iconv_t) -1) {
        LOGW("Unknown text encoding conversion [%s] -> [%s]\n", from, to);
        return nullptr;
    }
    return unique_ptr<transcoder>(new transcoder(cd));
}

transcoder::~transcoder() {
    iconv_close(cd);
}

// 转换尽可能多的输入，输出缓冲区满时继续
bool transcoder::convert(char **in, size_t *inleft, string &out) {
    char outbuf[4096];
    for (;;) {
        char *op = outbuf;
        size_t outleft = sizeof(outbuf);
        size_t ret = iconv(cd, in, inleft, &op, &outleft);
        out.append(outbuf, op - outbuf);
        if (ret != (size_t) -1)
            return true;
        switch (errno) {
        case E2BIG:
            // 输出缓冲区已满，继续
            continue;
        case EINVAL:
            // 输入末尾的序列不完整
            return true;
        default:
            return false;    // 无效序列
        }
    }
}

bool transcoder::feed(const void *buf, size_t len, string &out) {
    carry.append(static_cast<const char *>(buf), len);
    char *in = carry.data();
    size_t inleft = carry.size();
    if (!convert(&in, &inleft, out)) {
        LOGW("Invalid multibyte sequence in text\n");
        return false;
    }
    carry.erase(0, carry.size() - inleft);    // 只保留未转换的部分
    return true;
}

bool transcoder::flush(string &out) {
    if (!carry.empty()) {
        LOGW("Incomplete multibyte sequence at end of text (%zu bytes)\n", carry.size());
        return false;
    }
    // 有状态编码需要输出结尾的移位序列
    char outbuf[64];
    char *op = outbuf;
    size_t outleft = sizeof(outbuf);
    if (iconv(cd, nullptr, nullptr, &op, &outleft) == (size_t) -1)
        return false;
    out.append(outbuf, op - outbuf);
    return true;
}
