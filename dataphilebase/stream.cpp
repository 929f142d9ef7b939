// 流抽象实现文件

#include <unistd.h>
#include <cstddef>
#include <cstring>
#include <algorithm>

#include <base.hpp>

using namespace std;

// 默认实现：不支持读取
ssize_t stream::read(void *buf, size_t len)  {
    LOGE("This stream does not implement read\n");
    return -1;
}

bool stream::write(const void *buf, size_t len) {
    LOGE("This stream does not implement write\n");
    return false;
}

ssize_t filter_stream::read(void *buf, size_t len) {
    return base->read(buf, len);
}

bool filter_stream::write(const void *buf, size_t len) {
    return base->write(buf, len);
}

ssize_t byte_stream::read(void *buf, size_t len) {
    len = std::min(len, _data.size() - _pos);
    memcpy(buf, _data.data() + _pos, len);
    _pos += len;
    return len;
}

bool byte_stream::write(const void *buf, size_t len) {
    _data.append(static_cast<const char *>(buf), len);
    return true;
}

// 循环写入，直到全部写完或出错
bool file_stream::write(const void *buf, size_t len) {
    size_t write_sz = 0;
    ssize_t ret;
    do {
        ret = do_write((byte *) buf + write_sz, len - write_sz);
        if (ret < 0) {
            if (errno == EINTR)
                continue;    // 被信号打断，重试
            return false;
        }
        write_sz += ret;
    } while (write_sz != len && ret != 0);
    return true;
}

ssize_t fd_stream::read(void *buf, size_t len) {
    return ::read(fd, buf, len);
}

ssize_t fd_stream::do_write(const void *buf, size_t len) {
    return xwrite(fd, buf, len);
}

ssize_t fp_stream::read(void *buf, size_t len) {
    if (feof(fp.get()))
        clearerr(fp.get());    // 重新读取追加的数据
    size_t ret = fread(buf, 1, len, fp.get());
    if (ret == 0 && ferror(fp.get())) {
        int err = errno;
        clearerr(fp.get());
        errno = err;           // 保留原始错误码
        return -1;
    }
    return ret;
}

ssize_t fp_stream::do_write(const void *buf, size_t len) {
    size_t ret = fwrite(buf, 1, len, fp.get());
    if (ret == 0 && ferror(fp.get()))
        return -1;
    return ret;
}
