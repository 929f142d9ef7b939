// 杂项工具函数实现文件

#include <sys/stat.h>
#include <signal.h>
#include <cctype>
#include <cstdlib>

#include <base.hpp>

using namespace std;

atomic_bool interrupted(false);    // 中断标志

string_view trim(string_view s) {
    while (!s.empty() && isspace((unsigned char) s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isspace((unsigned char) s.back()))
        s.remove_suffix(1);
    return s;
}

bool check_env(const char *name) {
    const char *val = getenv(name);
    return val != nullptr && (val == "true"sv || val == "1"sv);
}

bool is_file(const char *path) {
    struct stat st{};
    return stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

// 信号处理函数
static void on_interrupt(int) {
    interrupted = true;
}

void install_interrupt_handler() {
    struct sigaction act{};
    act.sa_handler = on_interrupt;
    sigemptyset(&act.sa_mask);
    // 不设置SA_RESTART：阻塞的读取和睡眠需要看到中断标志
    act.sa_flags = 0;
    xsigaction(SIGINT, &act, nullptr);
    xsigaction(SIGTERM, &act, nullptr);
}
