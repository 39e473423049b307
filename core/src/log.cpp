#include "log.h"

#include <cstdio>
#include <cstring>

namespace PageView {

void logMsg(const char* level, const char* file, int line, const std::string& msg) {
    // Strip the directory part of __FILE__
    const char* slash = std::strrchr(file, '/');
    const char* filename = slash ? slash + 1 : file;

    fmt::print(stderr, "{} {}:{}: {}\n", level, filename, line, msg);
}

}
