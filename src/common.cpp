#include "common.hpp"

// C includes
#include <stdio.h>
#include <stdarg.h>

static bool __verbose = false;

void set_log_verbose(bool verbose) {
    __verbose = verbose;
}

bool log_verbose() {
    return __verbose;
}

void __logf(const char *level, int r, int g, int b, const char *format, ...) {
    fprintf(stderr, "[" ANSI_RGB_F "%s" ANSI_RESET "] ", ANSI_RGB_ARG(r, g, b), level);

    va_list args;
    va_start(args, format);
        vfprintf(stderr, format, args);
    va_end(args);

    fputc('\n', stderr);
}

std::string format(const char *fmt, ...) {
    va_list args;

    va_start(args, fmt);
        int length = vsnprintf(nullptr, 0, fmt, args);
    va_end(args);

    if (length <= 0) return std::string();

    std::string buffer(length, '\0');

    va_start(args, fmt);
        vsnprintf(buffer.data(), buffer.size() + 1, fmt, args);
    va_end(args);

    return buffer;
}
