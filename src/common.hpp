#pragma once

// C++ includes
#include <string>

// C includes
#include <stdio.h>
#include <stdlib.h>

#define eprintf(format, ...) fprintf(stderr, format, ##__VA_ARGS__)

#define ANSI_RGB_F "\e[38;2;%d;%d;%dm"
#define ANSI_RGB_ARG(r, g, b) r, g, b
#define ANSI_RESET "\e[0m"

void __logf(const char *level, int r, int g, int b, const char *format, ...) __attribute__((format(printf, 5, 6)));

void set_log_verbose(bool verbose);
bool log_verbose();

#define fatalf(format, ...) __logf("FATAL", 127, 0, 0, format, ##__VA_ARGS__)
#define errorf(format, ...) __logf("ERROR", 255, 63, 63, format, ##__VA_ARGS__)
#define warnf(format, ...)  __logf("WARN", 255, 191, 0, format, ##__VA_ARGS__)
#define infof(format, ...)  __logf("INFO", 0, 255, 127, format, ##__VA_ARGS__)
#define tracef(format, ...) do { \
    if (log_verbose()) __logf("TRACE", 127, 127, 127, format, ##__VA_ARGS__); \
} while (0)

#define dief(why, ...) do { \
    fatalf(why, ##__VA_ARGS__); \
    exit(1); \
} while (0)

std::string format(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
