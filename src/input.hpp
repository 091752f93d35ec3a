#pragma once

// C++ includes
#include <chrono>
#include <optional>
#include <string>

// Reads whole lines from a file descriptor without ever blocking on it
class LineReader {
public:

    explicit LineReader(int fd);

    int fd() const { return __fd; }
    bool eof() const { return __eof; }

    // Zero timeout readiness check, true when a complete line is buffered afterwards
    bool poll();

    // Pops the oldest complete line, without its trailing newline
    std::optional<std::string> next_line();

    // Waits for the given delay, then drains everything that arrived and returns the newest non-empty line
    std::optional<std::string> settle(std::chrono::milliseconds delay);

private:

    int __fd;
    bool __eof = false;
    std::string __buffer;

    bool has_line() const;
    void read_available();

};
