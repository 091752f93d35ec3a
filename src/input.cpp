#include "input.hpp"

#include "common.hpp"

// C++ includes
#include <algorithm>
#include <stdexcept>
#include <thread>

// C includes
#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

LineReader::LineReader(int fd) : __fd(fd) {}

bool LineReader::poll() {
    if (has_line()) return true;
    if (__eof) return false;

    read_available();

    return has_line();
}

std::optional<std::string> LineReader::next_line() {
    size_t newline = __buffer.find('\n');

    if (newline == std::string::npos) {
        // The last line of a stream is allowed to miss its newline
        if (!__eof || __buffer.empty()) return std::nullopt;
        newline = __buffer.size();
    }

    std::string line = __buffer.substr(0, newline);
    __buffer.erase(0, std::min(newline + 1, __buffer.size()));

    return line;
}

std::optional<std::string> LineReader::settle(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);

    if (!__eof) read_available();

    std::optional<std::string> newest;
    while (std::optional<std::string> line = next_line()) {
        if (!line->empty() || !newest) newest = std::move(line);
    }

    return newest;
}

bool LineReader::has_line() const {
    return __buffer.find('\n') != std::string::npos || (__eof && !__buffer.empty());
}

void LineReader::read_available() {
    char chunk[4096];

    while (true) {
        struct pollfd pfd = { __fd, POLLIN, 0 };

        int ready = ::poll(&pfd, 1, 0);
        if (ready == -1) {
            if (errno == EINTR) continue;
            throw std::runtime_error(format("poll on fd %d failed: %s", __fd, strerror(errno)));
        }

        if (ready == 0) return;

        if (pfd.revents & POLLNVAL) throw std::runtime_error(format("fd %d is not open", __fd));

        ssize_t count = read(__fd, chunk, sizeof(chunk));
        if (count == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw std::runtime_error(format("read on fd %d failed: %s", __fd, strerror(errno)));
        }

        if (count == 0) {
            tracef("Reached the end of input on fd %d", __fd);
            __eof = true;
            return;
        }

        __buffer.append(chunk, count);

        // Stop once a line is complete so a steady stream of input cannot starve the caller
        if (__buffer.find('\n') != std::string::npos) return;
    }
}
