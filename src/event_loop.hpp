#pragma once

#include "client.hpp"
#include "config.hpp"

// C++ includes
#include <chrono>
#include <string>

// Forward declaration
class Canvas;
class LineReader;

class EventLoop {
public:

    enum class State {
        IDLE,
        DRAINING,
        TERMINATED,
    };

    // Lines arriving within this delay of each other are drawn once
    static constexpr std::chrono::milliseconds settle_delay { 100 };

    EventLoop(const BarConfig &config, Canvas &canvas);

    // SIGINT and SIGTERM end run() with status 0
    static void install_signal_handlers();

    // Returns the exit status of the process
    int run(Client &client, LineReader &input);

    void handle(const Event &event);
    void handle_line(const std::string &line);

    void terminate(int status);

    State state() const { return __state; }
    int status() const { return __status; }

private:

    const BarConfig &__config;
    Canvas &__canvas;

    State __state = State::IDLE;
    int __status = 0;

    bool step(Client &client, LineReader &input);
    void wait(Client &client, LineReader &input);

};
