#include "event_loop.hpp"

#include "canvas.hpp"
#include "common.hpp"
#include "input.hpp"
#include "markup.hpp"

// C++ includes
#include <stdexcept>

// C includes
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <string.h>

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static volatile sig_atomic_t __interrupted = 0;

// SIGINT and SIGTERM stay blocked except while waiting in ppoll(), which unblocks them with this mask
static sigset_t __wait_mask;
static bool __signals_blocked = false;

static void handle_signal(int signal) {
    (void) signal;
    __interrupted = 1;
}

static bool interrupt_pending() {
    if (__interrupted) return true;
    if (!__signals_blocked) return false;

    sigset_t pending;
    if (sigpending(&pending) == -1) return false;

    return sigismember(&pending, SIGINT) == 1 || sigismember(&pending, SIGTERM) == 1;
}

EventLoop::EventLoop(const BarConfig &config, Canvas &canvas) : __config(config), __canvas(canvas) {}

void EventLoop::install_signal_handlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) == -1 || sigaction(SIGTERM, &action, nullptr) == -1) {
        throw std::runtime_error(format("sigaction failed: %s", strerror(errno)));
    }

    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);

    if (sigprocmask(SIG_BLOCK, &blocked, &__wait_mask) == -1) {
        throw std::runtime_error(format("sigprocmask failed: %s", strerror(errno)));
    }

    sigdelset(&__wait_mask, SIGINT);
    sigdelset(&__wait_mask, SIGTERM);
    __signals_blocked = true;
}

int EventLoop::run(Client &client, LineReader &input) {
    infof("Entering the event loop (mode: %s, dismiss on click: %s)",
          __config.mode == BarConfig::Mode::PLAIN ? "plain" : "markup", __config.dismiss_on_click ? "yes" : "no");

    while (__state != State::TERMINATED) {
        if (interrupt_pending()) {
            infof("Interrupted, shutting down");
            terminate(0);
            break;
        }

        try {
            if (!step(client, input) && __state != State::TERMINATED) {
                __state = State::IDLE;
                wait(client, input);
            }
        } catch (const ProtocolError &error) {
            errorf("Protocol error received: %s", error.what());
            terminate(1);
        } catch (const ConnectionError &error) {
            errorf("%s", error.what());
            terminate(1);
        }
    }

    return __status;
}

// One iteration, returns false when neither source had anything to do
bool EventLoop::step(Client &client, LineReader &input) {
    bool busy = false;

    if (std::optional<Event> event = client.poll_event()) {
        __state = State::DRAINING;
        busy = true;

        handle(*event);
        if (__state == State::TERMINATED) return true;
    }

    if (input.poll()) {
        __state = State::DRAINING;
        busy = true;

        if (std::optional<std::string> line = input.settle(settle_delay)) handle_line(*line);
    }

    client.flush();

    return busy;
}

void EventLoop::handle(const Event &event) {
    std::visit(overloaded {
        [this](const ExposeEvent &expose) {
            tracef("Expose on window 0x%x (count: %u)", expose.window, expose.count);
            __canvas.present();
        },
        [this](const ButtonPressEvent &press) {
            tracef("Button %u pressed on window 0x%x", press.button, press.window);
            if (__config.dismiss_on_click) {
                infof("Bar clicked, shutting down");
                terminate(0);
            }
        },
        [](const OtherEvent &other) {
            tracef("Ignoring event %u", other.response_type);
        },
    }, event);
}

void EventLoop::handle_line(const std::string &line) {
    if (line.empty()) return;

    tracef("Input: %s", line.c_str());

    __canvas.clear();

    if (__config.mode == BarConfig::Mode::PLAIN) {
        __canvas.draw_plain(line);
        return;
    }

    __canvas.draw(parse_markup(line));
}

void EventLoop::terminate(int status) {
    __state = State::TERMINATED;
    __status = status;
}

// Blocks until the X connection or the input has something to read
void EventLoop::wait(Client &client, LineReader &input) {
    struct pollfd fds[2] = {
        { client.fd(), POLLIN, 0 },
        { input.fd(), POLLIN, 0 },
    };

    nfds_t count = input.eof() ? 1 : 2;

    if (ppoll(fds, count, nullptr, __signals_blocked ? &__wait_mask : nullptr) == -1 && errno != EINTR) {
        throw std::runtime_error(format("ppoll failed: %s", strerror(errno)));
    }
}
