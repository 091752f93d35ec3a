#include "common.hpp"
#include "bar.hpp"
#include "canvas.hpp"
#include "client.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "input.hpp"

#include "barney.hpp"

// C includes
#include <unistd.h>

static int run(const BarConfig &config) {
    Client client;

    Bar bar(client, config);
    bar.set_ewmh();

    std::unique_ptr<Canvas> canvas = bar.create_canvas();
    canvas->clear();

    bar.show();

    LineReader input(STDIN_FILENO);
    EventLoop loop(config, *canvas);
    EventLoop::install_signal_handlers();

    return loop.run(client, input);
}

int main(int argc, char *argv[]) {
    CommandLine command_line;

    try {
        command_line = CommandLine::parse(argc, argv);
    } catch (const std::invalid_argument &e) {
        eprintf("barney: %s\n\n%s", e.what(), usage());
        return 2;
    }

    switch (command_line.action) {
        case CommandLine::Action::HELP:
            printf("%s", usage());
            return 0;
        case CommandLine::Action::VERSION:
            printf("barney " BARNEY_VERSION "\n");
            return 0;
        case CommandLine::Action::RUN:
            break;
    }

    set_log_verbose(command_line.config.verbose);

    try {
        infof("Starting barney v" BARNEY_VERSION);

        int status = run(command_line.config);

        infof("Exiting with status %d", status);
        return status;
    } catch (const std::exception &e) {
        dief("%s", e.what());
    }
}
