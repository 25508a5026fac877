#include "configuration.hpp"

#include <cstdlib>
#include <iostream>
#include <unistd.h>

[[noreturn]] static void usage(int const status)
{
    (EXIT_SUCCESS == status ? std::cout : std::cerr) <<
    "usage: termclip [-g] [-p] [-w] [-h]\n"
    "\n"
    "Copy standard input to the terminal's clipboard, or with -g print\n"
    "the clipboard contents on standard output.\n"
    "\n"
    "  -g    get the clipboard contents from the terminal\n"
    "  -p    use the primary selection instead of the clipboard\n"
    "  -w    wait for the terminal to acknowledge the copy\n"
    "  -h    show this help\n"
    "\n"
    "Environment:\n"
    "  TERMCLIP_TTY    terminal device (default /dev/tty)\n";
    exit(status);
}

auto load_configuration(int argc, char** argv) -> configuration
{
    configuration cfg {};

    cfg.tty_path = getenv("TERMCLIP_TTY");
    if (nullptr == cfg.tty_path || '\0' == *cfg.tty_path) {
        cfg.tty_path = "/dev/tty";
    }

    char const* const flags = ":ghpw";
    int opt;
    while ((opt = getopt(argc, argv, flags)) != -1) {
        switch (opt) {
        default:
        case '?': std::cerr << "Unknown flag: " << char(optopt) << std::endl; usage(EXIT_FAILURE);
        case 'h': usage(EXIT_SUCCESS);
        case 'g': cfg.get_clipboard         = true; break;
        case 'p': cfg.use_primary           = true; break;
        case 'w': cfg.wait_for_completion   = true; break;
        }
    }

    argv += optind;
    argc -= optind;

    if (0 != argc) {
        std::cerr << "Unexpected positional argument: " << argv[0] << std::endl;
        usage(EXIT_FAILURE);
    }

    return cfg;
}

auto transfer_options(configuration const& cfg) -> osc52::TransferOptions
{
    return {
        .use_secondary_selection = cfg.use_primary,
        .request_from_terminal = cfg.get_clipboard,
        .wait_for_ack = cfg.wait_for_completion,
    };
}
