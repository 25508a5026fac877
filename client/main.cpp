#include "app.hpp"
#include "configuration.hpp"
#include "stdin_source.hpp"
#include "tty.hpp"

#include <osc52/result.hpp>
#include <osc52/transfer.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <unistd.h>

auto main(int argc, char* argv[]) -> int
{
    auto const cfg = load_configuration(argc, argv);
    auto source = StdinSource{STDIN_FILENO};
    osc52::TransferState state;
    boost::system::error_code tty_error;

    try
    {
        // the terminal is back in its original mode before anything is reported
        auto const tty = Tty{cfg.tty_path};
        auto app = App{tty.fd(), STDIN_FILENO};
        auto transfer = osc52::Transfer{transfer_options(cfg), source, app};
        app.run(transfer);
        state = transfer.state();
        tty_error = app.tty_error();
    }
    catch (std::exception const& e)
    {
        std::cerr << "termclip: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (tty_error)
    {
        std::cerr << "termclip: terminal: " << tty_error.message() << std::endl;
    }

    auto const status = osc52::deliver(state, std::cout, std::cerr);

    if (0 != state.signal)
    {
        osc52::reraise_signal(state.signal);
    }

    return status;
}
