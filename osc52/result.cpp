#include "osc52/result.hpp"

#include "osc52/errors.hpp"
#include "osc52/transfer.hpp"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ostream>

namespace osc52 {

auto deliver(TransferState const& state, std::ostream& out, std::ostream& err) -> int
{
    switch (state.phase)
    {
    case Phase::Completed:
        if (state.received_payload && not state.received_payload->empty())
        {
            auto const& payload = *state.received_payload;
            out.write(payload.data(), payload.size());
            out.flush();
            if (not out)
            {
                err << "termclip: " << make_error_code(Errc::WriteFailed).message() << std::endl;
                return EXIT_FAILURE;
            }
        }
        return EXIT_SUCCESS;

    case Phase::Aborted:
    case Phase::Failed:
        if (0 != state.signal)
        {
            auto const name = strsignal(state.signal);
            err << "Killed by signal: " << (name ? name : "unknown") << std::endl;
            return 128 + state.signal;
        }
        err << "termclip: " << (state.error ? state.error->description : "transfer failed") << std::endl;
        return EXIT_FAILURE;

    default:
        err << "termclip: transfer ended while " << state.phase << std::endl;
        return EXIT_FAILURE;
    }
}

auto reraise_signal(int const signo) -> void
{
    std::signal(signo, SIG_DFL);
    std::raise(signo);
}

} // namespace osc52
