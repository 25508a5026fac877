#include "osc52/errors.hpp"

namespace osc52 {

ErrCategory const theErrCategory;

char const* ErrCategory::name() const noexcept
{
    return "osc52";
}

std::string ErrCategory::message(int ev) const
{
    switch (static_cast<Errc>(ev))
    {
    case Errc::Succeeded:
        return "succeeded";
    case Errc::ReadFailed:
        return "failed to read from standard input";
    case Errc::WriteFailed:
        return "failed to write to standard output";
    case Errc::InvalidEncodedData:
        return "invalid encoded data from terminal";
    case Errc::AbortedByUser:
        return "aborted by user";
    case Errc::TerminatedBySignal:
        return "terminated by signal";
    default:
        return "(unrecognized error)";
    }
}

auto make_error_code(Errc const err) -> boost::system::error_code
{
    return boost::system::error_code{int(err), theErrCategory};
}

} // namespace osc52
