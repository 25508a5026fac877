#include "osc52/input_pump.hpp"

#include <boost/asio/error.hpp>

namespace osc52 {

auto InputPump::pull(std::string& output, boost::system::error_code& ec) -> PumpStatus
{
    ec = {};

    if (finished_)
    {
        return PumpStatus::Finished;
    }

    if (source_.interactive())
    {
        encoder_.close(output);
        finished_ = true;
        return PumpStatus::Finished;
    }

    auto const n = source_.read_some(buffer_, ec);
    if (n > 0)
    {
        encoder_.write({buffer_.data(), n}, output);
    }

    if (boost::asio::error::eof == ec)
    {
        ec = {};
        encoder_.close(output);
        finished_ = true;
        return PumpStatus::Finished;
    }

    if (boost::asio::error::would_block == ec || boost::asio::error::try_again == ec)
    {
        ec = {};
        return n > 0 ? PumpStatus::Data : PumpStatus::Pending;
    }

    if (ec)
    {
        finished_ = true;
        return PumpStatus::Finished;
    }

    return n > 0 ? PumpStatus::Data : PumpStatus::Pending;
}

} // namespace osc52
