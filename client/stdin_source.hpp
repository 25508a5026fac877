#pragma once
/**
 * @file stdin_source.hpp
 * @brief Standard input as the payload of a clipboard write
 *
 */

#include <osc52/input_pump.hpp>

#include <cstddef>
#include <span>

class StdinSource final : public osc52::Source
{
    int fd_;
    bool interactive_;

public:
    explicit StdinSource(int fd);

    auto interactive() const -> bool override
    {
        return interactive_;
    }

    /// Blocking read; only called once the loop saw the descriptor readable
    /// or the descriptor can't block (a regular file).
    auto read_some(std::span<char> buffer, boost::system::error_code& ec) -> std::size_t override;
};
