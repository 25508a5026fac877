#pragma once
/**
 * @file errors.hpp
 * @brief Error codes for clipboard transfers
 *
 */

#include <boost/system/error_code.hpp>

#include <string>
#include <type_traits>

namespace osc52 {

struct ErrCategory : boost::system::error_category
{
    char const* name() const noexcept override;
    std::string message(int) const override;
};

extern ErrCategory const theErrCategory;

enum class Errc
{
    Succeeded = 0,
    // Local I/O
    ReadFailed,
    WriteFailed,
    // Terminal replies
    InvalidEncodedData,
    // Caller initiated
    AbortedByUser,
    TerminatedBySignal,
};

auto make_error_code(Errc) -> boost::system::error_code;

} // namespace osc52

namespace boost::system {
template <>
struct is_error_code_enum<osc52::Errc> : std::true_type {};
}
