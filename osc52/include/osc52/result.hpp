#pragma once
/**
 * @file result.hpp
 * @brief Reporting the outcome of a finished transfer
 *
 */

#include <iosfwd>

namespace osc52 {

struct TransferState;

/**
 * @brief Write the transfer's outcome and compute the exit status
 *
 * Received selection contents are written to out byte for byte with
 * nothing appended. Failures are reported on err.
 *
 * @param state Final transfer state
 * @param out Payload sink
 * @param err Diagnostic stream
 * @return Process exit status
 */
auto deliver(TransferState const& state, std::ostream& out, std::ostream& err) -> int;

/**
 * @brief Die by the signal that terminated the transfer
 *
 * Restores the default disposition and raises signo so the parent sees
 * a signal death. Returns only if the signal did not end the process.
 *
 * @param signo Signal number
 */
auto reraise_signal(int signo) -> void;

} // namespace osc52
