#pragma once
/**
 * @file configuration.hpp
 * @brief Command-line application configuration
 *
 */

#include <osc52/transfer.hpp>

struct configuration
{
    bool get_clipboard;
    bool use_primary;
    bool wait_for_completion;
    char const* tty_path;
};

/**
 * @brief Process command-line arguments.
 *
 * This function consumes the command-line arguments.
 *
 * On error this function prints usage and terminates the process.
 *
 * @param argc Number of arguments
 * @param argv Pointer to arguments
 * @return configuration Populated configuration value.
 */
auto load_configuration(int argc, char** argv) -> configuration;

auto transfer_options(configuration const& cfg) -> osc52::TransferOptions;
