#pragma once

#include "cli_options.hpp"

#include <string>

namespace ble::dtm
{
int run_cli(const CLIOptions &options);

std::string usage();

} // namespace ble::dtm
