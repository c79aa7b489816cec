#pragma once

namespace cligate::cli {

/// Entry point of the `cligate` executable; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace cligate::cli
