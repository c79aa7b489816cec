#include "cligate/cli/commands.hpp"

int main(int argc, char **argv) { return cligate::cli::run_cli(argc, argv); }
