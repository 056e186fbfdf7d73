#include "inferguard/cli/commands.hpp"

int main(int argc, char **argv) { return inferguard::cli::run_cli(argc, argv); }
