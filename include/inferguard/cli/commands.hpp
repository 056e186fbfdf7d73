#pragma once

namespace inferguard::cli {

/// Entry point of the `inferguard` command line. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace inferguard::cli
