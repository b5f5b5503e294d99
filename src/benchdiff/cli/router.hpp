#pragma once

namespace benchdiff::cli {

// Routes `benchdiff` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => manifest missing or invalid
//   30 => regressions found with --fail-on-regression
int Dispatch(int argc, char** argv);

} // namespace benchdiff::cli
