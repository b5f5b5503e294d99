#ifndef BENCHDIFF_TESTS_COMMON_CLI_DISPATCH_HPP_
#define BENCHDIFF_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "benchdiff/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace benchdiff::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return benchdiff::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs the router with stdout and stderr redirected into strings.
inline int DispatchWithCapturedStreams(const std::vector<std::string>& argv_storage,
                                       std::string& stdout_text, std::string& stderr_text) {
  std::ostringstream captured_stdout;
  std::ostringstream captured_stderr;
  std::streambuf* original_stdout = std::cout.rdbuf(captured_stdout.rdbuf());
  std::streambuf* original_stderr = std::cerr.rdbuf(captured_stderr.rdbuf());
  const int exit_code = DispatchArgs(argv_storage);
  std::cout.rdbuf(original_stdout);
  std::cerr.rdbuf(original_stderr);
  stdout_text = captured_stdout.str();
  stderr_text = captured_stderr.str();
  return exit_code;
}

} // namespace benchdiff::tests::common

#endif // BENCHDIFF_TESTS_COMMON_CLI_DISPATCH_HPP_
