#pragma once

#include "profiler/benchmark_suite.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace benchdiff::profiler {

// Creates the suite for a benchmark definition file, chosen by extension:
// - `.json`: RecordedCallSuite
// Any other kind is reported as unsupported.
bool CreateBenchmarkSuite(const std::filesystem::path& definition_path,
                          std::unique_ptr<IBenchmarkSuite>& suite, std::string& error);

} // namespace benchdiff::profiler
