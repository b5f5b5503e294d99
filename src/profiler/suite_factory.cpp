#include "profiler/suite_factory.hpp"

#include "profiler/recorded_call_suite.hpp"

#include <algorithm>
#include <cctype>

namespace benchdiff::profiler {

bool CreateBenchmarkSuite(const std::filesystem::path& definition_path,
                          std::unique_ptr<IBenchmarkSuite>& suite, std::string& error) {
  suite.reset();

  std::string extension = definition_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (extension == ".json") {
    return RecordedCallSuite::Load(definition_path, suite, error);
  }

  error = "unsupported benchmark definition '" + definition_path.string() + "'" +
          (extension.empty() ? std::string(" (no file extension)")
                             : " (extension " + extension + ")") +
          "; supported: .json";
  return false;
}

} // namespace benchdiff::profiler
