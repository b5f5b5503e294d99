#ifndef BENCHDIFF_TESTS_COMMON_RESULT_FIXTURES_HPP_
#define BENCHDIFF_TESTS_COMMON_RESULT_FIXTURES_HPP_

#include "assertions.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace benchdiff::tests::common {

// Metric values for one function entry of a fixture result file. Gas is
// written as execution limits with zero teardown limits.
struct FixtureFunction {
  std::string name;
  std::uint64_t gates = 0;
  std::uint64_t da_gas = 0;
  std::uint64_t l2_gas = 0;
};

inline void WriteFixtureFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  if (!file_path.parent_path().empty()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      Fail("failed to create fixture directory: " + file_path.parent_path().string());
    }
  }

  std::ofstream output(file_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open fixture file for writing: " + file_path.string());
  }

  output << content;
  if (!output) {
    Fail("failed while writing fixture file: " + file_path.string());
  }
}

inline std::string BuildResultFileJson(const std::vector<FixtureFunction>& functions) {
  std::string json = "{\"results\":[";
  for (std::size_t i = 0; i < functions.size(); ++i) {
    const FixtureFunction& fn = functions[i];
    if (i != 0U) {
      json += ",";
    }
    json += "{\"name\":\"" + fn.name + "\",\"totalGateCount\":" + std::to_string(fn.gates) +
            ",\"gateCounts\":[],\"gas\":{\"gasLimits\":{\"daGas\":" + std::to_string(fn.da_gas) +
            ",\"l2Gas\":" + std::to_string(fn.l2_gas) +
            "},\"teardownGasLimits\":{\"daGas\":0,\"l2Gas\":0}}}";
  }
  json += "]}";
  return json;
}

// Writes `<dir>/<unit><suffix>.benchmark.json`.
inline std::filesystem::path WriteResultFile(const std::filesystem::path& dir,
                                             std::string_view unit, std::string_view suffix,
                                             const std::vector<FixtureFunction>& functions) {
  const std::filesystem::path path =
      dir / (std::string(unit) + std::string(suffix) + ".benchmark.json");
  WriteFixtureFile(path, BuildResultFileJson(functions));
  return path;
}

} // namespace benchdiff::tests::common

#endif // BENCHDIFF_TESTS_COMMON_RESULT_FIXTURES_HPP_
