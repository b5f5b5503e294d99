#ifndef BENCHDIFF_CORE_JSON_UTILS_HPP_
#define BENCHDIFF_CORE_JSON_UTILS_HPP_

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace benchdiff::core {

// Shared JSON string escaping for result-file and summary writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Fixed-point formatting for JSON numbers. Callers must not pass NaN/Inf;
// JSON has no spelling for them.
inline std::string FormatFixedDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

} // namespace benchdiff::core

#endif // BENCHDIFF_CORE_JSON_UTILS_HPP_
