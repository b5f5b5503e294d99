#include "report/cell_format.hpp"

#include "compare/delta_calculator.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <sstream>

namespace benchdiff::report {

std::string FormatWithThousands(std::uint64_t value) {
  const std::string digits = std::to_string(value);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3U);

  const std::size_t lead = digits.size() % 3U;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0U && (i % 3U) == lead) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

std::string FormatSignedWithThousands(std::int64_t value) {
  if (value < 0) {
    // Negate in unsigned space so INT64_MIN survives.
    const std::uint64_t magnitude = 0U - static_cast<std::uint64_t>(value);
    return "-" + FormatWithThousands(magnitude);
  }
  return "+" + FormatWithThousands(static_cast<std::uint64_t>(value));
}

std::string FormatThresholdPercent(double threshold_fraction) {
  std::string text = core::FormatFixedDouble(threshold_fraction * 100.0, 4);
  const std::size_t dot = text.find('.');
  if (dot == std::string::npos) {
    return text;
  }
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

std::string FormatDiffCell(const compare::MetricDelta& delta) {
  switch (delta.percent.kind) {
  case compare::PercentKind::kBothZero:
    return "-";
  case compare::PercentKind::kInfiniteIncrease:
    return "+100% 🚀";
  case compare::PercentKind::kFullDecrease:
    return "-100% 🗑️";
  case compare::PercentKind::kFinite:
    break;
  }

  if (compare::IsBelowDisplayFloor(delta)) {
    return "-";
  }

  const double percent = delta.percent.fraction * 100.0;
  const char* sign = delta.absolute > 0 ? "+" : "-";
  std::ostringstream out;
  out << FormatSignedWithThousands(delta.absolute) << " (" << sign
      << core::FormatFixedDouble(std::fabs(percent), 2) << "%)";
  return out.str();
}

std::string EscapeHtml(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '&':
      out << "&amp;";
      break;
    case '<':
      out << "&lt;";
      break;
    case '>':
      out << "&gt;";
      break;
    case '"':
      out << "&quot;";
      break;
    case '\'':
      out << "&#39;";
      break;
    default:
      out << ch;
      break;
    }
  }
  return out.str();
}

} // namespace benchdiff::report
