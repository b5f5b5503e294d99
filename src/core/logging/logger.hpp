#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>

namespace benchdiff::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

// `kKeyValue` is the default operator-facing format. `kGithubActions` maps
// levels onto workflow commands so CI annotates warnings and errors inline.
enum class LogFormat {
  kKeyValue,
  kGithubActions,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline std::string ExpectedLogFormatList() {
  return "kv|github";
}

inline std::string ToLowerAscii(std::string_view raw) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return normalized;
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  const std::string normalized = ToLowerAscii(raw);
  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid --log-level '" + std::string(raw) +
          "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

inline bool ParseLogFormat(std::string_view raw, LogFormat& format, std::string& error) {
  error.clear();

  const std::string normalized = ToLowerAscii(raw);
  if (normalized == "kv") {
    format = LogFormat::kKeyValue;
    return true;
  }
  if (normalized == "github") {
    format = LogFormat::kGithubActions;
    return true;
  }

  error = "invalid --log-format '" + std::string(raw) +
          "' (expected " + ExpectedLogFormatList() + ")";
  return false;
}

class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetFormat(LogFormat format) {
    format_ = format;
  }

  LogFormat Format() const {
    return format_;
  }

  // Unit currently being processed; "-" when no unit is active.
  void SetUnit(std::string unit) {
    unit_ = unit.empty() ? std::string("-") : std::move(unit);
  }

  void ClearUnit() {
    unit_ = "-";
  }

  const std::string& Unit() const {
    return unit_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    if (format_ == LogFormat::kGithubActions) {
      WriteGithubLine(level, message, fields);
      return;
    }

    (*out_) << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
            << " level=" << ToString(level)
            << " unit=" << Quote(unit_)
            << " msg=" << Quote(message);

    for (const auto& field : fields) {
      (*out_) << ' ' << field.key << '=' << Quote(field.value);
    }

    (*out_) << '\n';
    out_->flush();
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

  // Collapsible sections in CI logs. Groups do not nest.
  void BeginGroup(std::string_view title) {
    if (format_ == LogFormat::kGithubActions) {
      (*out_) << "::group::" << EscapeWorkflowData(title) << '\n';
      out_->flush();
      return;
    }
    Info("group begin", {{"title", title}});
  }

  void EndGroup() {
    if (format_ == LogFormat::kGithubActions) {
      (*out_) << "::endgroup::\n";
      out_->flush();
      return;
    }
    Info("group end");
  }

private:
  void WriteGithubLine(LogLevel level, std::string_view message,
                       std::initializer_list<LogFieldView> fields) {
    switch (level) {
    case LogLevel::kDebug:
      (*out_) << "::debug::";
      break;
    case LogLevel::kWarn:
      (*out_) << "::warning::";
      break;
    case LogLevel::kError:
      (*out_) << "::error::";
      break;
    case LogLevel::kInfo:
      break;
    }

    if (unit_ != "-") {
      (*out_) << '[' << EscapeWorkflowData(unit_) << "] ";
    }
    (*out_) << EscapeWorkflowData(message);
    for (const auto& field : fields) {
      (*out_) << ' ' << field.key << '=' << EscapeWorkflowData(field.value);
    }
    (*out_) << '\n';
    out_->flush();
  }

  // Workflow commands are line-oriented; `%`, CR and LF must be percent-encoded.
  static std::string EscapeWorkflowData(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());
    for (const char c : raw) {
      switch (c) {
      case '%':
        escaped += "%25";
        break;
      case '\r':
        escaped += "%0D";
        break;
      case '\n':
        escaped += "%0A";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }
    return escaped;
  }

  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  LogLevel min_level_ = LogLevel::kInfo;
  LogFormat format_ = LogFormat::kKeyValue;
  std::ostream* out_ = &std::cerr;
  std::string unit_ = "-";
};

} // namespace benchdiff::core::logging
