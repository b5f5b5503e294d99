#include "config/toml_reader.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <set>
#include <system_error>
#include <utility>

namespace benchdiff::config {

namespace {

bool IsBareKeyChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// `1979-05-27`, `1979-05-27T07:32:00Z` or `07:32:00`.
bool LooksLikeDateTime(std::string_view token) {
  const bool date = token.size() >= 10 && IsDigit(token[0]) && IsDigit(token[3]) &&
                    token[4] == '-' && token[7] == '-';
  const bool time = token.size() >= 8 && IsDigit(token[0]) && IsDigit(token[1]) &&
                    token[2] == ':' && token[5] == ':';
  return date || time;
}

void AppendUtf8(std::uint32_t code_point, std::string& out) {
  if (code_point < 0x80U) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else if (code_point < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  }
}

// Single pass over the whole document. Values may span lines (arrays and
// multi-line strings), so the position and line counter are shared by every
// production.
class DocumentParser {
public:
  explicit DocumentParser(std::string_view text) : text_(text) {}

  bool Parse(TomlDocument& document, std::string& error) {
    document = TomlDocument{};
    document.sections.push_back(TomlSection{});
    std::set<std::string> seen_tables;
    std::set<std::string> seen_keys;

    while (true) {
      SkipFiller();
      if (AtEnd()) {
        return true;
      }

      if (Peek() == '[') {
        TomlSection section;
        section.line = line_;
        if (!ParseHeader(section, error)) {
          return false;
        }
        if (!section.array_of_tables && !seen_tables.insert(section.name).second) {
          line_ = section.line;
          return Fail("duplicate section [" + section.name + "]", error);
        }
        document.sections.push_back(std::move(section));
        seen_keys.clear();
        continue;
      }

      TomlEntry entry;
      if (!ParseKeyValue(entry, error)) {
        return false;
      }
      if (!seen_keys.insert(entry.key).second) {
        line_ = entry.line;
        return Fail("duplicate key '" + entry.key + "'", error);
      }
      document.sections.back().entries.push_back(std::move(entry));
      if (!ExpectLineEnd(error)) {
        return false;
      }
    }
  }

private:
  bool ParseHeader(TomlSection& section, std::string& error) {
    Advance();  // '['
    if (Match('[')) {
      section.array_of_tables = true;
    }
    SkipSpaces();
    if (!ParseDottedKey(section.name, error)) {
      return false;
    }
    SkipSpaces();
    if (!Match(']') || (section.array_of_tables && !Match(']'))) {
      return Fail(section.array_of_tables ? "expected ']]' to close array of tables header"
                                          : "expected ']' to close section header",
                  error);
    }
    return ExpectLineEnd(error);
  }

  bool ParseKeyValue(TomlEntry& entry, std::string& error) {
    entry = TomlEntry{};
    entry.line = line_;
    if (!ParseDottedKey(entry.key, error)) {
      return false;
    }
    SkipSpaces();
    if (!Match('=')) {
      return Fail("expected '=' after key '" + entry.key + "'", error);
    }
    SkipSpaces();
    return ParseValue(entry.value, error);
  }

  bool ParseDottedKey(std::string& key, std::string& error) {
    key.clear();
    while (true) {
      std::string segment;
      if (!ParseSimpleKey(segment, error)) {
        return false;
      }
      key += segment;
      SkipSpaces();
      if (!Match('.')) {
        return true;
      }
      key += '.';
      SkipSpaces();
    }
  }

  bool ParseSimpleKey(std::string& key, std::string& error) {
    key.clear();
    if (AtEnd()) {
      return Fail("expected key", error);
    }
    if (Peek() == '"') {
      return ParseBasicString(key, error);
    }
    if (Peek() == '\'') {
      return ParseLiteralString(key, error);
    }
    while (!AtEnd() && IsBareKeyChar(Peek())) {
      key += Advance();
    }
    if (key.empty()) {
      return Fail("invalid key", error);
    }
    return true;
  }

  bool ParseValue(TomlValue& value, std::string& error) {
    value = TomlValue{};
    if (AtEnd() || Peek() == '#' || Peek() == '\n' || Peek() == '\r') {
      return Fail("missing value", error);
    }

    switch (Peek()) {
    case '"':
      value.type = TomlValue::Type::kString;
      if (StartsWith("\"\"\"")) {
        return ParseMultilineBasicString(value.string_value, error);
      }
      return ParseBasicString(value.string_value, error);
    case '\'':
      value.type = TomlValue::Type::kString;
      if (StartsWith("'''")) {
        return ParseMultilineLiteralString(value.string_value, error);
      }
      return ParseLiteralString(value.string_value, error);
    case '[':
      return ParseArray(value, error);
    case '{':
      return ParseInlineTable(value, error);
    default:
      return ParseScalarToken(value, error);
    }
  }

  bool ParseEscape(std::string& output, std::string& error) {
    if (AtEnd()) {
      return Fail("unterminated escape sequence", error);
    }
    const char esc = Advance();
    switch (esc) {
    case '"':
      output.push_back('"');
      return true;
    case '\\':
      output.push_back('\\');
      return true;
    case 'b':
      output.push_back('\b');
      return true;
    case 'f':
      output.push_back('\f');
      return true;
    case 'n':
      output.push_back('\n');
      return true;
    case 't':
      output.push_back('\t');
      return true;
    case 'r':
      output.push_back('\r');
      return true;
    case 'u':
    case 'U': {
      const std::size_t width = esc == 'u' ? 4U : 8U;
      if (pos_ + width > text_.size()) {
        return Fail("truncated unicode escape", error);
      }
      std::uint32_t code_point = 0;
      const char* begin = text_.data() + pos_;
      const auto [ptr, ec] = std::from_chars(begin, begin + width, code_point, 16);
      if (ec != std::errc() || ptr != begin + width || code_point > 0x10FFFFU ||
          (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
        return Fail("invalid unicode escape", error);
      }
      pos_ += width;
      AppendUtf8(code_point, output);
      return true;
    }
    default:
      return Fail(std::string("unsupported escape sequence '\\") + esc + "'", error);
    }
  }

  bool ParseBasicString(std::string& output, std::string& error) {
    output.clear();
    Advance();  // opening quote
    while (true) {
      if (AtEnd() || Peek() == '\n') {
        return Fail("unterminated string", error);
      }
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (!ParseEscape(output, error)) {
        return false;
      }
    }
  }

  bool ParseLiteralString(std::string& output, std::string& error) {
    output.clear();
    Advance();  // opening quote
    while (true) {
      if (AtEnd() || Peek() == '\n') {
        return Fail("unterminated literal string", error);
      }
      const char c = Advance();
      if (c == '\'') {
        return true;
      }
      output.push_back(c);
    }
  }

  // A newline right after the opening delimiter is dropped. Up to two quote
  // characters may directly precede the closing delimiter.
  bool CloseMultiline(char quote, std::string& output) {
    std::size_t run = 0;
    while (pos_ + run < text_.size() && text_[pos_ + run] == quote && run < 5U) {
      ++run;
    }
    if (run < 3U) {
      return false;
    }
    output.append(run - 3U, quote);
    pos_ += run;
    return true;
  }

  void SkipOpeningNewline() {
    if (StartsWith("\r\n")) {
      Advance();
    }
    if (!AtEnd() && Peek() == '\n') {
      Advance();
    }
  }

  bool ParseMultilineBasicString(std::string& output, std::string& error) {
    output.clear();
    const std::size_t start_line = line_;
    pos_ += 3;
    SkipOpeningNewline();
    while (true) {
      if (AtEnd()) {
        line_ = start_line;
        return Fail("unterminated multi-line string", error);
      }
      if (Peek() == '"' && CloseMultiline('"', output)) {
        return true;
      }
      const char c = Advance();
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      // Line-ending backslash trims the newline and following whitespace.
      std::size_t probe = pos_;
      while (probe < text_.size() && (text_[probe] == ' ' || text_[probe] == '\t')) {
        ++probe;
      }
      if (probe < text_.size() && (text_[probe] == '\n' || text_[probe] == '\r')) {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
          Advance();
        }
        continue;
      }
      if (!ParseEscape(output, error)) {
        return false;
      }
    }
  }

  bool ParseMultilineLiteralString(std::string& output, std::string& error) {
    output.clear();
    const std::size_t start_line = line_;
    pos_ += 3;
    SkipOpeningNewline();
    while (true) {
      if (AtEnd()) {
        line_ = start_line;
        return Fail("unterminated multi-line literal string", error);
      }
      if (Peek() == '\'' && CloseMultiline('\'', output)) {
        return true;
      }
      output.push_back(Advance());
    }
  }

  bool ParseArray(TomlValue& value, std::string& error) {
    value.type = TomlValue::Type::kArray;
    const std::size_t start_line = line_;
    Advance();  // '['
    while (true) {
      SkipFiller();
      if (AtEnd()) {
        line_ = start_line;
        return Fail("unterminated array", error);
      }
      if (Match(']')) {
        return true;
      }

      TomlValue item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipFiller();
      if (Match(',')) {
        continue;
      }
      if (Match(']')) {
        return true;
      }
      if (AtEnd()) {
        line_ = start_line;
        return Fail("unterminated array", error);
      }
      return Fail("expected ',' or ']' in array", error);
    }
  }

  bool ParseInlineTable(TomlValue& value, std::string& error) {
    value.type = TomlValue::Type::kTable;
    Advance();  // '{'
    SkipSpaces();
    if (Match('}')) {
      return true;
    }

    std::set<std::string> keys;
    while (true) {
      SkipSpaces();
      TomlEntry entry;
      if (!ParseKeyValue(entry, error)) {
        return false;
      }
      if (!keys.insert(entry.key).second) {
        return Fail("duplicate key '" + entry.key + "' in inline table", error);
      }
      value.table_value.push_back(std::move(entry));

      SkipSpaces();
      if (Match('}')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' or '}' in inline table", error);
      }
      SkipSpaces();
      if (!AtEnd() && Peek() == '}') {
        return Fail("trailing comma in inline table", error);
      }
    }
  }

  bool ParseScalarToken(TomlValue& value, std::string& error) {
    const std::size_t start = pos_;
    while (!AtEnd() && Peek() != ',' && Peek() != ']' && Peek() != '}' && Peek() != '#' &&
           std::isspace(static_cast<unsigned char>(Peek())) == 0) {
      Advance();
    }
    // `1979-05-27 07:32:00` separates date and time with a space.
    if (pos_ - start == 10U && LooksLikeDateTime(text_.substr(start, 10)) &&
        pos_ + 3 < text_.size() && text_[pos_] == ' ' && IsDigit(text_[pos_ + 1]) &&
        IsDigit(text_[pos_ + 2]) && text_[pos_ + 3] == ':') {
      Advance();
      while (!AtEnd() && Peek() != ',' && Peek() != ']' && Peek() != '}' && Peek() != '#' &&
             std::isspace(static_cast<unsigned char>(Peek())) == 0) {
        Advance();
      }
    }
    const std::string_view token = text_.substr(start, pos_ - start);

    if (token == "true" || token == "false") {
      value.type = TomlValue::Type::kBool;
      value.bool_value = token == "true";
      return true;
    }
    if (token == "inf" || token == "+inf" || token == "-inf") {
      value.type = TomlValue::Type::kFloat;
      value.float_value = token == "-inf" ? -std::numeric_limits<double>::infinity()
                                          : std::numeric_limits<double>::infinity();
      return true;
    }
    if (token == "nan" || token == "+nan" || token == "-nan") {
      value.type = TomlValue::Type::kFloat;
      value.float_value = std::numeric_limits<double>::quiet_NaN();
      return true;
    }
    if (LooksLikeDateTime(token)) {
      value.type = TomlValue::Type::kDateTime;
      value.string_value = std::string(token);
      return true;
    }
    return ParseNumberToken(token, value, error);
  }

  bool ParseNumberToken(std::string_view token, TomlValue& value, std::string& error) {
    if (token.empty()) {
      return Fail("missing value", error);
    }

    // Underscores are only allowed between digits.
    std::string digits;
    for (std::size_t i = 0; i < token.size(); ++i) {
      if (token[i] != '_') {
        digits.push_back(token[i]);
        continue;
      }
      const bool digit_before = i > 0 && std::isxdigit(static_cast<unsigned char>(token[i - 1]));
      const bool digit_after =
          i + 1 < token.size() && std::isxdigit(static_cast<unsigned char>(token[i + 1]));
      if (!digit_before || !digit_after) {
        return Fail("unsupported value '" + std::string(token) + "'", error);
      }
    }

    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();

    if (digits.size() > 2 && digits[0] == '0' &&
        (digits[1] == 'x' || digits[1] == 'o' || digits[1] == 'b')) {
      const int base = digits[1] == 'x' ? 16 : (digits[1] == 'o' ? 8 : 2);
      return ParseInteger(begin + 2, end, base, token, value, error);
    }

    bool saw_digit = false;
    bool is_float = false;
    for (std::size_t i = 0; i < digits.size(); ++i) {
      const char c = digits[i];
      if (IsDigit(c)) {
        saw_digit = true;
      } else if (c == '.' || c == 'e' || c == 'E') {
        is_float = true;
      } else if ((c == '+' || c == '-') &&
                 (i == 0 || digits[i - 1] == 'e' || digits[i - 1] == 'E')) {
        continue;
      } else {
        return Fail("unsupported value '" + std::string(token) + "'", error);
      }
    }
    if (!saw_digit) {
      return Fail("unsupported value '" + std::string(token) + "'", error);
    }

    if (*begin == '+') {
      ++begin;
    }
    if (!is_float) {
      return ParseInteger(begin, end, 10, token, value, error);
    }

    double number = 0.0;
    const auto [ptr, ec] = std::from_chars(begin, end, number);
    if (ec == std::errc::result_out_of_range) {
      return Fail("float out of range '" + std::string(token) + "'", error);
    }
    if (ec != std::errc() || ptr != end || !std::isfinite(number)) {
      return Fail("invalid float '" + std::string(token) + "'", error);
    }
    value.type = TomlValue::Type::kFloat;
    value.float_value = number;
    return true;
  }

  bool ParseInteger(const char* begin, const char* end, int base, std::string_view token,
                    TomlValue& value, std::string& error) {
    std::int64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, parsed, base);
    if (ec == std::errc::result_out_of_range) {
      return Fail("integer out of range '" + std::string(token) + "'", error);
    }
    if (ec != std::errc() || ptr != end) {
      return Fail("invalid integer '" + std::string(token) + "'", error);
    }
    value.type = TomlValue::Type::kInteger;
    value.integer_value = parsed;
    return true;
  }

  bool ExpectLineEnd(std::string& error) {
    SkipSpaces();
    SkipComment();
    if (AtEnd()) {
      return true;
    }
    if (StartsWith("\r\n")) {
      Advance();
    }
    if (Match('\n')) {
      return true;
    }
    return Fail("unexpected trailing content", error);
  }

  // Whitespace, newlines and comments between entries and array elements.
  void SkipFiller() {
    while (!AtEnd()) {
      const char c = Peek();
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        Advance();
      } else if (c == '#') {
        SkipComment();
      } else {
        return;
      }
    }
  }

  void SkipComment() {
    if (AtEnd() || Peek() != '#') {
      return;
    }
    while (!AtEnd() && Peek() != '\n') {
      Advance();
    }
  }

  void SkipSpaces() {
    while (!AtEnd() && (Peek() == ' ' || Peek() == '\t')) {
      Advance();
    }
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    return text_.substr(pos_, token.size()) == token;
  }

  char Peek() const {
    return text_[pos_];
  }

  char Advance() {
    const char c = text_[pos_++];
    if (c == '\n') {
      ++line_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "manifest parse error at line " + std::to_string(line_) + ": " + std::string(message);
    return false;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

} // namespace

const char* ToString(TomlValue::Type type) {
  switch (type) {
  case TomlValue::Type::kString:
    return "string";
  case TomlValue::Type::kInteger:
    return "integer";
  case TomlValue::Type::kFloat:
    return "float";
  case TomlValue::Type::kBool:
    return "bool";
  case TomlValue::Type::kArray:
    return "array";
  case TomlValue::Type::kTable:
    return "table";
  case TomlValue::Type::kDateTime:
    return "datetime";
  }
  return "string";
}

const TomlSection* FindSection(const TomlDocument& document, std::string_view name) {
  for (const auto& section : document.sections) {
    if (section.name == name && !section.array_of_tables) {
      return &section;
    }
  }
  return nullptr;
}

const TomlEntry* FindEntry(const TomlSection& section, std::string_view key) {
  for (const auto& entry : section.entries) {
    if (entry.key == key) {
      return &entry;
    }
  }
  return nullptr;
}

bool ParseTomlDocument(std::string_view text, TomlDocument& document, std::string& error) {
  DocumentParser parser(text);
  return parser.Parse(document, error);
}

} // namespace benchdiff::config
