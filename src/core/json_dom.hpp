#ifndef BENCHDIFF_CORE_JSON_DOM_HPP_
#define BENCHDIFF_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::core::json {

// Small STL-only DOM shared by the result-file loader and the recorded-call
// benchmark suite.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

// Returns nullptr when `object_value` is not an object or has no such key.
inline const Value* FindField(const Value& object_value, std::string_view key) {
  if (object_value.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.object_value.find(std::string(key));
  if (it == object_value.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Accepts numbers that are finite, >= 0, integral and representable as uint64.
inline bool TryGetNonNegativeInteger(const Value& value, std::uint64_t& out) {
  if (value.type != Value::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

// Strict JSON parser. Errors carry line/column so a malformed result file can
// be located from the report notice alone.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 128;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("maximum nesting depth exceeded", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, depth, error);
    }
    if (c == '[') {
      return ParseArray(value, depth, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      // Duplicate keys: the later value replaces the earlier one.
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ReadHex4(std::uint32_t& code_unit, std::string& error) {
    code_unit = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_unit <<= 4U;
      if (h >= '0' && h <= '9') {
        code_unit |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_unit |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_unit |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    return true;
  }

  // Decodes `\uXXXX` (with surrogate pairs) into UTF-8.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    if (!ReadHex4(code_point, error)) {
      return false;
    }

    if (code_point >= 0xD800U && code_point <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code_point >= 0xDC00U && code_point <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    try {
      std::size_t parsed = 0;
      output = std::stod(text, &parsed);
      if (parsed != text.size()) {
        return Fail("invalid number token", error);
      }
    } catch (const std::out_of_range&) {
      return Fail("numeric value out of range", error);
    } catch (const std::invalid_argument&) {
      return Fail("invalid numeric value", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace benchdiff::core::json

#endif // BENCHDIFF_CORE_JSON_DOM_HPP_
