#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::config {

struct TomlEntry;

// Value of one `key = value` manifest entry.
struct TomlValue {
  enum class Type {
    kString,
    kInteger,
    kFloat,
    kBool,
    kArray,
    kTable,
    // Dates and times are kept as their source text in `string_value`.
    kDateTime,
  };

  Type type = Type::kString;
  std::string string_value;
  std::int64_t integer_value = 0;
  double float_value = 0.0;
  bool bool_value = false;
  std::vector<TomlValue> array_value;
  // Inline table entries, in source order.
  std::vector<TomlEntry> table_value;

  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kInteger || type == Type::kFloat;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsTable() const {
    return type == Type::kTable;
  }

  // Integer or float widened to double. Only meaningful when IsNumber().
  double AsDouble() const {
    return type == Type::kInteger ? static_cast<double>(integer_value) : float_value;
  }
};

const char* ToString(TomlValue::Type type);

// Dotted keys (`a.b = 1`) keep their joined form as `key`.
struct TomlEntry {
  std::string key;
  TomlValue value;
  std::size_t line = 0;
};

// Entries keep file order. The implicit root table has an empty name; each
// `[[name]]` occurrence is its own section with `array_of_tables` set.
struct TomlSection {
  std::string name;
  std::vector<TomlEntry> entries;
  std::size_t line = 0;
  bool array_of_tables = false;
};

struct TomlDocument {
  std::vector<TomlSection> sections;
};

// First `[name]` section, or nullptr.
const TomlSection* FindSection(const TomlDocument& document, std::string_view name);
const TomlEntry* FindEntry(const TomlSection& section, std::string_view key);

// Reads a TOML document: comments, `[table]` and `[[array]]` headers, bare,
// quoted and dotted keys, basic, literal and multi-line strings, integers
// (decimal, hex, octal, binary), floats, booleans, dates, arrays spanning
// lines, and inline tables.
//
// Malformed input is rejected with `manifest parse error at line N: ...`, as
// are a repeated key in one table and a repeated `[table]` header.
bool ParseTomlDocument(std::string_view text, TomlDocument& document, std::string& error);

} // namespace benchdiff::config
