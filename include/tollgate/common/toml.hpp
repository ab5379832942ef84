#pragma once

#include "tollgate/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tollgate::common {

/// Flat view of a TOML file: "[a.b]\nkey = 1" is stored as values["a.b.key"] = "1".
struct TomlEntry {
  std::string name; // leaf name, unquoted
  std::string key;  // full flattened key for the getters
};

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] std::optional<std::vector<double>> get_double_array(const std::string &key) const;

  /// Distinct names directly below a table prefix, sorted. With "[breakers.openai]" and
  /// "[breakers.default]" present, child_tables("breakers") == {"default", "openai"}.
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &prefix) const;

  /// Entries directly inside a table, sorted by name. Quoted leaves may contain dots.
  [[nodiscard]] std::vector<TomlEntry> table_entries(const std::string &table) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace tollgate::common
