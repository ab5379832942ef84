#include "tollgate/common/toml.hpp"

#include "tollgate/common/strings.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <set>
#include <sstream>

namespace tollgate::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      escaped = false;
    }
    return out;
  }
  return value;
}

std::optional<std::vector<std::string>> array_body(const std::string &raw_value) {
  const std::string raw = trim(raw_value);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return std::nullopt;
  }
  return split_array_elements(raw.substr(1, raw.size() - 2));
}

std::optional<double> parse_double(const std::string &text) {
  const std::string normalized = trim(text);
  if (normalized.empty()) {
    return std::nullopt;
  }
  std::istringstream stream(normalized);
  double parsed = 0.0;
  stream >> parsed;
  if (stream.fail() || !stream.eof()) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = trim(it->second);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return parse_double(it->second).value_or(fallback);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const auto elements = array_body(it->second);
  if (!elements.has_value()) {
    return fallback;
  }

  std::vector<std::string> values_out;
  for (const auto &element : *elements) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::optional<std::vector<double>> TomlDocument::get_double_array(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }

  const auto elements = array_body(it->second);
  if (!elements.has_value()) {
    return std::nullopt;
  }

  std::vector<double> numbers;
  for (const auto &element : *elements) {
    const auto parsed = parse_double(unquote(element));
    if (!parsed.has_value()) {
      return std::nullopt;
    }
    numbers.push_back(*parsed);
  }
  return numbers;
}

std::vector<std::string> TomlDocument::child_tables(const std::string &prefix) const {
  const std::string head = prefix + ".";
  std::set<std::string> names;
  for (const auto &[key, _] : values) {
    if (!starts_with(key, head)) {
      continue;
    }
    const std::string rest = key.substr(head.size());
    const auto dot = rest.find('.');
    if (dot == std::string::npos || dot == 0) {
      continue;
    }
    names.insert(rest.substr(0, dot));
  }
  return {names.begin(), names.end()};
}

std::vector<TomlEntry> TomlDocument::table_entries(const std::string &table) const {
  const std::string head = table + ".";
  std::map<std::string, std::string> entries;
  for (const auto &[key, _] : values) {
    if (!starts_with(key, head)) {
      continue;
    }
    const std::string leaf = key.substr(head.size());
    if (!leaf.empty() && leaf.front() == '"') {
      entries.emplace(unquote(leaf), key);
    } else if (!leaf.empty() && leaf.find('.') == std::string::npos) {
      entries.emplace(leaf, key);
    }
  }

  std::vector<TomlEntry> out;
  out.reserve(entries.size());
  for (const auto &[name, key] : entries) {
    out.push_back(TomlEntry{.name = name, .key = key});
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty() || key == "\"\"") {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace tollgate::common
