#include "tollgate/common/json.hpp"

#include "tollgate/common/strings.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace tollgate::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t matching_close(const std::string &json, std::size_t open_pos) {
  const char open_ch = json[open_pos];
  const char close_ch = open_ch == '{' ? '}' : ']';
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (const char ch : raw) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

/// Start of the value that follows `"field":`, or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t from = 0;
  while (true) {
    const auto key_pos = json.find(quoted, from);
    if (key_pos == std::string::npos) {
      return std::string::npos;
    }
    const auto after = skip_ws(json, key_pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return skip_ws(json, after + 1);
    }
    from = key_pos + quoted.size();
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
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
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_number(const double value, const int decimals) {
  if (!std::isfinite(value)) {
    return "null";
  }
  return format_fixed(value, decimals);
}

std::string json_optional(const std::optional<std::string> &value) {
  return value.has_value() ? json_quote(*value) : "null";
}

std::string json_get_raw(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || pos >= json.size()) {
    return "";
  }

  const char first = json[pos];
  if (first == '"') {
    const auto end = string_end(json, pos);
    return end == std::string::npos ? "" : json.substr(pos, end - pos + 1);
  }
  if (first == '{' || first == '[') {
    const auto end = matching_close(json, pos);
    return end == std::string::npos ? "" : json.substr(pos, end - pos + 1);
  }

  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return json.substr(pos, end - pos);
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  if (raw.size() < 2 || raw.front() != '"') {
    return "";
  }
  return unescape(raw.substr(1, raw.size() - 2));
}

std::optional<double> json_get_number(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  if (raw.empty() || raw == "null" || raw.front() == '"' || raw.front() == '{' ||
      raw.front() == '[') {
    return std::nullopt;
  }
  try {
    return std::stod(raw);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  return !raw.empty() && raw.front() == '{' ? raw : "";
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const std::string raw = json_get_raw(json, field);
  return !raw.empty() && raw.front() == '[' ? raw : "";
}

} // namespace tollgate::common
