#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace tollgate::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_quote(const std::string &value);

/// Number literal with a fixed number of decimals; non-finite values render as null.
[[nodiscard]] std::string json_number(double value, int decimals);

[[nodiscard]] std::string json_optional(const std::optional<std::string> &value);

// Light-weight field readers for the documents this project emits. They do not validate and
// return empty results for missing fields.

/// Raw text of a field value: a quoted string, number, literal, object or array.
[[nodiscard]] std::string json_get_raw(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<double> json_get_number(const std::string &json,
                                                    const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

} // namespace tollgate::common
