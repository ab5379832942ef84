#pragma once

#include <string>
#include <vector>

namespace tollgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);

[[nodiscard]] std::vector<std::string> split_list(const std::string &value, char delimiter = ',');

/// Environment-variable fragment for a name: "open-router" -> "OPEN_ROUTER".
[[nodiscard]] std::string env_key(const std::string &name);

[[nodiscard]] std::string format_fixed(double value, int decimals);

} // namespace tollgate::common
