#include "tollgate/common/strings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tollgate::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

std::vector<std::string> split_list(const std::string &value, const char delimiter) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, delimiter)) {
    part = trim(part);
    if (!part.empty()) {
      parts.push_back(std::move(part));
    }
  }
  return parts;
}

std::string env_key(const std::string &name) {
  std::string key;
  key.reserve(name.size());
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    key.push_back(std::isalnum(uch) != 0 ? static_cast<char>(std::toupper(uch)) : '_');
  }
  return key;
}

std::string format_fixed(const double value, const int decimals) {
  std::ostringstream out;
  // Avoid rendering "-0.0000" for tiny negative rounding noise.
  const double scale = std::pow(10.0, decimals);
  double rounded = std::round(value * scale) / scale;
  if (rounded == 0.0) {
    rounded = 0.0;
  }
  out << std::fixed << std::setprecision(decimals) << rounded;
  return out.str();
}

} // namespace tollgate::common
