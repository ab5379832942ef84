#pragma once

#include <string>

namespace tollgate::cli {

[[nodiscard]] std::string version_string();

int run_cli(int argc, char **argv);

} // namespace tollgate::cli
