#include "tollgate/cli/commands.hpp"

int main(int argc, char **argv) { return tollgate::cli::run_cli(argc, argv); }
