#pragma once

namespace forkyard::cli {

int run_cli(int argc, char **argv);
void print_help();

} // namespace forkyard::cli
