#include "matrixnotify/cli/commands.hpp"

int main(int argc, char **argv) { return matrixnotify::cli::run_cli(argc, argv); }
