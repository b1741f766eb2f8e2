// warden: background supervisor for a single long-running worker

#include "cli/cli.hpp"

int main(int argc, char **argv) { return warden::cli::run(argc, argv); }
