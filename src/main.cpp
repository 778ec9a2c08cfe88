#include "cli/registry.hpp"

#include <iostream>

int main(int argc, char **argv) {
  stackgit::cli::register_all_commands();

  if (argc < 2) {
    stackgit::cli::print_usage(std::cerr);
    return 2;
  }
  // argv[1] becomes the handler's argv[0]
  return stackgit::cli::dispatch(argc - 1, argv + 1);
}
