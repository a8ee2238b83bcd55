#include <cstddef>
#include <iostream>
#include <span>

#include "scaffold/cli/cli.hpp"

int main(int Argc, char **Argv) {
  std::span<char *> Args{Argv, static_cast<std::size_t>(Argc)};
  return scaffold::cli::start(Args, std::cin, std::cout, std::cerr);
}
