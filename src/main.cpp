#include "app.hpp"
#include "cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  return run_command(args, std::cout, std::cerr);
}
