#include "benchtel/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and the exit-code contract live in the CLI router.
  return benchtel::cli::Dispatch(argc, argv);
}
