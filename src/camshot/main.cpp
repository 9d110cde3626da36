#include "camshot/cli/router.hpp"

int main(int argc, char** argv) {
  // All parsing, reporting and exit-code contracts live in the CLI router.
  return camshot::cli::Dispatch(argc, argv);
}
