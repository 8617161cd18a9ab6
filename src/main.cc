#include "Driver.hpp"

#include <cstdlib>

int main(int argc, char* argv[]) {
  return modstack::run(argc, argv).is_ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}
