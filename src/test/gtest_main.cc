#include <unistd.h>

#include "gtest/gtest.h"

int main(int argc, char** argv) {
  setenv("LC_ALL", "C", 1);

  // Keep the environment from steering tests toward real cache directories
  // or transport debugging.
  unsetenv("VURU_DEBUG");
  unsetenv("XDG_CACHE_HOME");

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
