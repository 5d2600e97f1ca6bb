#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"
#include "deskshell/logger.hpp"

int main(int argc, char **argv) {
  // Keep test output readable; messages still land in the ring buffer.
  deskshell::Logger::get().set_quiet(true);

  doctest::Context ctx;
  ctx.applyCommandLine(argc, argv);
  return ctx.run();
}
