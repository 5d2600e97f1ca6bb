#include "../frontend/run_guard.hpp"
#include "doctest/doctest.h"
#include "deskshell/host.hpp"
#include "deskshell/logger.hpp"
#include <system_error>

using namespace deskshell;
using namespace deskshell_app;

DOCTEST_TEST_CASE("run_guarded passes the exit code through") {
  DOCTEST_REQUIRE_EQ(run_guarded([] { return 0; }), 0);
  DOCTEST_REQUIRE_EQ(run_guarded([] { return 3; }), 3);
}

DOCTEST_TEST_CASE("escaping exceptions are logged and exit with 1") {
  DOCTEST_REQUIRE_EQ(run_guarded([]() -> int {
                       throw SetupError("failed to create window 'main'");
                     }),
                     1);
  DOCTEST_REQUIRE_EQ(Logger::get().get_recent_logs(1)[0].message,
                     std::string("error while running application: failed to "
                                 "create window 'main'"));

  DOCTEST_REQUIRE_EQ(run_guarded([]() -> int {
                       throw std::system_error(
                           std::make_error_code(std::errc::resource_unavailable_try_again),
                           "reader thread");
                     }),
                     1);
  auto last = Logger::get().get_recent_logs(1);
  DOCTEST_REQUIRE(last[0].level == LogLevel::ERR);
  DOCTEST_REQUIRE_EQ(last[0].message.rfind("unexpected error: reader thread", 0), 0u);
}
