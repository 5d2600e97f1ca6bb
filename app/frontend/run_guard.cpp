#include "run_guard.hpp"
#include "deskshell/host.hpp"
#include "deskshell/logger.hpp"
#include <string>

using namespace deskshell;

namespace deskshell_app {

int run_guarded(const std::function<int()> &body) {
  try {
    return body();
  } catch (const SetupError &e) {
    LOG_ERROR(std::string("error while running application: ") + e.what());
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("unexpected error: ") + e.what());
  }
  return 1;
}

} // namespace deskshell_app
