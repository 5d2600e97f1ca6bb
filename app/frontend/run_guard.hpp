#pragma once
#include <functional>

namespace deskshell_app {

// Runs the application body. A SetupError or any other std::exception that
// escapes it is logged and turned into exit code 1.
int run_guarded(const std::function<int()> &body);

} // namespace deskshell_app
