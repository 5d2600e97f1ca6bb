#include "../frontend/main_window.hpp"
#include "../frontend/run_guard.hpp"
#include "deskshell/app.hpp"
#include "deskshell/console_host.hpp"
#include "deskshell/logger.hpp"
#include "deskshell/plugin.hpp"
#include <iostream>
#include <memory>

#ifdef _WIN32
#include "deskshell/win32_host.hpp"
#endif

using namespace deskshell;

static std::unique_ptr<IHost> make_host(const AppConfig &cfg) {
  std::string host = cfg.host;
#ifdef _WIN32
  if (host == "auto" || host == "win32") {
    auto h = std::make_unique<Win32Host>(cfg.app_name, GetModuleHandleW(nullptr));
    if (!h->init())
      throw SetupError("failed to initialise the Win32 host, error " +
                       std::to_string(GetLastError()));
    return h;
  }
#else
  if (host == "win32")
    throw SetupError("the win32 host is only available on Windows");
#endif
  return std::make_unique<ConsoleHost>(cfg.app_name, std::cin, std::cout);
}

int main(int argc, char **argv) {
  return deskshell_app::run_guarded([argc, argv]() {
    LaunchOptions opts = parse_launch_options(argc, argv);
    if (opts.show_help) {
      std::cout << usage_text(argv[0]);
      return 0;
    }
    Logger::get().set_level(opts.config.log_level);

    std::unique_ptr<IHost> host = make_host(opts.config);

    Application app(host.get(), opts.config);
    app.add_plugin(std::make_unique<OpenerPlugin>());
    app.setup();

    deskshell_app::MainWindowController main_window(app.handle(),
                                                    app.settings().current());
    main_window.attach();

    return app.run();
  });
}
