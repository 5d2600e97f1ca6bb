#include "deskshell/app.hpp"
#include "deskshell/logger.hpp"
#include <set>

namespace deskshell {

Application::Application(IHost *host, AppConfig config)
    : host_(host), config_(std::move(config)),
      settings_(SettingsStore(config_.settings_path.empty()
                                  ? default_settings_path()
                                  : config_.settings_path)),
      dispatcher_(AppHandle(host_, &config_)) {}

void Application::add_plugin(std::unique_ptr<IPlugin> plugin) {
  plugins_.push_back(std::move(plugin));
}

void Application::set_menu_spec(MenuBarSpec spec) { menu_spec_ = std::move(spec); }

std::string_view Application::menu_strategy() const {
  return strategy_ ? strategy_->name() : std::string_view("none");
}

void Application::setup() {
  if (set_up_)
    throw SetupError("application is already set up");

  HostInfo info = host_->info();
  LOG_INFO("Starting " + config_.app_name + " on " +
           std::string(platform_name(info.platform)) + " (" + info.backend +
           " host)");

  std::set<std::string> plugin_names;
  for (auto &p : plugins_) {
    if (!plugin_names.insert(p->name()).second)
      throw SetupError("plugin " + p->name() + " registered twice");
    p->init(commands_);
    LOG_DEBUG("Plugin initialised: " + p->name());
  }

  register_builtin_commands(commands_);
  settings_.load();
  settings_.register_commands(commands_);

  host_->on_invoke([this](const InvokeRequest &req) {
    return commands_.invoke(handle(), req);
  });
  host_->on_menu_event([this](const std::string &id) { dispatcher_.dispatch(id); });

  if (!host_->create_window(config_.main_window))
    throw SetupError("failed to create window '" + config_.main_window.label +
                     "'");

  std::string menu_title =
      info.package_name.empty() ? config_.app_name : info.package_name;
  strategy_ = select_menu_strategy(info);
  LOG_DEBUG("Menu strategy: " + std::string(strategy_->name()));
  menu_ = strategy_->install(*host_, menu_spec_ ? *menu_spec_
                                                : default_menu_bar(menu_title));

  set_up_ = true;
  LOG_INFO("Setup complete, " + std::to_string(commands_.names().size()) +
           " commands registered");
}

int Application::run() {
  if (!set_up_)
    throw SetupError("run() called before a successful setup()");
  running_ = true;
  int code = host_->run();
  running_ = false;
  LOG_INFO("Event loop finished with code " + std::to_string(code));
  return code;
}

} // namespace deskshell
