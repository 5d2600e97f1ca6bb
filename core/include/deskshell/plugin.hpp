#pragma once
#include "commands.hpp"
#include <string>
#include <string_view>

namespace deskshell {

// Extension registered during setup; contributes commands under
// "plugin:<name>|<command>".
class IPlugin {
public:
  virtual ~IPlugin() = default;
  virtual std::string name() const = 0;
  // Throws SetupError when registration fails.
  virtual void init(CommandRegistry &reg) = 0;
};

std::string plugin_command_name(std::string_view plugin, std::string_view cmd);

// http, https and mailto only.
bool is_openable_url(std::string_view url);

// Opens URLs with the desktop's default handler.
class OpenerPlugin final : public IPlugin {
public:
  std::string name() const override { return "opener"; }
  void init(CommandRegistry &reg) override;
};

} // namespace deskshell
