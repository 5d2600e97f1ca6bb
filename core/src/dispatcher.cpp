#include "deskshell/dispatcher.hpp"
#include "deskshell/logger.hpp"

namespace deskshell {

MenuAction parse_menu_action(std::string_view menu_id) {
  if (menu_id == OPEN_SETTINGS_MENU_ID)
    return MenuAction::OPEN_SETTINGS;
  return MenuAction::OTHER;
}

MenuEventDispatcher::MenuEventDispatcher(AppHandle app) : app_(app) {}

bool MenuEventDispatcher::dispatch(const std::string &menu_id) {
  switch (parse_menu_action(menu_id)) {
  case MenuAction::OPEN_SETTINGS: {
    bool sent = app_.emit_to(MAIN_WINDOW_LABEL, std::string(OPEN_SETTINGS_EVENT),
                             json::Null{});
    if (!sent)
      LOG_DEBUG("Main window not available, dropping " +
                std::string(OPEN_SETTINGS_EVENT));
    return sent;
  }
  case MenuAction::OTHER:
    LOG_TRACE("Ignoring menu event " + menu_id);
    return false;
  }
  return false;
}

} // namespace deskshell
