#include "deskshell/menu.hpp"
#include "deskshell/logger.hpp"
#include <set>

namespace deskshell {

MenuEntry MenuEntry::item(std::string id) {
  MenuEntry e;
  e.kind = MenuEntryKind::ITEM;
  e.item_id = std::move(id);
  return e;
}

MenuEntry MenuEntry::system(PredefinedItem p) {
  MenuEntry e;
  e.kind = MenuEntryKind::PREDEFINED;
  e.predefined = p;
  return e;
}

MenuEntry MenuEntry::separator() { return MenuEntry{}; }

MenuBarSpec default_menu_bar(const std::string &app_name) {
  const std::string settings_id(OPEN_SETTINGS_MENU_ID);

  MenuBarSpec spec;
  spec.items.push_back({settings_id, "Settings\xE2\x80\xA6", true, "CmdOrCtrl+,"});

  SubmenuSpec app{app_name,
                  {MenuEntry::item(settings_id), MenuEntry::separator(),
                   MenuEntry::system(PredefinedItem::SERVICES),
                   MenuEntry::separator(),
                   MenuEntry::system(PredefinedItem::HIDE),
                   MenuEntry::system(PredefinedItem::HIDE_OTHERS),
                   MenuEntry::system(PredefinedItem::SHOW_ALL),
                   MenuEntry::separator(),
                   MenuEntry::system(PredefinedItem::QUIT)}};

  SubmenuSpec edit{"Edit",
                   {MenuEntry::system(PredefinedItem::UNDO),
                    MenuEntry::system(PredefinedItem::REDO),
                    MenuEntry::separator(),
                    MenuEntry::system(PredefinedItem::CUT),
                    MenuEntry::system(PredefinedItem::COPY),
                    MenuEntry::system(PredefinedItem::PASTE),
                    MenuEntry::system(PredefinedItem::SELECT_ALL)}};

  SubmenuSpec window{"Window",
                     {MenuEntry::system(PredefinedItem::MINIMIZE),
                      MenuEntry::separator(), MenuEntry::item(settings_id),
                      MenuEntry::separator(),
                      MenuEntry::system(PredefinedItem::CLOSE_WINDOW)}};

  spec.submenus = {std::move(app), std::move(edit), std::move(window)};
  return spec;
}

void validate_menu_spec(const MenuBarSpec &spec) {
  std::set<std::string> ids;
  for (const auto &it : spec.items) {
    if (it.id.empty())
      throw SetupError("menu item with empty id");
    if (!ids.insert(it.id).second)
      throw SetupError("duplicate menu id '" + it.id + "'");
    if (!it.accelerator.empty() && !parse_accelerator(it.accelerator))
      throw SetupError("invalid accelerator '" + it.accelerator +
                       "' for menu item '" + it.id + "'");
  }
  for (const auto &sub : spec.submenus) {
    for (const auto &e : sub.entries) {
      if (e.kind == MenuEntryKind::ITEM && !ids.count(e.item_id))
        throw SetupError("submenu '" + sub.title +
                         "' references unknown menu item '" + e.item_id + "'");
    }
  }
}

std::optional<InstalledMenu> NativeTopLevelMenu::install(IHost &host,
                                                         const MenuBarSpec &spec) {
  validate_menu_spec(spec);
  InstalledMenu out;

  for (const auto &it : spec.items) {
    std::optional<Accelerator> accel;
    if (!it.accelerator.empty())
      accel = parse_accelerator(it.accelerator);
    auto h = host.create_menu_item(it.id, it.text, it.enabled, accel);
    if (!h)
      throw SetupError("failed to create menu item '" + it.id + "'");
    out.items.emplace(it.id, *h);
    if (accel)
      LOG_DEBUG("Menu item " + it.id + " bound to " +
                accel->to_string(host.info().platform));
  }

  std::vector<menu_handle> submenus;
  for (const auto &sub : spec.submenus) {
    auto sh = host.create_submenu(sub.title);
    if (!sh)
      throw SetupError("failed to create submenu '" + sub.title + "'");

    for (const auto &e : sub.entries) {
      bool ok = false;
      switch (e.kind) {
      case MenuEntryKind::ITEM:
        ok = host.append_item(*sh, out.items.at(e.item_id));
        break;
      case MenuEntryKind::PREDEFINED: {
        auto ph = host.create_predefined_item(e.predefined);
        if (!ph)
          throw SetupError("failed to create predefined item '" +
                           std::string(predefined_item_id(e.predefined)) + "'");
        ok = host.append_item(*sh, *ph);
        break;
      }
      case MenuEntryKind::SEPARATOR:
        ok = host.append_separator(*sh);
        break;
      }
      if (!ok)
        throw SetupError("failed to populate submenu '" + sub.title + "'");
    }
    submenus.push_back(*sh);
  }

  auto bar = host.create_menu_bar();
  if (!bar)
    throw SetupError("failed to create menu bar");
  for (auto sh : submenus) {
    if (!host.append_item(*bar, sh))
      throw SetupError("failed to append submenu to menu bar");
  }
  if (!host.set_menu(*bar))
    throw SetupError("failed to set application menu");

  out.bar = *bar;
  LOG_INFO("Installed menu bar with " + std::to_string(submenus.size()) +
           " submenus");
  return out;
}

std::optional<InstalledMenu> NoOpMenu::install(IHost &host, const MenuBarSpec &) {
  LOG_DEBUG("No application menu for platform " +
            std::string(platform_name(host.info().platform)));
  return std::nullopt;
}

std::unique_ptr<IMenuStrategy> select_menu_strategy(const HostInfo &info) {
  if (info.platform == HostPlatform::MACOS &&
      info.menu_bar == MenuBarConvention::TOP_LEVEL)
    return std::make_unique<NativeTopLevelMenu>();
  return std::make_unique<NoOpMenu>();
}

} // namespace deskshell
