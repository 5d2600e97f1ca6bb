#include "deskshell/types.hpp"

#ifdef __APPLE__
#include <TargetConditionals.h>
#endif

namespace deskshell {

std::string_view platform_name(HostPlatform p) {
  switch (p) {
  case HostPlatform::MACOS:
    return "macos";
  case HostPlatform::WINDOWS:
    return "windows";
  case HostPlatform::LINUX:
    return "linux";
  case HostPlatform::MOBILE:
    return "mobile";
  default:
    return "other";
  }
}

HostPlatform current_platform() {
#if defined(__ANDROID__)
  return HostPlatform::MOBILE;
#elif defined(__APPLE__)
#if TARGET_OS_IPHONE
  return HostPlatform::MOBILE;
#else
  return HostPlatform::MACOS;
#endif
#elif defined(_WIN32)
  return HostPlatform::WINDOWS;
#elif defined(__linux__)
  return HostPlatform::LINUX;
#else
  return HostPlatform::OTHER;
#endif
}

std::string_view predefined_item_id(PredefinedItem item) {
  switch (item) {
  case PredefinedItem::SERVICES:
    return "services";
  case PredefinedItem::HIDE:
    return "hide";
  case PredefinedItem::HIDE_OTHERS:
    return "hide-others";
  case PredefinedItem::SHOW_ALL:
    return "show-all";
  case PredefinedItem::QUIT:
    return "quit";
  case PredefinedItem::UNDO:
    return "undo";
  case PredefinedItem::REDO:
    return "redo";
  case PredefinedItem::CUT:
    return "cut";
  case PredefinedItem::COPY:
    return "copy";
  case PredefinedItem::PASTE:
    return "paste";
  case PredefinedItem::SELECT_ALL:
    return "select-all";
  case PredefinedItem::MINIMIZE:
    return "minimize";
  case PredefinedItem::CLOSE_WINDOW:
    return "close-window";
  }
  return "unknown";
}

std::string_view predefined_item_text(PredefinedItem item) {
  switch (item) {
  case PredefinedItem::SERVICES:
    return "Services";
  case PredefinedItem::HIDE:
    return "Hide";
  case PredefinedItem::HIDE_OTHERS:
    return "Hide Others";
  case PredefinedItem::SHOW_ALL:
    return "Show All";
  case PredefinedItem::QUIT:
    return "Quit";
  case PredefinedItem::UNDO:
    return "Undo";
  case PredefinedItem::REDO:
    return "Redo";
  case PredefinedItem::CUT:
    return "Cut";
  case PredefinedItem::COPY:
    return "Copy";
  case PredefinedItem::PASTE:
    return "Paste";
  case PredefinedItem::SELECT_ALL:
    return "Select All";
  case PredefinedItem::MINIMIZE:
    return "Minimize";
  case PredefinedItem::CLOSE_WINDOW:
    return "Close Window";
  }
  return "";
}

} // namespace deskshell
