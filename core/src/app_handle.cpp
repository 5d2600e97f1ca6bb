#include "deskshell/app_handle.hpp"

namespace deskshell {

AppHandle::AppHandle(IHost *host, const AppConfig *config)
    : host_(host), config_(config) {}

std::optional<window_id> AppHandle::get_window(std::string_view label) const {
  return host_->find_window(std::string(label));
}

bool AppHandle::emit_to(std::string_view label, const std::string &event,
                        const json::Value &payload) const {
  auto w = get_window(label);
  if (!w)
    return false;
  return host_->emit(*w, event, payload);
}

} // namespace deskshell
