#pragma once

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include "host.hpp"
#include <map>
#include <string>
#include <vector>
#include <windows.h>

namespace deskshell {

// Native Windows host. Windows have no application menu bar, so the menu
// primitives refuse and the shell installs none. The main window carries a
// small greet form that calls through the invoke handler.
class Win32Host final : public IHost {
public:
  Win32Host(std::string package_name, HINSTANCE hinst);
  ~Win32Host() override;

  // Registers the window classes and creates the message window. Must
  // succeed before anything else is called.
  bool init();

  HostInfo info() const override;

  std::optional<window_id> create_window(const WindowOptions &opts) override;
  std::optional<window_id> find_window(const std::string &label) override;
  bool show_window(window_id w) override;
  bool focus_window(window_id w) override;
  bool set_window_title(window_id w, const std::string &title) override;

  bool emit(window_id w, const std::string &event,
            const json::Value &payload) override;
  void listen(const std::string &label, const std::string &event,
              EventListener cb) override;

  std::optional<menu_handle>
  create_menu_item(const std::string &id, const std::string &text, bool enabled,
                   const std::optional<Accelerator> &accel) override;
  std::optional<menu_handle> create_predefined_item(PredefinedItem kind) override;
  std::optional<menu_handle> create_submenu(const std::string &title) override;
  std::optional<menu_handle> create_menu_bar() override;
  bool append_item(menu_handle parent, menu_handle item) override;
  bool append_separator(menu_handle parent) override;
  bool set_menu(menu_handle bar) override;
  bool set_menu_item_enabled(menu_handle item, bool enabled) override;

  void on_menu_event(MenuEventHandler h) override;
  void on_invoke(InvokeHandler h) override;
  void on_tick(int interval_ms, TickHandler h) override;

  bool open_external(const std::string &url) override;

  int run() override;
  void quit(int exit_code) override;

private:
  struct Window {
    window_id id{};
    WindowOptions options;
    HWND hwnd = nullptr;
    HWND name_edit = nullptr;
    HWND greet_button = nullptr;
    HWND greet_output = nullptr;
  };

  static LRESULT CALLBACK windowProc(HWND hwnd, UINT uMsg, WPARAM wParam,
                                     LPARAM lParam);
  static LRESULT CALLBACK messageProc(HWND hwnd, UINT uMsg, WPARAM wParam,
                                      LPARAM lParam);

  Window *window_by_id(window_id w);
  Window *window_by_hwnd(HWND hwnd);
  void create_greet_form(Window &w);
  void layout(Window &w);
  void on_greet(Window &w);
  void on_destroyed(HWND hwnd);

  std::string package_name_;
  HINSTANCE hinst_;
  HWND msg_hwnd_ = nullptr;
  bool classes_registered_ = false;

  window_id next_window_ = 1;
  std::map<window_id, Window> windows_;
  std::map<std::pair<std::string, std::string>, std::vector<EventListener>>
      listeners_;

  InvokeHandler invoke_handler_;
  TickHandler tick_handler_;
  int tick_interval_ms_ = 0;
  ULONGLONG last_tick_ = 0;
  int invoke_seq_ = 0;
  int exit_code_ = 0;

  static constexpr UINT_PTR TICK_TIMER_ID = 1;
  static constexpr UINT ID_NAME_EDIT = 101;
  static constexpr UINT ID_GREET_BUTTON = 102;
  static constexpr UINT ID_GREET_OUTPUT = 103;
};

} // namespace deskshell
#endif
