#pragma once
#include "accelerator.hpp"
#include "invoke.hpp"
#include "tinyjson.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace deskshell {

// Raised for any failure while bringing the application up: host
// initialisation, window creation, menu construction, command or plugin
// registration. Always fatal.
class SetupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using MenuEventHandler = std::function<void(const std::string &menu_id)>;
using InvokeHandler = std::function<InvokeResponse(const InvokeRequest &)>;
using EventListener = std::function<void(const json::Value &payload)>;
using TickHandler = std::function<void(std::int64_t elapsed_ms)>;

// The native window host: owns the windows, the menu bar and the event loop.
// All callbacks are delivered on the loop thread.
class IHost {
public:
  virtual ~IHost() = default;

  virtual HostInfo info() const = 0;

  // Windows, addressed by their unique label.
  virtual std::optional<window_id> create_window(const WindowOptions &opts) = 0;
  virtual std::optional<window_id> find_window(const std::string &label) = 0;
  virtual bool show_window(window_id w) = 0;
  virtual bool focus_window(window_id w) = 0;
  virtual bool set_window_title(window_id w, const std::string &title) = 0;

  // Shell -> front-end events. emit() fails when the window is gone.
  virtual bool emit(window_id w, const std::string &event,
                    const json::Value &payload) = 0;
  virtual void listen(const std::string &label, const std::string &event,
                      EventListener cb) = 0;

  // Menu construction. Every call may fail (nullopt / false).
  virtual std::optional<menu_handle>
  create_menu_item(const std::string &id, const std::string &text, bool enabled,
                   const std::optional<Accelerator> &accel) = 0;
  virtual std::optional<menu_handle>
  create_predefined_item(PredefinedItem kind) = 0;
  virtual std::optional<menu_handle> create_submenu(const std::string &title) = 0;
  virtual std::optional<menu_handle> create_menu_bar() = 0;
  virtual bool append_item(menu_handle parent, menu_handle item) = 0;
  virtual bool append_separator(menu_handle parent) = 0;
  virtual bool set_menu(menu_handle bar) = 0;

  // Items keep a single identity wherever they are appended, so this
  // updates every position the item occupies.
  virtual bool set_menu_item_enabled(menu_handle item, bool enabled) = 0;

  // Wiring
  virtual void on_menu_event(MenuEventHandler h) = 0;
  virtual void on_invoke(InvokeHandler h) = 0;
  virtual void on_tick(int interval_ms, TickHandler h) = 0;

  // Hands a URL to the desktop's default handler.
  virtual bool open_external(const std::string &url) = 0;

  // Runs the event loop until quit(); returns the exit code.
  virtual int run() = 0;
  virtual void quit(int exit_code) = 0;
};

} // namespace deskshell
