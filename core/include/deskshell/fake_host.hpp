#pragma once
#include "host.hpp"
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace deskshell {

struct FakeWindow {
  window_id id{};
  WindowOptions options;
  std::string title;
  bool visible = true;
  bool focused = false;
  int show_count = 0;
  int focus_count = 0;
};

struct FakeMenuNode {
  enum class Kind : std::uint8_t { ITEM, PREDEFINED, SUBMENU, BAR };
  Kind kind = Kind::ITEM;
  std::string id; // custom id, predefined id or submenu title
  std::string text;
  bool enabled = true;
  std::optional<Accelerator> accel;
  std::vector<menu_handle> children; // 0 marks a separator
};

struct EmittedEvent {
  std::string window;
  std::string event;
  json::Value payload;
};

// In-memory host for tests. Records every call and can be told to fail any
// of them.
class FakeHost final : public IHost {
public:
  explicit FakeHost(HostInfo info);

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

  // Test helpers

  // Every later call whose recorded name starts with `call_prefix` fails,
  // e.g. "create_predefined_item:quit" or "set_menu".
  void fail_on(const std::string &call_prefix);
  // Pretends the platform refuses to open URLs.
  void refuse_urls(bool refuse);

  std::vector<std::string> calls() const;
  std::vector<EmittedEvent> emitted() const;
  void clear_emitted();

  // Clicks the installed menu entry with this id. Custom items reach the
  // menu handler, predefined ones are handled here ("quit" stops the loop).
  // False when no such enabled entry is installed.
  bool activate_menu(const std::string &id);
  // Delivers a raw menu event to the handler, bypassing the installed menu.
  void send_menu_event(const std::string &id);
  std::optional<InvokeResponse> invoke(const InvokeRequest &req);
  void tick(std::int64_t elapsed_ms);
  bool close_window(const std::string &label);

  std::optional<FakeWindow> window(const std::string &label) const;
  std::optional<FakeMenuNode> menu_node(menu_handle h) const;
  // One line per submenu: "Title: id | - | id ...". Empty when no menu set.
  std::vector<std::string> menu_layout() const;
  int tick_interval_ms() const;
  int run_count() const;
  bool quit_requested() const;
  std::vector<std::string> opened_urls() const;

private:
  bool record(const std::string &call); // false when the call must fail
  menu_handle add_node(FakeMenuNode n);
  const FakeMenuNode *find_item(menu_handle root, const std::string &id) const;

  mutable std::mutex mu_;
  HostInfo info_;
  std::vector<std::string> calls_;
  std::set<std::string> fail_prefixes_;
  bool refuse_urls_ = false;

  window_id next_window_ = 1;
  std::map<window_id, FakeWindow> windows_;
  std::map<std::pair<std::string, std::string>, std::vector<EventListener>>
      listeners_;
  std::vector<EmittedEvent> emitted_;

  menu_handle next_menu_ = 1;
  std::map<menu_handle, FakeMenuNode> menu_nodes_;
  menu_handle menu_bar_ = 0;

  MenuEventHandler menu_handler_;
  InvokeHandler invoke_handler_;
  TickHandler tick_handler_;
  int tick_interval_ms_ = 0;

  std::vector<std::string> opened_urls_;
  int run_count_ = 0;
  bool quit_requested_ = false;
  int exit_code_ = 0;
};

} // namespace deskshell
