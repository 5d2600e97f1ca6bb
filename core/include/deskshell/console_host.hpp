#pragma once
#include "host.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace deskshell {

// Terminal host. Windows are plain records, there is no menu bar, and the
// front-end talks to the shell through JSON lines:
//
//   in:  {"id":"1","method":"invoke","params":{"cmd":"greet","args":{...}}}
//        {"id":"2","method":"menu.activate","params":{"id":"open_settings"}}
//        {"id":"3","method":"window.close","params":{"label":"settings"}}
//        {"id":"4","method":"quit","params":{}}
//   out: {"id":"1","ok":true,"result":...}
//        {"event":"menu:open-settings","payload":null,"window":"main"}
//        {"notice":"window.created","window":"settings"}
class ConsoleHost final : public IHost {
public:
  ConsoleHost(std::string package_name, std::istream &in, std::ostream &out);
  ~ConsoleHost() override;

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

  // No menu bar on a terminal: every construction call fails.
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

  // Returns when a quit request arrives or the input stream ends.
  int run() override;
  void quit(int exit_code) override;

private:
  struct Window {
    window_id id{};
    WindowOptions options;
    std::string title;
  };

  // Lines handed from the reader thread to the loop.
  struct InputQueue {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<std::string> lines;
    bool eof = false;
  };

  void start_reader();
  void handle_line(const std::string &line);
  void write_line(const json::Object &o);
  void write_raw(const std::string &line);
  void notice(const std::string &what, const std::string &label);
  Window *window_by_id(window_id w);

  std::string package_name_;
  std::istream &in_;
  std::ostream &out_;
  std::mutex out_mu_;

  std::shared_ptr<InputQueue> input_;
  std::thread reader_;

  window_id next_window_ = 1;
  std::map<window_id, Window> windows_;
  std::map<std::pair<std::string, std::string>, std::vector<EventListener>>
      listeners_;

  MenuEventHandler menu_handler_;
  InvokeHandler invoke_handler_;
  TickHandler tick_handler_;
  int tick_interval_ms_ = 0;

  std::atomic<bool> quit_{false};
  std::atomic<int> exit_code_{0};
};

} // namespace deskshell
