#include "deskshell/console_host.hpp"
#include "deskshell/logger.hpp"
#include <chrono>
#include <iostream>
#include <istream>
#include <ostream>

namespace deskshell {

ConsoleHost::ConsoleHost(std::string package_name, std::istream &in,
                         std::ostream &out)
    : package_name_(std::move(package_name)), in_(in), out_(out),
      input_(std::make_shared<InputQueue>()) {}

ConsoleHost::~ConsoleHost() {
  if (!reader_.joinable())
    return;
  // A reader blocked on the terminal cannot be interrupted; leave it to
  // process exit. Other streams end on their own.
  if (&in_ == &std::cin)
    reader_.detach();
  else
    reader_.join();
}

HostInfo ConsoleHost::info() const {
  HostInfo hi;
  hi.platform = current_platform();
  hi.menu_bar = MenuBarConvention::NONE;
  hi.package_name = package_name_;
  hi.backend = "console";
  return hi;
}

void ConsoleHost::write_line(const json::Object &o) { write_raw(json::dumps(o)); }

void ConsoleHost::write_raw(const std::string &line) {
  std::lock_guard<std::mutex> lk(out_mu_);
  out_ << line << "\n";
  out_.flush();
}

void ConsoleHost::notice(const std::string &what, const std::string &label) {
  json::Object o;
  o["notice"] = what;
  o["window"] = label;
  write_line(o);
}

ConsoleHost::Window *ConsoleHost::window_by_id(window_id w) {
  auto it = windows_.find(w);
  return it == windows_.end() ? nullptr : &it->second;
}

std::optional<window_id> ConsoleHost::create_window(const WindowOptions &opts) {
  if (opts.label.empty() || find_window(opts.label)) {
    LOG_WARN("Window label '" + opts.label + "' is empty or already in use");
    return std::nullopt;
  }
  Window w;
  w.id = next_window_++;
  w.options = opts;
  w.title = opts.title;
  windows_.emplace(w.id, w);
  notice("window.created", opts.label);
  return w.id;
}

std::optional<window_id> ConsoleHost::find_window(const std::string &label) {
  for (const auto &[id, w] : windows_) {
    if (w.options.label == label)
      return id;
  }
  return std::nullopt;
}

bool ConsoleHost::show_window(window_id w) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  notice("window.shown", win->options.label);
  return true;
}

bool ConsoleHost::focus_window(window_id w) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  notice("window.focused", win->options.label);
  return true;
}

bool ConsoleHost::set_window_title(window_id w, const std::string &title) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  if (win->title == title)
    return true;
  win->title = title;
  json::Object o;
  o["notice"] = std::string("window.title");
  o["window"] = win->options.label;
  o["title"] = title;
  write_line(o);
  return true;
}

bool ConsoleHost::emit(window_id w, const std::string &event,
                       const json::Value &payload) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  json::Object o;
  o["event"] = event;
  o["window"] = win->options.label;
  o["payload"] = payload;
  write_line(o);

  auto it = listeners_.find({win->options.label, event});
  if (it != listeners_.end()) {
    // Copy: a listener may register further listeners.
    auto targets = it->second;
    for (auto &cb : targets)
      cb(payload);
  }
  return true;
}

void ConsoleHost::listen(const std::string &label, const std::string &event,
                         EventListener cb) {
  listeners_[{label, event}].push_back(std::move(cb));
}

std::optional<menu_handle>
ConsoleHost::create_menu_item(const std::string &id, const std::string &,
                              bool, const std::optional<Accelerator> &) {
  LOG_DEBUG("Console host has no menu bar, cannot create item " + id);
  return std::nullopt;
}

std::optional<menu_handle> ConsoleHost::create_predefined_item(PredefinedItem) {
  return std::nullopt;
}

std::optional<menu_handle> ConsoleHost::create_submenu(const std::string &) {
  return std::nullopt;
}

std::optional<menu_handle> ConsoleHost::create_menu_bar() { return std::nullopt; }

bool ConsoleHost::append_item(menu_handle, menu_handle) { return false; }

bool ConsoleHost::append_separator(menu_handle) { return false; }

bool ConsoleHost::set_menu(menu_handle) { return false; }

bool ConsoleHost::set_menu_item_enabled(menu_handle, bool) { return false; }

void ConsoleHost::on_menu_event(MenuEventHandler h) { menu_handler_ = std::move(h); }

void ConsoleHost::on_invoke(InvokeHandler h) { invoke_handler_ = std::move(h); }

void ConsoleHost::on_tick(int interval_ms, TickHandler h) {
  tick_interval_ms_ = interval_ms;
  tick_handler_ = std::move(h);
}

bool ConsoleHost::open_external(const std::string &url) {
  // The terminal front-end is the URL handler in this mode.
  json::Object o;
  o["notice"] = std::string("open_url");
  o["url"] = url;
  write_line(o);
  return true;
}

void ConsoleHost::start_reader() {
  auto q = input_;
  std::istream *in = &in_;
  reader_ = std::thread([q, in]() {
    std::string line;
    while (std::getline(*in, line)) {
      std::lock_guard<std::mutex> lk(q->mu);
      q->lines.push_back(line);
      q->cv.notify_one();
    }
    std::lock_guard<std::mutex> lk(q->mu);
    q->eof = true;
    q->cv.notify_one();
  });
}

int ConsoleHost::run() {
  if (!reader_.joinable())
    start_reader();
  LOG_INFO("Console host running, reading requests from stdin");

  using clock = std::chrono::steady_clock;
  auto last_tick = clock::now();
  auto wait = std::chrono::milliseconds(tick_handler_ ? tick_interval_ms_ : 1000);

  while (!quit_) {
    std::deque<std::string> batch;
    bool eof = false;
    {
      std::unique_lock<std::mutex> lk(input_->mu);
      input_->cv.wait_for(lk, wait, [this] {
        return !input_->lines.empty() || input_->eof;
      });
      batch.swap(input_->lines);
      eof = input_->eof;
    }

    for (const auto &line : batch) {
      handle_line(line);
      if (quit_)
        break;
    }

    auto now = clock::now();
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick)
            .count();
    if (tick_handler_ && elapsed >= tick_interval_ms_) {
      last_tick = now;
      tick_handler_(elapsed);
    }

    if (eof && !quit_) {
      LOG_DEBUG("Input closed, leaving event loop");
      quit(0);
    }
  }
  return exit_code_;
}

void ConsoleHost::quit(int exit_code) {
  exit_code_ = exit_code;
  quit_ = true;
}

void ConsoleHost::handle_line(const std::string &line) {
  if (line.find_first_not_of(" \t\r") == std::string::npos)
    return;

  InvokeResponse resp;
  try {
    auto v = json::parse(line);
    if (!v.is_obj())
      throw std::runtime_error("request must be object");
    const auto &req = v.as_obj();
    resp.id = json::get_str(req, "id").value_or("");
    auto method = json::get_str(req, "method");
    if (!method)
      throw std::runtime_error("missing method");
    static const json::Object no_params;
    const json::Object *params = json::get_obj(req, "params");
    if (!params)
      params = &no_params;

    if (*method == "invoke") {
      InvokeRequest ir = parse_invoke_params(resp.id, *params);
      if (!invoke_handler_) {
        resp.ok = false;
        resp.error_code = std::string(E_BAD_METHOD);
        resp.error_message = "no command table registered";
      } else {
        resp = invoke_handler_(ir);
      }
    } else if (*method == "menu.activate") {
      auto id = json::get_str(*params, "id");
      if (!id)
        throw std::runtime_error("missing id");
      if (*id == predefined_item_id(PredefinedItem::QUIT)) {
        quit(0);
      } else if (menu_handler_) {
        menu_handler_(*id);
      }
      resp.result = true;
    } else if (*method == "window.close") {
      auto label = json::get_str(*params, "label");
      if (!label)
        throw std::runtime_error("missing label");
      auto w = find_window(*label);
      resp.result = w.has_value();
      if (w) {
        windows_.erase(*w);
        notice("window.closed", *label);
        if (windows_.empty())
          quit(0);
      }
    } else if (*method == "quit") {
      quit(0);
      resp.result = true;
    } else {
      resp.ok = false;
      resp.error_code = std::string(E_BAD_METHOD);
      resp.error_message = "unknown method " + *method;
    }
  } catch (const std::exception &e) {
    resp.ok = false;
    resp.error_code = std::string(E_BAD_REQUEST);
    resp.error_message = e.what();
    LOG_WARN("Bad console request: " + std::string(e.what()));
  }
  write_raw(serialize_response_json(resp));
}

} // namespace deskshell
