#include "deskshell/fake_host.hpp"

namespace deskshell {

FakeHost::FakeHost(HostInfo info) : info_(std::move(info)) {
  if (info_.backend.empty())
    info_.backend = "fake";
}

HostInfo FakeHost::info() const {
  std::lock_guard<std::mutex> lk(mu_);
  return info_;
}

bool FakeHost::record(const std::string &call) {
  calls_.push_back(call);
  for (const auto &p : fail_prefixes_) {
    if (call.rfind(p, 0) == 0)
      return false;
  }
  return true;
}

std::optional<window_id> FakeHost::create_window(const WindowOptions &opts) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("create_window:" + opts.label))
    return std::nullopt;
  for (const auto &[id, w] : windows_) {
    if (w.options.label == opts.label)
      return std::nullopt; // labels are unique
  }
  FakeWindow w;
  w.id = next_window_++;
  w.options = opts;
  w.title = opts.title;
  w.visible = opts.visible;
  windows_.emplace(w.id, w);
  return w.id;
}

std::optional<window_id> FakeHost::find_window(const std::string &label) {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto &[id, w] : windows_) {
    if (w.options.label == label)
      return id;
  }
  return std::nullopt;
}

bool FakeHost::show_window(window_id w) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = windows_.find(w);
  if (it == windows_.end() || !record("show_window:" + it->second.options.label))
    return false;
  it->second.visible = true;
  it->second.show_count++;
  return true;
}

bool FakeHost::focus_window(window_id w) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = windows_.find(w);
  if (it == windows_.end() ||
      !record("focus_window:" + it->second.options.label))
    return false;
  for (auto &[id, other] : windows_)
    other.focused = false;
  it->second.focused = true;
  it->second.focus_count++;
  return true;
}

bool FakeHost::set_window_title(window_id w, const std::string &title) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = windows_.find(w);
  if (it == windows_.end())
    return false;
  it->second.title = title;
  return true;
}

bool FakeHost::emit(window_id w, const std::string &event,
                    const json::Value &payload) {
  std::vector<EventListener> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = windows_.find(w);
    if (it == windows_.end())
      return false;
    const std::string &label = it->second.options.label;
    if (!record("emit:" + label + ":" + event))
      return false;
    emitted_.push_back({label, event, payload});
    auto lit = listeners_.find({label, event});
    if (lit != listeners_.end())
      targets = lit->second;
  }
  // Listeners may call back into the host.
  for (auto &cb : targets)
    cb(payload);
  return true;
}

void FakeHost::listen(const std::string &label, const std::string &event,
                      EventListener cb) {
  std::lock_guard<std::mutex> lk(mu_);
  listeners_[{label, event}].push_back(std::move(cb));
}

menu_handle FakeHost::add_node(FakeMenuNode n) {
  menu_handle h = next_menu_++;
  menu_nodes_.emplace(h, std::move(n));
  return h;
}

std::optional<menu_handle>
FakeHost::create_menu_item(const std::string &id, const std::string &text,
                           bool enabled, const std::optional<Accelerator> &accel) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("create_menu_item:" + id))
    return std::nullopt;
  FakeMenuNode n;
  n.kind = FakeMenuNode::Kind::ITEM;
  n.id = id;
  n.text = text;
  n.enabled = enabled;
  n.accel = accel;
  return add_node(std::move(n));
}

std::optional<menu_handle> FakeHost::create_predefined_item(PredefinedItem kind) {
  std::lock_guard<std::mutex> lk(mu_);
  std::string id(predefined_item_id(kind));
  if (!record("create_predefined_item:" + id))
    return std::nullopt;
  FakeMenuNode n;
  n.kind = FakeMenuNode::Kind::PREDEFINED;
  n.id = id;
  n.text = std::string(predefined_item_text(kind));
  return add_node(std::move(n));
}

std::optional<menu_handle> FakeHost::create_submenu(const std::string &title) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("create_submenu:" + title))
    return std::nullopt;
  FakeMenuNode n;
  n.kind = FakeMenuNode::Kind::SUBMENU;
  n.id = title;
  n.text = title;
  return add_node(std::move(n));
}

std::optional<menu_handle> FakeHost::create_menu_bar() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("create_menu_bar"))
    return std::nullopt;
  FakeMenuNode n;
  n.kind = FakeMenuNode::Kind::BAR;
  return add_node(std::move(n));
}

bool FakeHost::append_item(menu_handle parent, menu_handle item) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("append_item"))
    return false;
  auto p = menu_nodes_.find(parent);
  if (p == menu_nodes_.end() || !menu_nodes_.count(item))
    return false;
  if (p->second.kind != FakeMenuNode::Kind::SUBMENU &&
      p->second.kind != FakeMenuNode::Kind::BAR)
    return false;
  p->second.children.push_back(item);
  return true;
}

bool FakeHost::append_separator(menu_handle parent) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("append_separator"))
    return false;
  auto p = menu_nodes_.find(parent);
  if (p == menu_nodes_.end() || p->second.kind != FakeMenuNode::Kind::SUBMENU)
    return false;
  p->second.children.push_back(0);
  return true;
}

bool FakeHost::set_menu(menu_handle bar) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("set_menu"))
    return false;
  auto it = menu_nodes_.find(bar);
  if (it == menu_nodes_.end() || it->second.kind != FakeMenuNode::Kind::BAR)
    return false;
  menu_bar_ = bar;
  return true;
}

bool FakeHost::set_menu_item_enabled(menu_handle item, bool enabled) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = menu_nodes_.find(item);
  if (it == menu_nodes_.end() || !record("set_menu_item_enabled:" + it->second.id))
    return false;
  it->second.enabled = enabled;
  return true;
}

void FakeHost::on_menu_event(MenuEventHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  menu_handler_ = std::move(h);
}

void FakeHost::on_invoke(InvokeHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  invoke_handler_ = std::move(h);
}

void FakeHost::on_tick(int interval_ms, TickHandler h) {
  std::lock_guard<std::mutex> lk(mu_);
  tick_interval_ms_ = interval_ms;
  tick_handler_ = std::move(h);
}

bool FakeHost::open_external(const std::string &url) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("open_external:" + url) || refuse_urls_)
    return false;
  opened_urls_.push_back(url);
  return true;
}

int FakeHost::run() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!record("run"))
    return 1;
  run_count_++;
  return exit_code_;
}

void FakeHost::quit(int exit_code) {
  std::lock_guard<std::mutex> lk(mu_);
  calls_.push_back("quit");
  quit_requested_ = true;
  exit_code_ = exit_code;
}

void FakeHost::fail_on(const std::string &call_prefix) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_prefixes_.insert(call_prefix);
}

void FakeHost::refuse_urls(bool refuse) {
  std::lock_guard<std::mutex> lk(mu_);
  refuse_urls_ = refuse;
}

std::vector<std::string> FakeHost::calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return calls_;
}

std::vector<EmittedEvent> FakeHost::emitted() const {
  std::lock_guard<std::mutex> lk(mu_);
  return emitted_;
}

void FakeHost::clear_emitted() {
  std::lock_guard<std::mutex> lk(mu_);
  emitted_.clear();
}

const FakeMenuNode *FakeHost::find_item(menu_handle root,
                                        const std::string &id) const {
  auto it = menu_nodes_.find(root);
  if (it == menu_nodes_.end())
    return nullptr;
  const FakeMenuNode &n = it->second;
  if ((n.kind == FakeMenuNode::Kind::ITEM ||
       n.kind == FakeMenuNode::Kind::PREDEFINED) &&
      n.id == id)
    return &n;
  for (auto child : n.children) {
    if (child == 0)
      continue;
    if (const FakeMenuNode *found = find_item(child, id))
      return found;
  }
  return nullptr;
}

bool FakeHost::activate_menu(const std::string &id) {
  MenuEventHandler handler;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (menu_bar_ == 0)
      return false;
    const FakeMenuNode *n = find_item(menu_bar_, id);
    if (!n || !n->enabled)
      return false;
    if (n->kind == FakeMenuNode::Kind::PREDEFINED) {
      calls_.push_back("native:" + id);
      if (id == predefined_item_id(PredefinedItem::QUIT)) {
        quit_requested_ = true;
        exit_code_ = 0;
      }
      return true;
    }
    handler = menu_handler_;
  }
  if (handler)
    handler(id);
  return true;
}

void FakeHost::send_menu_event(const std::string &id) {
  MenuEventHandler handler;
  {
    std::lock_guard<std::mutex> lk(mu_);
    handler = menu_handler_;
  }
  if (handler)
    handler(id);
}

std::optional<InvokeResponse> FakeHost::invoke(const InvokeRequest &req) {
  InvokeHandler handler;
  {
    std::lock_guard<std::mutex> lk(mu_);
    handler = invoke_handler_;
  }
  if (!handler)
    return std::nullopt;
  return handler(req);
}

void FakeHost::tick(std::int64_t elapsed_ms) {
  TickHandler handler;
  {
    std::lock_guard<std::mutex> lk(mu_);
    handler = tick_handler_;
  }
  if (handler)
    handler(elapsed_ms);
}

bool FakeHost::close_window(const std::string &label) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = windows_.begin(); it != windows_.end(); ++it) {
    if (it->second.options.label == label) {
      windows_.erase(it);
      calls_.push_back("close_window:" + label);
      return true;
    }
  }
  return false;
}

std::optional<FakeWindow> FakeHost::window(const std::string &label) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto &[id, w] : windows_) {
    if (w.options.label == label)
      return w;
  }
  return std::nullopt;
}

std::optional<FakeMenuNode> FakeHost::menu_node(menu_handle h) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = menu_nodes_.find(h);
  if (it == menu_nodes_.end())
    return std::nullopt;
  return it->second;
}

std::vector<std::string> FakeHost::menu_layout() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  auto bar = menu_nodes_.find(menu_bar_);
  if (menu_bar_ == 0 || bar == menu_nodes_.end())
    return out;
  for (auto sub : bar->second.children) {
    const FakeMenuNode &s = menu_nodes_.at(sub);
    std::string line = s.text + ":";
    bool first = true;
    for (auto child : s.children) {
      line += first ? " " : " | ";
      first = false;
      line += child == 0 ? "-" : menu_nodes_.at(child).id;
    }
    out.push_back(line);
  }
  return out;
}

int FakeHost::tick_interval_ms() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tick_interval_ms_;
}

int FakeHost::run_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return run_count_;
}

bool FakeHost::quit_requested() const {
  std::lock_guard<std::mutex> lk(mu_);
  return quit_requested_;
}

std::vector<std::string> FakeHost::opened_urls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return opened_urls_;
}

} // namespace deskshell
