#ifdef _WIN32
#include "deskshell/win32_host.hpp"
#include "deskshell/logger.hpp"
#include <shellapi.h>

namespace deskshell {

namespace {

const wchar_t *WINDOW_CLASS = L"DeskshellWindow";
const wchar_t *MESSAGE_CLASS = L"DeskshellMessageWindow";

std::wstring u8w(const std::string &s) {
  if (s.empty())
    return {};
  int len = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), nullptr, 0);
  std::wstring out(len, L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), out.data(), len);
  return out;
}

std::string w2u8(const std::wstring &ws) {
  if (ws.empty())
    return {};
  int len = WideCharToMultiByte(CP_UTF8, 0, ws.c_str(), (int)ws.size(), nullptr,
                                0, nullptr, nullptr);
  std::string out(len, '\0');
  WideCharToMultiByte(CP_UTF8, 0, ws.c_str(), (int)ws.size(), out.data(), len,
                      nullptr, nullptr);
  return out;
}

std::wstring get_window_text_w(HWND hwnd) {
  int n = GetWindowTextLengthW(hwnd);
  std::wstring w;
  w.resize((size_t)n + 1);
  GetWindowTextW(hwnd, w.data(), n + 1);
  w.resize((size_t)n);
  return w;
}

} // namespace

Win32Host::Win32Host(std::string package_name, HINSTANCE hinst)
    : package_name_(std::move(package_name)), hinst_(hinst) {}

Win32Host::~Win32Host() {
  for (auto &[id, w] : windows_) {
    if (w.hwnd) {
      SetWindowLongPtr(w.hwnd, GWLP_USERDATA, 0);
      DestroyWindow(w.hwnd);
    }
  }
  windows_.clear();
  if (msg_hwnd_)
    DestroyWindow(msg_hwnd_);
  if (classes_registered_) {
    UnregisterClassW(WINDOW_CLASS, hinst_);
    UnregisterClassW(MESSAGE_CLASS, hinst_);
  }
}

bool Win32Host::init() {
  WNDCLASSEXW wc = {sizeof(WNDCLASSEXW)};
  wc.lpfnWndProc = windowProc;
  wc.hInstance = hinst_;
  wc.hbrBackground = (HBRUSH)(COLOR_WINDOW + 1);
  wc.lpszClassName = WINDOW_CLASS;
  wc.hCursor = LoadCursor(nullptr, IDC_ARROW);
  wc.hIcon = LoadIcon(nullptr, IDI_APPLICATION);
  if (!RegisterClassExW(&wc))
    return false;

  WNDCLASSEXW mc = {sizeof(WNDCLASSEXW)};
  mc.lpfnWndProc = messageProc;
  mc.hInstance = hinst_;
  mc.lpszClassName = MESSAGE_CLASS;
  if (!RegisterClassExW(&mc)) {
    UnregisterClassW(WINDOW_CLASS, hinst_);
    return false;
  }
  classes_registered_ = true;

  msg_hwnd_ = CreateWindowExW(0, MESSAGE_CLASS, L"Deskshell Host", 0, 0, 0, 0,
                              0, HWND_MESSAGE, nullptr, hinst_, this);
  return msg_hwnd_ != nullptr;
}

HostInfo Win32Host::info() const {
  HostInfo hi;
  hi.platform = HostPlatform::WINDOWS;
  hi.menu_bar = MenuBarConvention::NONE;
  hi.package_name = package_name_;
  hi.backend = "win32";
  return hi;
}

Win32Host::Window *Win32Host::window_by_id(window_id w) {
  auto it = windows_.find(w);
  return it == windows_.end() ? nullptr : &it->second;
}

Win32Host::Window *Win32Host::window_by_hwnd(HWND hwnd) {
  for (auto &[id, w] : windows_) {
    if (w.hwnd == hwnd)
      return &w;
  }
  return nullptr;
}

std::optional<window_id> Win32Host::create_window(const WindowOptions &opts) {
  if (opts.label.empty() || find_window(opts.label)) {
    LOG_WARN("Window label '" + opts.label + "' is empty or already in use");
    return std::nullopt;
  }

  DWORD style = WS_OVERLAPPEDWINDOW;
  if (!opts.resizable)
    style &= ~(WS_THICKFRAME | WS_MAXIMIZEBOX);

  // Requested size is the client area.
  RECT r{0, 0, opts.width, opts.height};
  AdjustWindowRectEx(&r, style, TRUE, 0);

  HWND hwnd = CreateWindowExW(0, WINDOW_CLASS, u8w(opts.title).c_str(), style,
                              CW_USEDEFAULT, CW_USEDEFAULT, r.right - r.left,
                              r.bottom - r.top, nullptr, nullptr, hinst_, this);
  if (!hwnd) {
    LOG_ERROR("CreateWindowExW failed for '" + opts.label +
              "', error " + std::to_string(GetLastError()));
    return std::nullopt;
  }

  Window w;
  w.id = next_window_++;
  w.options = opts;
  w.hwnd = hwnd;
  auto &stored = windows_.emplace(w.id, w).first->second;

  if (opts.label == MAIN_WINDOW_LABEL)
    create_greet_form(stored);

  if (opts.visible) {
    ShowWindow(hwnd, SW_SHOW);
    UpdateWindow(hwnd);
  }
  LOG_DEBUG("Window created: " + opts.label);
  return stored.id;
}

std::optional<window_id> Win32Host::find_window(const std::string &label) {
  for (const auto &[id, w] : windows_) {
    if (w.options.label == label)
      return id;
  }
  return std::nullopt;
}

bool Win32Host::show_window(window_id w) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  ShowWindow(win->hwnd, IsIconic(win->hwnd) ? SW_RESTORE : SW_SHOW);
  return true;
}

bool Win32Host::focus_window(window_id w) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  return SetForegroundWindow(win->hwnd) != FALSE;
}

bool Win32Host::set_window_title(window_id w, const std::string &title) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  return SetWindowTextW(win->hwnd, u8w(title).c_str()) != FALSE;
}

bool Win32Host::emit(window_id w, const std::string &event,
                     const json::Value &payload) {
  Window *win = window_by_id(w);
  if (!win)
    return false;
  LOG_TRACE("emit " + event + " -> " + win->options.label);
  auto it = listeners_.find({win->options.label, event});
  if (it == listeners_.end())
    return true;
  auto targets = it->second;
  for (auto &cb : targets)
    cb(payload);
  return true;
}

void Win32Host::listen(const std::string &label, const std::string &event,
                       EventListener cb) {
  listeners_[{label, event}].push_back(std::move(cb));
}

// Windows gets no application menu; the menu primitives refuse.
std::optional<menu_handle>
Win32Host::create_menu_item(const std::string &, const std::string &, bool,
                            const std::optional<Accelerator> &) {
  return std::nullopt;
}

std::optional<menu_handle> Win32Host::create_predefined_item(PredefinedItem) {
  return std::nullopt;
}

std::optional<menu_handle> Win32Host::create_submenu(const std::string &) {
  return std::nullopt;
}

std::optional<menu_handle> Win32Host::create_menu_bar() { return std::nullopt; }

bool Win32Host::append_item(menu_handle, menu_handle) { return false; }

bool Win32Host::append_separator(menu_handle) { return false; }

bool Win32Host::set_menu(menu_handle) { return false; }

bool Win32Host::set_menu_item_enabled(menu_handle, bool) { return false; }

void Win32Host::on_menu_event(MenuEventHandler) {}

void Win32Host::on_invoke(InvokeHandler h) { invoke_handler_ = std::move(h); }

void Win32Host::on_tick(int interval_ms, TickHandler h) {
  tick_interval_ms_ = interval_ms;
  tick_handler_ = std::move(h);
}

bool Win32Host::open_external(const std::string &url) {
  HINSTANCE r = ShellExecuteW(nullptr, L"open", u8w(url).c_str(), nullptr,
                              nullptr, SW_SHOWNORMAL);
  if ((INT_PTR)r <= 32) {
    LOG_WARN("ShellExecuteW failed for " + url + ", code " +
             std::to_string((INT_PTR)r));
    return false;
  }
  return true;
}

int Win32Host::run() {
  if (tick_handler_ && tick_interval_ms_ > 0) {
    last_tick_ = GetTickCount64();
    if (!SetTimer(msg_hwnd_, TICK_TIMER_ID, (UINT)tick_interval_ms_, nullptr))
      LOG_WARN("SetTimer failed, error " + std::to_string(GetLastError()));
  }

  MSG msg;
  BOOL r;
  while ((r = GetMessageW(&msg, nullptr, 0, 0)) != 0) {
    if (r == -1) {
      LOG_ERROR("GetMessageW failed, error " + std::to_string(GetLastError()));
      exit_code_ = 1;
      break;
    }
    TranslateMessage(&msg);
    DispatchMessageW(&msg);
  }
  KillTimer(msg_hwnd_, TICK_TIMER_ID);
  if (r == 0)
    exit_code_ = (int)msg.wParam;
  return exit_code_;
}

void Win32Host::quit(int exit_code) {
  exit_code_ = exit_code;
  PostQuitMessage(exit_code);
}

void Win32Host::create_greet_form(Window &w) {
  w.name_edit = CreateWindowExW(WS_EX_CLIENTEDGE, L"EDIT", L"",
                                WS_CHILD | WS_VISIBLE | WS_TABSTOP | ES_AUTOHSCROLL,
                                0, 0, 0, 0, w.hwnd, (HMENU)(UINT_PTR)ID_NAME_EDIT,
                                hinst_, nullptr);
  w.greet_button = CreateWindowExW(0, L"BUTTON", L"Greet",
                                   WS_CHILD | WS_VISIBLE | WS_TABSTOP | BS_DEFPUSHBUTTON,
                                   0, 0, 0, 0, w.hwnd,
                                   (HMENU)(UINT_PTR)ID_GREET_BUTTON, hinst_, nullptr);
  w.greet_output = CreateWindowExW(0, L"STATIC", L"", WS_CHILD | WS_VISIBLE,
                                   0, 0, 0, 0, w.hwnd,
                                   (HMENU)(UINT_PTR)ID_GREET_OUTPUT, hinst_, nullptr);
  HFONT font = (HFONT)GetStockObject(DEFAULT_GUI_FONT);
  for (HWND c : {w.name_edit, w.greet_button, w.greet_output}) {
    if (c)
      SendMessageW(c, WM_SETFONT, (WPARAM)font, TRUE);
  }
  layout(w);
}

void Win32Host::layout(Window &w) {
  if (!w.name_edit)
    return;
  RECT rc;
  GetClientRect(w.hwnd, &rc);
  int width = rc.right - rc.left;
  int x = 16, y = 16, bw = 90, h = 24;
  int ew = width - 3 * x - bw;
  if (ew < 80)
    ew = 80;
  MoveWindow(w.name_edit, x, y, ew, h, TRUE);
  MoveWindow(w.greet_button, x + ew + x, y, bw, h, TRUE);
  MoveWindow(w.greet_output, x, y + h + 12, width - 2 * x, h, TRUE);
}

void Win32Host::on_greet(Window &w) {
  if (!invoke_handler_)
    return;
  InvokeRequest req;
  req.id = "gui-" + std::to_string(++invoke_seq_);
  req.cmd = "greet";
  req.args["name"] = w2u8(get_window_text_w(w.name_edit));
  InvokeResponse resp = invoke_handler_(req);

  std::string text;
  if (resp.ok && resp.result.is_str())
    text = resp.result.as_str();
  else
    text = resp.error_code + ": " + resp.error_message;
  SetWindowTextW(w.greet_output, u8w(text).c_str());
}

void Win32Host::on_destroyed(HWND hwnd) {
  for (auto it = windows_.begin(); it != windows_.end(); ++it) {
    if (it->second.hwnd == hwnd) {
      LOG_DEBUG("Window destroyed: " + it->second.options.label);
      windows_.erase(it);
      break;
    }
  }
  if (windows_.empty())
    quit(0);
}

LRESULT CALLBACK Win32Host::windowProc(HWND hwnd, UINT uMsg, WPARAM wParam,
                                       LPARAM lParam) {
  Win32Host *self = nullptr;
  if (uMsg == WM_NCCREATE) {
    CREATESTRUCT *cs = reinterpret_cast<CREATESTRUCT *>(lParam);
    self = reinterpret_cast<Win32Host *>(cs->lpCreateParams);
    SetWindowLongPtr(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
  } else {
    self = reinterpret_cast<Win32Host *>(GetWindowLongPtr(hwnd, GWLP_USERDATA));
  }

  if (self) {
    switch (uMsg) {
    case WM_COMMAND: {
      UINT id = LOWORD(wParam);
      if (id == ID_GREET_BUTTON && HIWORD(wParam) == BN_CLICKED) {
        if (Window *w = self->window_by_hwnd(hwnd))
          self->on_greet(*w);
        return 0;
      }
      break;
    }
    case WM_SIZE:
      if (Window *w = self->window_by_hwnd(hwnd))
        self->layout(*w);
      return 0;
    case WM_DESTROY:
      self->on_destroyed(hwnd);
      return 0;
    }
  }

  return DefWindowProcW(hwnd, uMsg, wParam, lParam);
}

LRESULT CALLBACK Win32Host::messageProc(HWND hwnd, UINT uMsg, WPARAM wParam,
                                        LPARAM lParam) {
  Win32Host *self = nullptr;
  if (uMsg == WM_NCCREATE) {
    CREATESTRUCT *cs = reinterpret_cast<CREATESTRUCT *>(lParam);
    self = reinterpret_cast<Win32Host *>(cs->lpCreateParams);
    SetWindowLongPtr(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
  } else {
    self = reinterpret_cast<Win32Host *>(GetWindowLongPtr(hwnd, GWLP_USERDATA));
  }

  if (self && uMsg == WM_TIMER && wParam == TICK_TIMER_ID) {
    ULONGLONG now = GetTickCount64();
    std::int64_t elapsed = (std::int64_t)(now - self->last_tick_);
    self->last_tick_ = now;
    if (self->tick_handler_)
      self->tick_handler_(elapsed);
    return 0;
  }

  return DefWindowProcW(hwnd, uMsg, wParam, lParam);
}

} // namespace deskshell
#endif
