#include "deskshell/accelerator.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace deskshell {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return out;
}

std::string trim(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b]))
    b++;
  while (e > b && std::isspace((unsigned char)s[e - 1]))
    e--;
  return std::string(s.substr(b, e - b));
}

// Canonical spelling of the named keys we accept.
constexpr std::array<std::string_view, 18> NAMED_KEYS = {
    "Space",  "Tab",  "Enter", "Escape", "Backspace", "Delete",
    "Insert", "Home", "End",   "PageUp", "PageDown",  "Up",
    "Down",   "Left", "Right", "Plus",   "Minus",     "Comma"};

std::optional<std::string> normalize_key(const std::string &tok) {
  if (tok.size() == 1) {
    unsigned char c = (unsigned char)tok[0];
    if (!std::isprint(c) || c == ' ')
      return std::nullopt;
    return std::string(1, (char)std::toupper(c));
  }

  std::string lt = lower(tok);
  if (lt.size() >= 2 && lt[0] == 'f') {
    bool digits = std::all_of(lt.begin() + 1, lt.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    if (digits && lt.size() <= 3) {
      int n = std::stoi(lt.substr(1));
      if (n >= 1 && n <= 24)
        return "F" + std::to_string(n);
    }
  }
  if (lt == "esc")
    return std::string("Escape");
  if (lt == "return")
    return std::string("Enter");
  for (auto name : NAMED_KEYS) {
    if (lower(name) == lt)
      return std::string(name);
  }
  return std::nullopt;
}

} // namespace

bool Accelerator::uses_ctrl(HostPlatform p) const {
  return ctrl || (primary && p != HostPlatform::MACOS);
}

bool Accelerator::uses_super(HostPlatform p) const {
  return super || (primary && p == HostPlatform::MACOS);
}

std::string Accelerator::to_string(HostPlatform p) const {
  std::string out;
  auto add = [&out](std::string_view part) {
    if (!out.empty())
      out += "+";
    out += part;
  };
  if (uses_super(p))
    add(p == HostPlatform::MACOS ? "Cmd" : "Super");
  if (uses_ctrl(p))
    add("Ctrl");
  if (alt)
    add(p == HostPlatform::MACOS ? "Option" : "Alt");
  if (shift)
    add("Shift");
  add(key);
  return out;
}

std::optional<Accelerator> parse_accelerator(std::string_view s) {
  std::vector<std::string> tokens;
  size_t start = 0;
  while (start <= s.size()) {
    size_t plus = s.find('+', start);
    // A trailing "+" is the plus key itself ("Ctrl++").
    if (plus == s.size() - 1 && plus == start) {
      tokens.push_back("+");
      break;
    }
    if (plus == std::string_view::npos) {
      tokens.push_back(trim(s.substr(start)));
      break;
    }
    tokens.push_back(trim(s.substr(start, plus - start)));
    start = plus + 1;
  }

  Accelerator acc;
  bool have_key = false;
  for (const auto &tok : tokens) {
    if (tok.empty())
      return std::nullopt;
    std::string lt = lower(tok);
    if (lt == "cmdorctrl" || lt == "commandorcontrol" || lt == "cmdorcontrol" ||
        lt == "commandorctrl") {
      acc.primary = true;
    } else if (lt == "cmd" || lt == "command" || lt == "super" ||
               lt == "meta") {
      acc.super = true;
    } else if (lt == "ctrl" || lt == "control") {
      acc.ctrl = true;
    } else if (lt == "alt" || lt == "option") {
      acc.alt = true;
    } else if (lt == "shift") {
      acc.shift = true;
    } else {
      if (have_key)
        return std::nullopt;
      auto key = normalize_key(tok);
      if (!key)
        return std::nullopt;
      acc.key = *key;
      have_key = true;
    }
  }
  if (!have_key)
    return std::nullopt;
  return acc;
}

} // namespace deskshell
