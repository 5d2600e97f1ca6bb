#include "deskshell/invoke.hpp"
#include <stdexcept>

namespace deskshell {

static json::Value make_error(const std::string &code, const std::string &msg) {
  json::Object e;
  e["code"] = code;
  e["message"] = msg;
  return e;
}

json::Object InvokeResponse::to_json_obj() const {
  json::Object o;
  o["id"] = id;
  o["ok"] = ok;
  if (ok)
    o["result"] = result;
  else
    o["error"] = make_error(error_code, error_message);
  return o;
}

InvokeRequest parse_invoke_params(const std::string &id,
                                  const json::Object &params) {
  auto cmd = json::get_str(params, "cmd");
  if (!cmd)
    throw std::runtime_error("missing cmd");

  InvokeRequest r;
  r.id = id;
  r.cmd = *cmd;
  auto it_a = params.find("args");
  if (it_a != params.end()) {
    if (!it_a->second.is_obj())
      throw std::runtime_error("args must be an object");
    r.args = it_a->second.as_obj();
  }
  return r;
}

std::string serialize_response_json(const InvokeResponse &resp) {
  return json::dumps(resp.to_json_obj());
}

} // namespace deskshell
