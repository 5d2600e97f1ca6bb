#pragma once
#include "tinyjson.hpp"
#include <string>
#include <string_view>

namespace deskshell {

// A front-end call into the shell's command table.
struct InvokeRequest {
  std::string id;
  std::string cmd;
  json::Object args;
};

struct InvokeResponse {
  std::string id;
  bool ok = true;
  json::Value result;
  std::string error_code;
  std::string error_message;

  json::Object to_json_obj() const;
};

// Error codes carried in InvokeResponse::error_code.
inline constexpr std::string_view E_BAD_REQUEST = "E_BAD_REQUEST";
inline constexpr std::string_view E_BAD_METHOD = "E_BAD_METHOD";
inline constexpr std::string_view E_BAD_ARGS = "E_BAD_ARGS";
inline constexpr std::string_view E_COMMAND_FAILED = "E_COMMAND_FAILED";

// Builds a request from {"cmd": "...", "args": {...}}; args may be omitted.
// Throws std::runtime_error when cmd is missing or args is not an object.
InvokeRequest parse_invoke_params(const std::string &id,
                                  const json::Object &params);
// One line of the console channel, without the trailing newline.
std::string serialize_response_json(const InvokeResponse &resp);

} // namespace deskshell
