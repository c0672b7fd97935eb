#ifndef KRUISE_SDK_SRC_API_HPP
#define KRUISE_SDK_SRC_API_HPP

#include <kruise/common/http.hpp>
#include <kruise/sdk/info.hpp>

#include <string>
#include <string_view>

#include <json/value.h>

namespace kruise::sdk::api {

  Json::Value parse_json(std::string_view body);

  std::string to_json(const Json::Value& value);

  /**
   * @brief Extracts a human-readable message from an error reply. Both the control plane
   * ({"code": 404, "message": ...}) and Connect ({"code": "not_found", "message": ...})
   * error bodies are understood; anything else is returned verbatim.
   */
  std::string error_message(const common::http::Response& response);

  /**
   * @brief Converts a non-2xx reply into the matching exception: 404 and Connect
   * "not_found" become NotFoundError, replies about a pausing sandbox become
   * SandboxPausingError, everything else ApiError. The raw body is always attached.
   */
  [[noreturn]] void raise(const common::http::Response& response, std::string_view context);

  SandboxConnection parse_connection(const Json::Value& json);

  SandboxInfo parse_info(const Json::Value& json);

} // namespace kruise::sdk::api

#endif
