#include "api.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/retry.hpp>

#include <memory>
#include <sstream>

#include <fmt/format.h>
#include <json/reader.h>
#include <json/writer.h>

namespace kruise::sdk::api {

  Json::Value parse_json(std::string_view body)
  {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value value;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &value, &errors)) {
      throw common::KruiseException(
          fmt::format("Couldn't parse the reply JSON: {}, body: {}", errors, body)
      );
    }
    return value;
  }

  std::string to_json(const Json::Value& value)
  {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
  }

  std::string error_message(const common::http::Response& response)
  {
    if (response.body.empty()) {
      return fmt::format("HTTP status {}", response.status);
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    Json::Value value;
    std::string errors;
    const char* begin = response.body.data();
    if (reader->parse(begin, begin + response.body.size(), &value, &errors) && value.isObject() &&
        value.isMember("message")) {
      return value["message"].asString();
    }
    return response.body;
  }

  void raise(const common::http::Response& response, std::string_view context)
  {
    auto message = error_message(response);
    auto text = fmt::format("{} failed with status {}: {}", context, response.status, message);

    bool connect_not_found = false;
    if (!response.body.empty() && response.body.front() == '{') {
      try {
        auto json = parse_json(response.body);
        connect_not_found = json.isObject() && json["code"].isString() &&
                            json["code"].asString() == "not_found";
      } catch (const common::KruiseException&) {
        connect_not_found = false;
      }
    }

    if (response.status == 404 || connect_not_found) {
      throw common::NotFoundError{response.body, text};
    }
    if (message.find(retry::PAUSING_MESSAGE) != std::string::npos) {
      throw common::SandboxPausingError{response.status, response.body, text};
    }
    throw common::ApiError{response.status, response.body, text};
  }

  SandboxConnection parse_connection(const Json::Value& json)
  {
    if (!json.isObject()) {
      throw common::KruiseException(
          fmt::format("Sandbox connection reply is not an object: {}", to_json(json))
      );
    }

    SandboxConnection conn;
    conn.sandbox_id = json["sandboxID"].asString();
    conn.template_id = json["templateID"].asString();
    conn.client_id = json["clientID"].asString();
    conn.domain = json["domain"].asString();
    conn.envd_version = json["envdVersion"].asString();
    conn.envd_access_token = json["envdAccessToken"].asString();

    if (conn.sandbox_id.empty()) {
      throw common::KruiseException(
          fmt::format("Reply does not contain a sandbox identifier: {}", to_json(json))
      );
    }
    return conn;
  }

  SandboxInfo parse_info(const Json::Value& json)
  {
    if (!json.isObject()) {
      throw common::KruiseException(
          fmt::format("Sandbox info reply is not an object: {}", to_json(json))
      );
    }

    SandboxInfo info;
    info.sandbox_id = json["sandboxID"].asString();
    info.template_id = json["templateID"].asString();
    info.alias = json["alias"].asString();
    info.client_id = json["clientID"].asString();
    info.started_at = json["startedAt"].asString();
    info.end_at = json["endAt"].asString();
    info.cpu_count = json["cpuCount"].asInt();
    info.memory_mb = json["memoryMB"].asInt();
    info.envd_version = json["envdVersion"].asString();
    info.state = state_from_string(json["state"].asString());

    const auto& metadata = json["metadata"];
    if (metadata.isObject()) {
      for (const auto& key : metadata.getMemberNames()) {
        info.metadata[key] = metadata[key].asString();
      }
    }
    return info;
  }

} // namespace kruise::sdk::api
