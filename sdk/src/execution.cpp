#include <kruise/sdk/execution.hpp>

#include "api.hpp"

#include <kruise/common/exceptions.hpp>

#include <json/value.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace kruise::sdk {

  namespace {

    void load_format(const Json::Value& json, const char* name, std::optional<std::string>& field)
    {
      if (!json.isMember(name) || json[name].isNull()) {
        return;
      }
      if (json[name].isString()) {
        field = json[name].asString();
      } else {
        field = api::to_json(json[name]);
      }
    }

    Result parse_result(const Json::Value& json)
    {
      Result result;
      load_format(json, "text", result.text);
      load_format(json, "html", result.html);
      load_format(json, "markdown", result.markdown);
      load_format(json, "svg", result.svg);
      load_format(json, "png", result.png);
      load_format(json, "jpeg", result.jpeg);
      load_format(json, "pdf", result.pdf);
      load_format(json, "latex", result.latex);
      load_format(json, "json", result.json);
      load_format(json, "javascript", result.javascript);
      result.is_main_result = json["is_main_result"].asBool();

      static const std::vector<std::string> known{
          "type", "text",  "html", "markdown", "svg",        "png",           "jpeg",
          "pdf",  "latex", "json", "javascript", "is_main_result", "extra"};

      for (const auto& key : json.getMemberNames()) {
        if (std::find(known.begin(), known.end(), key) == known.end() && !json[key].isNull()) {
          result.extra[key] = json[key].isString() ? json[key].asString() : api::to_json(json[key]);
        }
      }
      if (json["extra"].isObject()) {
        for (const auto& key : json["extra"].getMemberNames()) {
          result.extra[key] = api::to_json(json["extra"][key]);
        }
      }
      return result;
    }

  } // namespace

  std::vector<std::string> Result::formats() const
  {
    std::vector<std::string> names;
    auto add = [&names](const char* name, const std::optional<std::string>& field) {
      if (field.has_value()) {
        names.emplace_back(name);
      }
    };
    add("text", text);
    add("html", html);
    add("markdown", markdown);
    add("svg", svg);
    add("png", png);
    add("jpeg", jpeg);
    add("pdf", pdf);
    add("latex", latex);
    add("json", json);
    add("javascript", javascript);
    for (const auto& [key, _] : extra) {
      names.emplace_back(key);
    }
    return names;
  }

  std::optional<std::string> Execution::text() const
  {
    for (const auto& result : results) {
      if (result.is_main_result) {
        return result.text;
      }
    }
    return std::nullopt;
  }

  ExecutionParser::ExecutionParser(Execution& execution, const ExecutionCallbacks& callbacks)
      : _execution(execution), _callbacks(callbacks)
  {
  }

  void ExecutionParser::feed(std::string_view chunk)
  {
    _buffer.append(chunk);

    size_t begin = 0;
    size_t pos;
    while ((pos = _buffer.find('\n', begin)) != std::string::npos) {
      _line(std::string_view{_buffer}.substr(begin, pos - begin));
      begin = pos + 1;
    }
    _buffer.erase(0, begin);
  }

  void ExecutionParser::finish()
  {
    if (!_buffer.empty()) {
      std::string rest = std::move(_buffer);
      _buffer.clear();
      _line(rest);
    }
  }

  void ExecutionParser::_line(std::string_view line)
  {
    if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
      return;
    }

    auto json = api::parse_json(line);
    auto type = json["type"].asString();

    if (type == "stdout") {
      _execution.logs.std_out.emplace_back(json["text"].asString());
      if (_callbacks.on_stdout) {
        _delivered = true;
        _callbacks.on_stdout(_execution.logs.std_out.back());
      }
    } else if (type == "stderr") {
      _execution.logs.std_err.emplace_back(json["text"].asString());
      if (_callbacks.on_stderr) {
        _delivered = true;
        _callbacks.on_stderr(_execution.logs.std_err.back());
      }
    } else if (type == "result") {
      _execution.results.emplace_back(parse_result(json));
      if (_callbacks.on_result) {
        _delivered = true;
        _callbacks.on_result(_execution.results.back());
      }
    } else if (type == "error") {
      _execution.error =
          ExecutionError{json["name"].asString(), json["value"].asString(), json["traceback"].asString()};
      if (_callbacks.on_error) {
        _delivered = true;
        _callbacks.on_error(_execution.error.value());
      }
    } else if (type == "number_of_executions") {
      _execution.execution_count = json["execution_count"].asInt();
    } else if (type == "end_of_execution") {
      _ended = true;
    } else if (type == "unexpected_end_of_execution") {
      throw common::KruiseException("Code execution ended unexpectedly!");
    } else {
      spdlog::debug("Ignoring unknown execution event {}", type);
    }
  }

} // namespace kruise::sdk
