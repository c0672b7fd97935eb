#include <kruise/sdk/code_interpreter.hpp>

#include "api.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/context.hpp>
#include <kruise/sdk/endpoint.hpp>
#include <kruise/sdk/retry.hpp>
#include <kruise/sdk/transport.hpp>

#include <fmt/format.h>
#include <json/value.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk {

  CodeInterpreter::CodeInterpreter(std::shared_ptr<const SandboxContext> context)
      : _context(std::move(context))
  {
  }

  Execution CodeInterpreter::run_code(const std::string& code, const RunCodeOptions& options) const
  {
    if (options.language.has_value() && options.context_id.has_value()) {
      throw common::InvalidConfigurationError(
          "Code can run either in a context or with a language, not both!"
      );
    }

    return retry::execute_with_retry(
        [&]() { return _run_once(code, options); }, _context->execution_policy
    );
  }

  Execution CodeInterpreter::_run_once(const std::string& code, const RunCodeOptions& options) const
  {
    Json::Value body;
    body["code"] = code;
    if (options.context_id.has_value()) {
      body["context_id"] = options.context_id.value();
    }
    if (options.language.has_value()) {
      body["language"] = options.language.value();
    }
    if (!options.env_vars.empty()) {
      body["env_vars"] = Json::Value{Json::objectValue};
      for (const auto& [key, value] : options.env_vars) {
        body["env_vars"][key] = value;
      }
    }

    auto req = _context->request(common::http::Method::POST, "/execute");
    req.body = api::to_json(body);
    req.content_type = "application/json";
    req.timeout = options.timeout;

    Execution execution;
    ExecutionParser parser{execution, options.callbacks};

    try {
      auto response = _context->transport->send_streaming(
          _context->url(endpoint::CODE_INTERPRETER_PORT), std::move(req),
          [&parser](std::string_view chunk) { parser.feed(chunk); }
      );

      if (!response.ok()) {
        api::raise(response, fmt::format("Running code in sandbox {}", _context->sandbox_id));
      }
      parser.finish();
    } catch (common::KruiseException& err) {
      if (!parser.delivered()) {
        throw;
      }
      throw common::StreamInterruptedError{
          fmt::format(
              "Execution in sandbox {} failed after delivering output: {}", _context->sandbox_id,
              err.what()
          ),
          std::current_exception()};
    }

    if (!parser.ended()) {
      spdlog::debug("Execution stream of sandbox {} ended without a marker", _context->sandbox_id);
    }
    return execution;
  }

  CodeContext CodeInterpreter::create_code_context(
      const std::optional<std::string>& language, const std::optional<std::string>& cwd
  ) const
  {
    Json::Value body{Json::objectValue};
    if (language.has_value()) {
      body["language"] = language.value();
    }
    if (cwd.has_value()) {
      body["cwd"] = cwd.value();
    }

    auto req = _context->request(common::http::Method::POST, "/contexts");
    req.body = api::to_json(body);
    req.content_type = "application/json";

    auto response = _context->transport->send(
        _context->url(endpoint::CODE_INTERPRETER_PORT), std::move(req)
    );
    if (!response.ok()) {
      api::raise(response, fmt::format("Creating code context in sandbox {}", _context->sandbox_id));
    }

    auto json = api::parse_json(response.body);
    if (!json.isObject()) {
      throw common::KruiseException(fmt::format("Context reply is not an object: {}", response.body));
    }
    CodeContext ctx{json["id"].asString(), json["language"].asString(), json["cwd"].asString()};
    if (ctx.id.empty()) {
      throw common::KruiseException(fmt::format("Context reply without an id: {}", response.body));
    }
    spdlog::debug("Created {} context {} in sandbox {}", ctx.language, ctx.id, _context->sandbox_id);
    return ctx;
  }

} // namespace kruise::sdk
