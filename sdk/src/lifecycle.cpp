#include <kruise/sdk/lifecycle.hpp>

#include "api.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/common/util.hpp>
#include <kruise/sdk/endpoint.hpp>
#include <kruise/sdk/transport.hpp>

#include <drogon/utils/Utilities.h>
#include <fmt/format.h>
#include <json/value.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk {

  ControlPlane::ControlPlane(
      std::shared_ptr<Transport> transport, std::shared_ptr<const endpoint::Endpoint> endpoint,
      Options options
  )
      : _transport(std::move(transport)), _endpoint(std::move(endpoint)),
        _options(std::move(options))
  {
    _logger = common::util::create_logger("ControlPlane");
  }

  common::http::Request ControlPlane::_request(common::http::Method method, std::string path) const
  {
    common::http::Request req;
    req.method = method;
    req.path = std::move(path);
    req.timeout = _options.request_timeout;
    if (!_options.api_key.empty()) {
      req.headers.emplace_back("X-API-KEY", _options.api_key);
    }
    return req;
  }

  SandboxConnection ControlPlane::create(const CreateOptions& options)
  {
    if (options.template_id.empty()) {
      throw common::InvalidConfigurationError("Sandbox template is required!");
    }
    if (_endpoint->requires_api_key() && _options.api_key.empty()) {
      throw common::InvalidConfigurationError(
          "API key is required by this endpoint, set E2B_API_KEY or the api-key option!"
      );
    }

    int timeout = options.timeout > 0 ? options.timeout : _options.sandbox_timeout;

    Json::Value body;
    body["templateID"] = options.template_id;
    body["timeout"] = timeout;
    body["secure"] = options.secure;
    body["autoPause"] = options.auto_pause;
    body["allow_internet_access"] = options.allow_internet_access;
    body["metadata"] = Json::Value{Json::objectValue};
    for (const auto& [key, value] : options.metadata) {
      body["metadata"][key] = value;
    }
    body["envVars"] = Json::Value{Json::objectValue};
    for (const auto& [key, value] : options.env_vars) {
      body["envVars"][key] = value;
    }

    auto req = _request(common::http::Method::POST, "/sandboxes");
    req.body = api::to_json(body);
    req.content_type = "application/json";

    auto response = _transport->send(_endpoint->api_url(), std::move(req));
    if (!response.ok()) {
      api::raise(response, fmt::format("Creating sandbox from template {}", options.template_id));
    }

    auto conn = api::parse_connection(api::parse_json(response.body));
    _logger->info(
        "Created sandbox {} from template {}, timeout {} s", conn.sandbox_id, options.template_id,
        timeout
    );
    return conn;
  }

  SandboxConnection ControlPlane::connect(const std::string& sandbox_id, std::optional<int> timeout)
  {
    Json::Value body;
    body["timeout"] = timeout.value_or(_options.sandbox_timeout);
    auto payload = api::to_json(body);

    // While the server is still suspending the sandbox, connect is rejected with a
    // pausing error; it succeeds once the sandbox is paused (and gets resumed) or running.
    return retry::execute_with_retry(
        [&]() {
          auto req = _request(common::http::Method::POST, fmt::format("/sandboxes/{}/connect", sandbox_id));
          req.body = payload;
          req.content_type = "application/json";

          auto response = _transport->send(_endpoint->api_url(), std::move(req));
          if (!response.ok()) {
            api::raise(response, fmt::format("Connecting to sandbox {}", sandbox_id));
          }

          auto conn = api::parse_connection(api::parse_json(response.body));
          if (response.status == 201) {
            _logger->info("Resumed sandbox {}", sandbox_id);
          } else {
            _logger->info("Connected to sandbox {}", sandbox_id);
          }
          return conn;
        },
        _options.connect_policy
    );
  }

  void ControlPlane::pause(const std::string& sandbox_id)
  {
    auto req = _request(common::http::Method::POST, fmt::format("/sandboxes/{}/pause", sandbox_id));
    auto response = _transport->send(_endpoint->api_url(), std::move(req));

    if (response.status == 409) {
      // Not running: already pausing or paused, which is what the caller asked for.
      _logger->info(
          "Sandbox {} is not running, pause skipped: {}", sandbox_id, api::error_message(response)
      );
      return;
    }
    if (!response.ok()) {
      api::raise(response, fmt::format("Pausing sandbox {}", sandbox_id));
    }
    _logger->info("Requested pause of sandbox {}", sandbox_id);
  }

  void ControlPlane::kill(const std::string& sandbox_id)
  {
    auto req = _request(common::http::Method::DELETE, fmt::format("/sandboxes/{}", sandbox_id));
    auto response = _transport->send(_endpoint->api_url(), std::move(req));

    if (response.status == 404) {
      _logger->info("Sandbox {} is already gone", sandbox_id);
      return;
    }
    if (!response.ok()) {
      api::raise(response, fmt::format("Killing sandbox {}", sandbox_id));
    }
    _logger->info("Killed sandbox {}", sandbox_id);
  }

  SandboxInfo ControlPlane::get_info(const std::string& sandbox_id)
  {
    auto req = _request(common::http::Method::GET, fmt::format("/sandboxes/{}", sandbox_id));
    auto response = _transport->send(_endpoint->api_url(), std::move(req));
    if (!response.ok()) {
      api::raise(response, fmt::format("Querying sandbox {}", sandbox_id));
    }

    auto info = api::parse_info(api::parse_json(response.body));
    _logger->debug("Sandbox {} is {}", sandbox_id, to_string(info.state));
    return info;
  }

  void ControlPlane::set_timeout(const std::string& sandbox_id, int timeout)
  {
    if (timeout <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Sandbox timeout must be positive, got {}", timeout)
      );
    }

    Json::Value body;
    body["timeout"] = timeout;

    auto req = _request(common::http::Method::POST, fmt::format("/sandboxes/{}/timeout", sandbox_id));
    req.body = api::to_json(body);
    req.content_type = "application/json";

    auto response = _transport->send(_endpoint->api_url(), std::move(req));
    if (!response.ok()) {
      api::raise(response, fmt::format("Setting timeout of sandbox {}", sandbox_id));
    }
    _logger->info("Sandbox {} timeout set to {} s", sandbox_id, timeout);
  }

  SandboxPage ControlPlane::list(
      const SandboxQuery& query, const std::optional<std::string>& next_token, int limit
  )
  {
    auto req = _request(common::http::Method::GET, "/v2/sandboxes");

    if (!query.metadata.empty()) {
      std::string encoded;
      for (const auto& [key, value] : query.metadata) {
        if (!encoded.empty()) {
          encoded += '&';
        }
        encoded += fmt::format(
            "{}={}", drogon::utils::urlEncodeComponent(key), drogon::utils::urlEncodeComponent(value)
        );
      }
      req.parameters.emplace_back("metadata", encoded);
    }

    if (!query.states.empty()) {
      std::string states;
      for (auto state : query.states) {
        if (!states.empty()) {
          states += ',';
        }
        states += to_string(state);
      }
      req.parameters.emplace_back("state", states);
    }

    if (limit > 0) {
      req.parameters.emplace_back("limit", std::to_string(limit));
    }
    if (next_token.has_value()) {
      req.parameters.emplace_back("nextToken", next_token.value());
    }

    auto response = _transport->send(_endpoint->api_url(), std::move(req));
    if (!response.ok()) {
      api::raise(response, "Listing sandboxes");
    }

    auto json = api::parse_json(response.body);
    if (!json.isArray()) {
      throw common::KruiseException(
          fmt::format("Sandbox list reply is not an array: {}", response.body)
      );
    }

    SandboxPage page;
    for (const auto& item : json) {
      page.sandboxes.emplace_back(api::parse_info(item));
    }

    auto token = response.header("x-next-token");
    if (token.has_value() && !token->empty()) {
      page.next_token = std::move(token);
    }

    _logger->debug(
        "Listed {} sandboxes, more pages: {}", page.sandboxes.size(), page.next_token.has_value()
    );
    return page;
  }

} // namespace kruise::sdk
