#include <kruise/sdk/client.hpp>

#include <kruise/sdk/config.hpp>
#include <kruise/sdk/context.hpp>
#include <kruise/sdk/endpoint.hpp>
#include <kruise/sdk/lifecycle.hpp>
#include <kruise/sdk/transport.hpp>

#include <spdlog/spdlog.h>

namespace kruise::sdk {

  namespace {

    std::shared_ptr<const endpoint::Endpoint> resolve(const config::Config& cfg)
    {
      if (cfg.verbose) {
        spdlog::set_level(spdlog::level::debug);
      } else {
        spdlog::set_level(spdlog::level::info);
      }
      return endpoint::Endpoint::construct(cfg);
    }

  } // namespace

  Client::Client(const config::Config& cfg)
      : Client(nullptr, nullptr, resolve(cfg),
               Options{cfg.default_template, static_cast<double>(cfg.request_timeout),
                       retry::Policy::execution(cfg.execution_retry)})
  {
    _transport = std::make_shared<HTTPTransport>(
        _endpoint->verify_certificates(), cfg.http_client_io_threads
    );
    _lifecycle = std::make_shared<ControlPlane>(
        _transport, _endpoint,
        ControlPlane::Options{
            cfg.api_key, cfg.request_timeout, cfg.sandbox_timeout,
            retry::Policy::pausing(cfg.connect_retry)}
    );

    spdlog::info(
        "Sandbox API at {}, certificate verification {}", _endpoint->api_url(),
        _endpoint->verify_certificates() ? "enabled" : "disabled"
    );
  }

  Client::Client(
      std::shared_ptr<Lifecycle> lifecycle, std::shared_ptr<Transport> transport,
      std::shared_ptr<const endpoint::Endpoint> endpoint, Options options
  )
      : _lifecycle(std::move(lifecycle)), _transport(std::move(transport)),
        _endpoint(std::move(endpoint)), _options(std::move(options))
  {
  }

  Sandbox Client::_sandbox(SandboxConnection&& connection) const
  {
    auto context = std::make_shared<SandboxContext>(SandboxContext{
        connection.sandbox_id, connection.envd_access_token, _transport, _endpoint,
        _options.execution_policy, _options.request_timeout});
    return Sandbox{_lifecycle, std::move(context), std::move(connection)};
  }

  Sandbox Client::create(CreateOptions options)
  {
    if (options.template_id.empty()) {
      options.template_id = _options.default_template;
    }
    return _sandbox(_lifecycle->create(options));
  }

  Sandbox Client::connect(const std::string& sandbox_id, std::optional<int> timeout)
  {
    return _sandbox(_lifecycle->connect(sandbox_id, timeout));
  }

  void Client::pause(const std::string& sandbox_id)
  {
    _lifecycle->pause(sandbox_id);
  }

  void Client::kill(const std::string& sandbox_id)
  {
    _lifecycle->kill(sandbox_id);
  }

  SandboxInfo Client::get_info(const std::string& sandbox_id)
  {
    return _lifecycle->get_info(sandbox_id);
  }

  void Client::set_timeout(const std::string& sandbox_id, int timeout)
  {
    _lifecycle->set_timeout(sandbox_id, timeout);
  }

  SandboxPaginator Client::list(SandboxQuery query, int limit)
  {
    return SandboxPaginator{_lifecycle, std::move(query), limit};
  }

  std::vector<SandboxInfo> Client::list_all(SandboxQuery query, int limit)
  {
    return list(std::move(query), limit).all();
  }

} // namespace kruise::sdk
