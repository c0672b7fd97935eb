#include <kruise/sdk/endpoint.hpp>

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/config.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk::endpoint {

  Type deserialize(std::string mode)
  {
    if (mode == "gateway") {
      return Type::GATEWAY;
    } else if (mode == "public") {
      return Type::PUBLIC;
    } else {
      return Type::NONE;
    }
  }

  Endpoint::Endpoint(std::string domain, bool secure) : _domain(std::move(domain)), _secure(secure)
  {
    if (_domain.empty()) {
      throw common::InvalidConfigurationError(
          "Sandbox domain is not configured, set E2B_DOMAIN or the domain option!"
      );
    }
  }

  std::string Endpoint::port_url(std::string_view sandbox_id, int port) const
  {
    return fmt::format("{}://{}", scheme(), port_host(sandbox_id, port));
  }

  std::unique_ptr<Endpoint> Endpoint::construct(const config::Config& cfg)
  {
    if (cfg.endpoint_type == Type::GATEWAY) {
      if (cfg.gateway_prefix.empty()) {
        throw common::InvalidConfigurationError("Gateway prefix cannot be empty!");
      }
      if (!cfg.secure) {
        spdlog::warn("Gateway {} is accessed over plain HTTP", cfg.domain);
      }
      return std::make_unique<GatewayEndpoint>(cfg.domain, cfg.gateway_prefix, cfg.secure);
    }
    if (cfg.endpoint_type == Type::PUBLIC) {
      return std::make_unique<PublicEndpoint>(cfg.domain);
    }
    throw common::InvalidConfigurationError("Unknown endpoint type!");
  }

  GatewayEndpoint::GatewayEndpoint(std::string domain, std::string prefix, bool secure)
      : Endpoint(std::move(domain), secure), _prefix(std::move(prefix))
  {
  }

  std::string GatewayEndpoint::api_url() const
  {
    return fmt::format("{}://{}/{}/api", scheme(), _domain, _prefix);
  }

  std::string GatewayEndpoint::port_host(std::string_view sandbox_id, int port) const
  {
    return fmt::format("{}/{}/{}/{}", _domain, _prefix, sandbox_id, port);
  }

  PublicEndpoint::PublicEndpoint(std::string domain) : Endpoint(std::move(domain), true) {}

  std::string PublicEndpoint::api_url() const
  {
    return fmt::format("https://api.{}", _domain);
  }

  std::string PublicEndpoint::port_host(std::string_view sandbox_id, int port) const
  {
    return fmt::format("{}-{}.{}", port, sandbox_id, _domain);
  }

} // namespace kruise::sdk::endpoint
