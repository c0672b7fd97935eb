#ifndef KRUISE_SDK_ENDPOINT_HPP
#define KRUISE_SDK_ENDPOINT_HPP

#include <memory>
#include <string>
#include <string_view>

namespace kruise::sdk::config {
  struct Config;
} // namespace kruise::sdk::config

namespace kruise::sdk::endpoint {

  enum class Type { NONE = 0, GATEWAY, PUBLIC };

  Type deserialize(std::string mode);

  // In-sandbox services reachable through the data plane.
  constexpr int ENVD_PORT = 49983;
  constexpr int CODE_INTERPRETER_PORT = 49999;

  struct Endpoint {

    Endpoint(std::string domain, bool secure);

    Endpoint(const Endpoint&) = default;
    Endpoint(Endpoint&&) = delete;
    Endpoint& operator=(const Endpoint&) = default;
    Endpoint& operator=(Endpoint&&) = delete;
    virtual ~Endpoint() = default;

    /**
     * @brief Base URL of the control-plane API, used for create, list, info, pause,
     * connect and kill calls.
     */
    virtual std::string api_url() const = 0;

    /**
     * @brief Host (and path) under which a single port exposed by a sandbox is reachable.
     * Does not include the scheme.
     */
    virtual std::string port_host(std::string_view sandbox_id, int port) const = 0;

    /**
     * @brief Whether HTTP clients talking to this deployment must validate the server
     * certificate. A self-hosted gateway in insecure mode does not present a trusted one.
     */
    virtual bool verify_certificates() const = 0;

    virtual bool requires_api_key() const = 0;

    std::string port_url(std::string_view sandbox_id, int port) const;

    std::string scheme() const
    {
      return _secure ? "https" : "http";
    }

    bool secure() const
    {
      return _secure;
    }

    const std::string& domain() const
    {
      return _domain;
    }

    /**
     * @brief factory method that returns the resolver selected by the configured
     * endpoint type.
     */
    static std::unique_ptr<Endpoint> construct(const config::Config& cfg);

  protected:
    std::string _domain;
    bool _secure;
  };

  struct GatewayEndpoint : Endpoint {

    GatewayEndpoint(std::string domain, std::string prefix, bool secure);

    std::string api_url() const override;
    std::string port_host(std::string_view sandbox_id, int port) const override;

    bool verify_certificates() const override
    {
      return _secure;
    }

    bool requires_api_key() const override
    {
      return false;
    }

    const std::string& prefix() const
    {
      return _prefix;
    }

  private:
    std::string _prefix;
  };

  struct PublicEndpoint : Endpoint {

    PublicEndpoint(std::string domain);

    std::string api_url() const override;
    std::string port_host(std::string_view sandbox_id, int port) const override;

    bool verify_certificates() const override
    {
      return true;
    }

    bool requires_api_key() const override
    {
      return true;
    }
  };

} // namespace kruise::sdk::endpoint

#endif
