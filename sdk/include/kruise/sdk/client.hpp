#ifndef KRUISE_SDK_CLIENT_HPP
#define KRUISE_SDK_CLIENT_HPP

#include <kruise/sdk/info.hpp>
#include <kruise/sdk/paginator.hpp>
#include <kruise/sdk/retry.hpp>
#include <kruise/sdk/sandbox.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kruise::sdk::config {
  struct Config;
} // namespace kruise::sdk::config

namespace kruise::sdk::endpoint {
  struct Endpoint;
} // namespace kruise::sdk::endpoint

namespace kruise::sdk {

  struct Lifecycle;
  struct Transport;

  /**
   * @brief Entry point of the SDK. The endpoint and transport are resolved once at
   * construction and shared, read-only, by every sandbox handle the client returns.
   */
  class Client {
  public:
    struct Options {
      std::string default_template;
      double request_timeout;
      retry::Policy execution_policy;
    };

    explicit Client(const config::Config& cfg);

    Client(
        std::shared_ptr<Lifecycle> lifecycle, std::shared_ptr<Transport> transport,
        std::shared_ptr<const endpoint::Endpoint> endpoint, Options options
    );

    // An empty template selects the configured default.
    Sandbox create(CreateOptions options = {});

    Sandbox connect(const std::string& sandbox_id, std::optional<int> timeout = std::nullopt);

    void pause(const std::string& sandbox_id);

    void kill(const std::string& sandbox_id);

    SandboxInfo get_info(const std::string& sandbox_id);

    void set_timeout(const std::string& sandbox_id, int timeout);

    SandboxPaginator list(SandboxQuery query = {}, int limit = SandboxPaginator::DEFAULT_LIMIT);

    std::vector<SandboxInfo>
    list_all(SandboxQuery query = {}, int limit = SandboxPaginator::DEFAULT_LIMIT);

    std::shared_ptr<Lifecycle> lifecycle() const
    {
      return _lifecycle;
    }

    std::shared_ptr<const endpoint::Endpoint> endpoint() const
    {
      return _endpoint;
    }

  private:
    Sandbox _sandbox(SandboxConnection&& connection) const;

    std::shared_ptr<Lifecycle> _lifecycle;
    std::shared_ptr<Transport> _transport;
    std::shared_ptr<const endpoint::Endpoint> _endpoint;
    Options _options;
  };

} // namespace kruise::sdk

#endif
