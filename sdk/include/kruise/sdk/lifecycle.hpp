#ifndef KRUISE_SDK_LIFECYCLE_HPP
#define KRUISE_SDK_LIFECYCLE_HPP

#include <kruise/common/http.hpp>
#include <kruise/sdk/info.hpp>
#include <kruise/sdk/retry.hpp>

#include <memory>
#include <optional>
#include <string>

namespace spdlog {
  class logger;
} // namespace spdlog

namespace kruise::sdk::endpoint {
  struct Endpoint;
} // namespace kruise::sdk::endpoint

namespace kruise::sdk {

  struct Transport;

  /**
   * @brief Session lifecycle operations of the control plane. State is owned by the
   * server; implementations only forward requests and translate replies.
   */
  struct Lifecycle {

    Lifecycle() = default;
    Lifecycle(const Lifecycle&) = delete;
    Lifecycle(Lifecycle&&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;
    Lifecycle& operator=(Lifecycle&&) = delete;
    virtual ~Lifecycle() = default;

    virtual SandboxConnection create(const CreateOptions& options) = 0;

    /**
     * @brief Connects to a running sandbox or resumes a paused one. The identifier
     * never changes across a pause/resume cycle.
     *
     * @throws common::NotFoundError for unknown or expired sandboxes
     * @throws common::RetryExhaustedError when the sandbox did not leave the pausing state in time
     */
    virtual SandboxConnection connect(const std::string& sandbox_id, std::optional<int> timeout) = 0;

    // Requests suspension and returns once the request is accepted.
    virtual void pause(const std::string& sandbox_id) = 0;

    // Terminating an already terminated sandbox is not an error.
    virtual void kill(const std::string& sandbox_id) = 0;

    virtual SandboxInfo get_info(const std::string& sandbox_id) = 0;

    virtual void set_timeout(const std::string& sandbox_id, int timeout) = 0;

    virtual SandboxPage
    list(const SandboxQuery& query, const std::optional<std::string>& next_token, int limit) = 0;
  };

  /**
   * @brief Lifecycle backed by the E2B-compatible REST API of the control plane,
   * reached through the configured endpoint.
   */
  struct ControlPlane : Lifecycle {

    struct Options {
      std::string api_key;
      // Seconds of a single round trip.
      int request_timeout;
      // Idle timeout applied when the caller does not choose one.
      int sandbox_timeout;
      retry::Policy connect_policy;
    };

    ControlPlane(
        std::shared_ptr<Transport> transport, std::shared_ptr<const endpoint::Endpoint> endpoint,
        Options options
    );

    SandboxConnection create(const CreateOptions& options) override;
    SandboxConnection connect(const std::string& sandbox_id, std::optional<int> timeout) override;
    void pause(const std::string& sandbox_id) override;
    void kill(const std::string& sandbox_id) override;
    SandboxInfo get_info(const std::string& sandbox_id) override;
    void set_timeout(const std::string& sandbox_id, int timeout) override;
    SandboxPage list(
        const SandboxQuery& query, const std::optional<std::string>& next_token, int limit
    ) override;

  private:
    common::http::Request _request(common::http::Method method, std::string path) const;

    std::shared_ptr<Transport> _transport;
    std::shared_ptr<const endpoint::Endpoint> _endpoint;
    Options _options;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace kruise::sdk

#endif
