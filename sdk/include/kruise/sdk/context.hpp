#ifndef KRUISE_SDK_CONTEXT_HPP
#define KRUISE_SDK_CONTEXT_HPP

#include <kruise/common/http.hpp>
#include <kruise/sdk/retry.hpp>

#include <memory>
#include <string>

namespace kruise::sdk::endpoint {
  struct Endpoint;
} // namespace kruise::sdk::endpoint

namespace kruise::sdk {

  struct Transport;

  /**
   * @brief Everything a data-plane call needs to reach one sandbox. Shared by the
   * sandbox handle and the services it exposes, and never modified after connecting.
   */
  struct SandboxContext {

    std::string sandbox_id;
    std::string access_token;
    std::shared_ptr<Transport> transport;
    std::shared_ptr<const endpoint::Endpoint> endpoint;
    retry::Policy execution_policy;
    // Seconds of a single round trip that does not run user code.
    double request_timeout;

    std::string url(int port) const;

    // Request with the access token of the sandbox daemon attached.
    common::http::Request request(common::http::Method method, std::string path) const;

    // Basic authorization selecting the user the daemon acts as.
    static std::string user_authorization(const std::string& user);
  };

} // namespace kruise::sdk

#endif
