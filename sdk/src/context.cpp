#include <kruise/sdk/context.hpp>

#include <kruise/sdk/endpoint.hpp>

#include <drogon/utils/Utilities.h>

namespace kruise::sdk {

  std::string SandboxContext::url(int port) const
  {
    return endpoint->port_url(sandbox_id, port);
  }

  common::http::Request SandboxContext::request(common::http::Method method, std::string path) const
  {
    common::http::Request req;
    req.method = method;
    req.path = std::move(path);
    req.timeout = request_timeout;
    if (!access_token.empty()) {
      req.headers.emplace_back("X-Access-Token", access_token);
    }
    return req;
  }

  std::string SandboxContext::user_authorization(const std::string& user)
  {
    auto credentials = user + ":";
    return "Basic " + drogon::utils::base64Encode(
                          reinterpret_cast<const unsigned char*>(credentials.data()), credentials.size()
                      );
  }

} // namespace kruise::sdk
