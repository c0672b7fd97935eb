#ifndef KRUISE_SDK_CONFIG_HPP
#define KRUISE_SDK_CONFIG_HPP

#include <kruise/sdk/endpoint.hpp>

#include <istream>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace kruise::sdk::config {

  struct Retry {

    int max_attempts;
    int delay_ms;

    void load(cereal::JSONInputArchive& archive);
  };

  struct ConnectRetry : Retry {

    static constexpr int DEFAULT_MAX_ATTEMPTS = 30;
    static constexpr int DEFAULT_DELAY_MS = 2000;

    ConnectRetry()
    {
      set_defaults();
    }

    void set_defaults();
  };

  struct ExecutionRetry : Retry {

    static constexpr int DEFAULT_MAX_ATTEMPTS = 5;
    static constexpr int DEFAULT_DELAY_MS = 5000;

    ExecutionRetry()
    {
      set_defaults();
    }

    void set_defaults();
  };

  struct Config {

    static constexpr int DEFAULT_REQUEST_TIMEOUT = 30;
    static constexpr int DEFAULT_SANDBOX_TIMEOUT = 300;
    static constexpr int DEFAULT_HTTP_THREADS = 2;
    static constexpr const char* DEFAULT_GATEWAY_PREFIX = "kruise";
    static constexpr const char* DEFAULT_TEMPLATE = "code-interpreter";

    static constexpr const char* ENV_DOMAIN = "E2B_DOMAIN";
    static constexpr const char* ENV_API_KEY = "E2B_API_KEY";
    static constexpr const char* ENV_ENDPOINT = "KRUISE_ENDPOINT";
    static constexpr const char* ENV_GATEWAY_PREFIX = "KRUISE_GATEWAY_PREFIX";
    static constexpr const char* ENV_GATEWAY_HTTPS = "KRUISE_GATEWAY_HTTPS";

    Config()
    {
      set_defaults();
    }

    endpoint::Type endpoint_type;
    std::string domain;
    std::string gateway_prefix;
    std::string api_key;
    bool secure;

    // Seconds of a single control-plane round trip.
    int request_timeout;
    int sandbox_timeout;
    std::string default_template;
    int http_client_io_threads;

    ConnectRetry connect_retry;
    ExecutionRetry execution_retry;

    bool verbose;

    void set_defaults();

    void load(cereal::JSONInputArchive& archive);

    /**
     * @brief Overrides loaded values with the deployment environment:
     * E2B_DOMAIN, E2B_API_KEY, KRUISE_ENDPOINT, KRUISE_GATEWAY_PREFIX and KRUISE_GATEWAY_HTTPS.
     */
    void load_environment();

    static Config deserialize(int argc, char** argv);
    static Config deserialize(std::istream& in);
    static Config from_environment();
  };

} // namespace kruise::sdk::config

#endif
