#include <kruise/sdk/config.hpp>

#include <kruise/common/exceptions.hpp>
#include <kruise/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk::config {

  void Retry::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(max_attempts));
    archive(CEREAL_NVP(delay_ms));

    if (max_attempts < 1) {
      throw common::InvalidConfigurationError(
          fmt::format("Retry needs at least one attempt, got {}", max_attempts)
      );
    }
    if (delay_ms < 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Retry delay cannot be negative, got {}", delay_ms)
      );
    }
  }

  void ConnectRetry::set_defaults()
  {
    max_attempts = DEFAULT_MAX_ATTEMPTS;
    delay_ms = DEFAULT_DELAY_MS;
  }

  void ExecutionRetry::set_defaults()
  {
    max_attempts = DEFAULT_MAX_ATTEMPTS;
    delay_ms = DEFAULT_DELAY_MS;
  }

  void Config::set_defaults()
  {
    endpoint_type = endpoint::Type::GATEWAY;
    domain = "";
    gateway_prefix = DEFAULT_GATEWAY_PREFIX;
    api_key = "";
    secure = true;
    request_timeout = DEFAULT_REQUEST_TIMEOUT;
    sandbox_timeout = DEFAULT_SANDBOX_TIMEOUT;
    default_template = DEFAULT_TEMPLATE;
    http_client_io_threads = DEFAULT_HTTP_THREADS;
    verbose = false;

    connect_retry.set_defaults();
    execution_retry.set_defaults();
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    // Only the endpoint type is mandatory.
    std::string endpoint_type;
    archive(cereal::make_nvp("endpoint-type", endpoint_type));
    this->endpoint_type = endpoint::deserialize(endpoint_type);
    if (this->endpoint_type == endpoint::Type::NONE) {
      throw common::InvalidConfigurationError(
          fmt::format("Unknown endpoint type {}", endpoint_type)
      );
    }

    common::util::cereal_load_value(archive, "verbose", verbose);
    common::util::cereal_load_value(archive, "domain", domain);
    common::util::cereal_load_value(archive, "gateway-prefix", gateway_prefix);
    common::util::cereal_load_value(archive, "api-key", api_key);
    common::util::cereal_load_value(archive, "secure", secure);
    common::util::cereal_load_value(archive, "request-timeout", request_timeout);
    common::util::cereal_load_value(archive, "sandbox-timeout", sandbox_timeout);
    common::util::cereal_load_value(archive, "default-template", default_template);
    common::util::cereal_load_value(archive, "http-client-io-threads", http_client_io_threads);

    common::util::cereal_load_optional(archive, "connect-retry", this->connect_retry);
    common::util::cereal_load_optional(archive, "execution-retry", this->execution_retry);

    if (request_timeout <= 0) {
      throw common::InvalidConfigurationError("Request timeout must be positive!");
    }
    if (http_client_io_threads <= 0) {
      throw common::InvalidConfigurationError("At least one HTTP client thread is required!");
    }
  }

  void Config::load_environment()
  {
    if (auto val = common::util::getenv(ENV_DOMAIN)) {
      domain = std::move(val.value());
    }
    if (auto val = common::util::getenv(ENV_API_KEY)) {
      api_key = std::move(val.value());
    }
    if (auto val = common::util::getenv(ENV_ENDPOINT)) {
      endpoint_type = endpoint::deserialize(val.value());
      if (endpoint_type == endpoint::Type::NONE) {
        throw common::InvalidConfigurationError(
            fmt::format("Unknown endpoint type {} in {}", val.value(), ENV_ENDPOINT)
        );
      }
    }
    if (auto val = common::util::getenv(ENV_GATEWAY_PREFIX)) {
      gateway_prefix = std::move(val.value());
    }
    if (auto val = common::util::getenv(ENV_GATEWAY_HTTPS)) {
      secure = common::util::parse_bool(val.value());
    }
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Config Config::deserialize(int argc, char** argv)
  {
    cxxopts::Options options("kruise-sandbox", "Client of a Kruise sandbox deployment.");
    options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))(
        "v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false")
    );
    options.allow_unrecognised_options();
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Config cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError(
            fmt::format("Could not open config file {}", config_file)
        );
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    }

    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }
    cfg.load_environment();

    return cfg;
  }

  Config Config::from_environment()
  {
    Config cfg;
    cfg.load_environment();
    return cfg;
  }

} // namespace kruise::sdk::config
