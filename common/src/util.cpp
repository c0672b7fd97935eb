#include <kruise/common/util.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace kruise::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  std::optional<std::string> getenv(const std::string& name)
  {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
      return std::nullopt;
    }
    return std::string{value};
  }

  bool parse_bool(std::string_view value)
  {
    std::string lowered{value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
      return std::tolower(c);
    });

    if (lowered == "true" || lowered == "1" || lowered == "yes") {
      return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
      return false;
    }
    throw InvalidConfigurationError(fmt::format("Cannot interpret {} as a boolean", value));
  }

} // namespace kruise::common::util
