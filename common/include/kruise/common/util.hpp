#ifndef KRUISE_COMMON_UTIL_HPP
#define KRUISE_COMMON_UTIL_HPP

#include <kruise/common/exceptions.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kruise::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Returns the value of an environment variable, treating an empty value as unset.
  std::optional<std::string> getenv(const std::string& name);

  bool parse_bool(std::string_view value);

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration section {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  template <typename T>
  void cereal_load_value(cereal::JSONInputArchive& archive, const std::string& name, T& value)
  {
    try {
      archive(cereal::make_nvp(name, value));
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {
        archive.setNextName(nullptr);
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration value {}, reason: {}", name, exc.what())
        );
      }
    }
  }

} // namespace kruise::common::util

#endif
