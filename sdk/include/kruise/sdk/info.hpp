#ifndef KRUISE_SDK_INFO_HPP
#define KRUISE_SDK_INFO_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kruise::sdk {

  enum class SandboxState {

    RUNNING = 0,
    PAUSING,
    PAUSED,
    TERMINATED,
    UNKNOWN

  };

  std::string_view to_string(SandboxState state);

  SandboxState state_from_string(std::string_view state);

  using Metadata = std::map<std::string, std::string>;

  struct CreateOptions {

    std::string template_id{};
    // Seconds of inactivity before the server tears the sandbox down; zero selects the
    // configured default.
    int timeout = 0;
    Metadata metadata{};
    std::map<std::string, std::string> env_vars{};
    bool secure = true;
    bool auto_pause = false;
    bool allow_internet_access = true;
  };

  // Returned by create and connect.
  struct SandboxConnection {

    std::string sandbox_id;
    std::string template_id;
    std::string client_id;
    std::string domain;
    std::string envd_version;
    std::string envd_access_token;
  };

  struct SandboxInfo {

    std::string sandbox_id;
    std::string template_id;
    std::string alias;
    std::string client_id;
    std::string started_at;
    std::string end_at;
    int cpu_count = 0;
    int memory_mb = 0;
    std::string envd_version;
    Metadata metadata{};
    SandboxState state = SandboxState::UNKNOWN;
  };

  struct SandboxQuery {

    Metadata metadata{};
    std::vector<SandboxState> states{};
  };

  struct SandboxPage {

    std::vector<SandboxInfo> sandboxes;
    std::optional<std::string> next_token;
  };

} // namespace kruise::sdk

#endif
