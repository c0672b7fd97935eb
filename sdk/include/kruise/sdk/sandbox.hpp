#ifndef KRUISE_SDK_SANDBOX_HPP
#define KRUISE_SDK_SANDBOX_HPP

#include <kruise/sdk/code_interpreter.hpp>
#include <kruise/sdk/commands.hpp>
#include <kruise/sdk/filesystem.hpp>
#include <kruise/sdk/info.hpp>

#include <memory>
#include <optional>
#include <string>

namespace kruise::sdk {

  struct Lifecycle;
  struct SandboxContext;

  /**
   * @brief Client-side handle of one sandbox. Holds no state of its own beyond the
   * connection credentials; every query goes to the control plane.
   */
  class Sandbox {
  public:
    Sandbox(std::shared_ptr<Lifecycle> lifecycle, std::shared_ptr<const SandboxContext> context,
            SandboxConnection connection);

    const std::string& id() const
    {
      return _connection.sandbox_id;
    }

    const SandboxConnection& connection() const
    {
      return _connection;
    }

    // Host of a port exposed by the sandbox, without the scheme.
    std::string get_host(int port) const;

    SandboxInfo get_info() const;

    // False also for sandboxes that no longer exist.
    bool is_running() const;

    void pause() const;

    /**
     * @brief Resumes the sandbox if it is paused and refreshes the credentials of this
     * handle. Waits while the sandbox is still being paused.
     */
    Sandbox& connect(std::optional<int> timeout = std::nullopt);

    void kill() const;

    void set_timeout(int timeout) const;

    Execution run_code(const std::string& code, const RunCodeOptions& options = {}) const;

    CodeContext create_code_context(
        const std::optional<std::string>& language = std::nullopt,
        const std::optional<std::string>& cwd = std::nullopt
    ) const;

    const Commands& commands() const
    {
      return _commands;
    }

    const Filesystem& files() const
    {
      return _files;
    }

  private:
    std::shared_ptr<Lifecycle> _lifecycle;
    std::shared_ptr<const SandboxContext> _context;
    SandboxConnection _connection;

    CodeInterpreter _interpreter;
    Commands _commands;
    Filesystem _files;
  };

} // namespace kruise::sdk

#endif
