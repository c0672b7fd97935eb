#ifndef KRUISE_SDK_COMMANDS_HPP
#define KRUISE_SDK_COMMANDS_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kruise::sdk {

  struct SandboxContext;

  struct CommandResult {

    std::string std_out;
    std::string std_err;
    int exit_code = 0;
    // Reported by the daemon when the process could not run to completion.
    std::string error;
  };

  struct CommandOutput {

    enum class Stream { STDOUT = 0, STDERR };

    Stream stream;
    std::string data;
  };

  struct CommandOptions {

    static constexpr double DEFAULT_TIMEOUT = 60;
    static constexpr const char* DEFAULT_USER = "user";

    std::string cwd{};
    std::string user = DEFAULT_USER;
    std::map<std::string, std::string> envs{};
    std::function<void(const std::string&)> on_stdout{};
    std::function<void(const std::string&)> on_stderr{};
    // Seconds the command may run; zero keeps the connection open indefinitely.
    double timeout = DEFAULT_TIMEOUT;
  };

  /**
   * @brief Live reference to a command started in the sandbox.
   *
   * Output is consumed incrementally with next(). The stdout and stderr callbacks run
   * on the thread that consumes a segment, through next() or wait(), once per segment.
   * Abandoning a handle does not stop the process, it has to be killed explicitly.
   * Copies refer to the same command.
   */
  class CommandHandle {
  public:
    struct State;

    CommandHandle(std::shared_ptr<const SandboxContext> context, std::string tag, std::string user);

    // Blocks until the next output segment is available; empty once the process has exited.
    std::optional<CommandOutput> next();

    /**
     * @brief Blocks until the process exits.
     *
     * @throws common::CommandExitError when the command exited with a non-zero status
     */
    CommandResult wait();

    /**
     * @brief Sends SIGKILL to the process. Valid at any time, including after the
     * process has already exited.
     *
     * @return whether a running process was signalled
     */
    bool kill();

    const std::string& tag() const
    {
      return _tag;
    }

    // Known once the daemon has reported the process start.
    std::optional<int> pid() const;

    bool finished() const;

  private:
    friend class Commands;

    bool _delivered() const;

    std::shared_ptr<const SandboxContext> _context;
    std::string _tag;
    std::string _user;
    std::shared_ptr<State> _state;
  };

  class Commands {
  public:
    static constexpr const char* SHELL = "/bin/bash";

    explicit Commands(std::shared_ptr<const SandboxContext> context);

    /**
     * @brief Runs a shell command and waits for it to exit. Failed attempts are retried
     * with the execution policy of the sandbox; a non-zero exit is a result, not a
     * failure, and is never retried. Neither is an attempt that already passed output
     * to the callbacks.
     *
     * @throws common::CommandExitError when the command exited with a non-zero status
     * @throws common::StreamInterruptedError when the stream broke after output was delivered
     */
    CommandResult run(const std::string& cmd, const CommandOptions& options = {}) const;

    // Starts a shell command and returns without waiting for any output.
    CommandHandle run_background(const std::string& cmd, const CommandOptions& options = {}) const;

    // Returns false when no process with this pid is running.
    bool kill(int pid) const;

  private:
    CommandHandle _start(const std::string& cmd, const CommandOptions& options) const;

    std::shared_ptr<const SandboxContext> _context;
  };

} // namespace kruise::sdk

#endif
