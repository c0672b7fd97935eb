#ifndef KRUISE_SDK_CODE_INTERPRETER_HPP
#define KRUISE_SDK_CODE_INTERPRETER_HPP

#include <kruise/sdk/execution.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kruise::sdk {

  struct SandboxContext;

  // Interpreter state kept across executions, e.g. variables defined by previous code.
  struct CodeContext {

    std::string id;
    std::string language;
    std::string cwd;
  };

  struct RunCodeOptions {

    static constexpr double DEFAULT_TIMEOUT = 300;

    // Language of a fresh default context; mutually exclusive with context_id.
    std::optional<std::string> language{};
    std::optional<std::string> context_id{};
    std::map<std::string, std::string> env_vars{};
    ExecutionCallbacks callbacks{};
    // Seconds the whole execution may take.
    double timeout = DEFAULT_TIMEOUT;
  };

  class CodeInterpreter {
  public:
    explicit CodeInterpreter(std::shared_ptr<const SandboxContext> context);

    /**
     * @brief Runs code in the sandbox interpreter and returns the aggregated outcome.
     * Failed attempts are retried with the execution policy of the sandbox; each attempt
     * starts from an empty execution. Callbacks run on the calling thread, and an attempt
     * that fails after invoking one is not retried.
     *
     * An exception raised by the code is not a failure of this call, it is reported
     * in Execution::error.
     *
     * @throws common::StreamInterruptedError when the stream broke after output was delivered
     */
    Execution run_code(const std::string& code, const RunCodeOptions& options = {}) const;

    CodeContext create_code_context(
        const std::optional<std::string>& language = std::nullopt,
        const std::optional<std::string>& cwd = std::nullopt
    ) const;

  private:
    Execution _run_once(const std::string& code, const RunCodeOptions& options) const;

    std::shared_ptr<const SandboxContext> _context;
  };

} // namespace kruise::sdk

#endif
