#ifndef KRUISE_SDK_EXECUTION_HPP
#define KRUISE_SDK_EXECUTION_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kruise::sdk {

  // Exception raised by the executed code itself, reported by the interpreter.
  struct ExecutionError {

    std::string name;
    std::string value;
    std::string traceback;
  };

  /**
   * @brief Rich artifact produced by the code, e.g. the figure shown by plt.show().
   * Binary formats (png, jpeg, pdf) are base64-encoded.
   */
  struct Result {

    std::optional<std::string> text;
    std::optional<std::string> html;
    std::optional<std::string> markdown;
    std::optional<std::string> svg;
    std::optional<std::string> png;
    std::optional<std::string> jpeg;
    std::optional<std::string> pdf;
    std::optional<std::string> latex;
    std::optional<std::string> json;
    std::optional<std::string> javascript;

    // Formats without a dedicated field, serialized as JSON.
    std::map<std::string, std::string> extra;

    bool is_main_result = false;

    std::vector<std::string> formats() const;
  };

  struct Logs {

    std::vector<std::string> std_out;
    std::vector<std::string> std_err;
  };

  struct Execution {

    std::vector<Result> results;
    Logs logs;
    std::optional<ExecutionError> error;
    std::optional<int> execution_count;

    // Text of the main result, if the code produced one.
    std::optional<std::string> text() const;
  };

  struct ExecutionCallbacks {

    std::function<void(const std::string&)> on_stdout;
    std::function<void(const std::string&)> on_stderr;
    std::function<void(const Result&)> on_result;
    std::function<void(const ExecutionError&)> on_error;
  };

  /**
   * @brief Incremental decoder of the interpreter's newline-delimited JSON stream.
   *
   * Each complete line is applied to the execution and forwarded to the matching
   * callback in the same step, so the callbacks observe exactly the fragments the
   * execution accumulates, in the same order.
   */
  class ExecutionParser {
  public:
    ExecutionParser(Execution& execution, const ExecutionCallbacks& callbacks);

    void feed(std::string_view chunk);

    // Processes a trailing line without a newline.
    void finish();

    bool ended() const
    {
      return _ended;
    }

    // Whether any event has been passed to a callback.
    bool delivered() const
    {
      return _delivered;
    }

  private:
    void _line(std::string_view line);

    Execution& _execution;
    const ExecutionCallbacks& _callbacks;
    std::string _buffer;
    bool _ended = false;
    bool _delivered = false;
  };

} // namespace kruise::sdk

#endif
