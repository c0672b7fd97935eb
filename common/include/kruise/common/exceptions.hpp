#ifndef KRUISE_COMMON_EXCEPTIONS_HPP
#define KRUISE_COMMON_EXCEPTIONS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace kruise::common {

  struct KruiseException : std::runtime_error {

    KruiseException(const std::string& msg) : std::runtime_error(msg) {}

    /**
     * @brief Number of times the failing operation was invoked before the error was
     * surfaced. Set by the retry executor; one when no retry was attempted.
     */
    int attempts() const
    {
      return _attempts;
    }

    void attempts(int count)
    {
      _attempts = count;
    }

  private:
    int _attempts = 1;
  };

  struct InvalidConfigurationError : KruiseException {

    InvalidConfigurationError(const std::string& msg) : KruiseException(msg) {}
  };

  struct TransportError : KruiseException {

    TransportError(const std::string& msg) : KruiseException(msg) {}
  };

  struct ApiError : KruiseException {

    ApiError(int status, std::string body, const std::string& msg)
        : KruiseException(msg), _status(status), _body(std::move(body))
    {
    }

    int status() const
    {
      return _status;
    }

    // Raw response payload, kept for diagnostics.
    const std::string& body() const
    {
      return _body;
    }

  private:
    int _status;
    std::string _body;
  };

  struct NotFoundError : ApiError {

    NotFoundError(std::string body, const std::string& msg) : ApiError(404, std::move(body), msg)
    {
    }
  };

  struct SandboxPausingError : ApiError {

    SandboxPausingError(int status, std::string body, const std::string& msg)
        : ApiError(status, std::move(body), msg)
    {
    }
  };

  struct CommandExitError : KruiseException {

    CommandExitError(
        int exit_code, std::string std_out, std::string std_err, std::string error,
        const std::string& msg
    )
        : KruiseException(msg), exit_code(exit_code), std_out(std::move(std_out)),
          std_err(std::move(std_err)), error(std::move(error))
    {
    }

    int exit_code;
    std::string std_out;
    std::string std_err;
    std::string error;
  };

  /**
   * @brief A streamed call failed after some of its output already reached the caller's
   * callbacks. Repeating the call would deliver that output again, so it is not retried.
   */
  struct StreamInterruptedError : KruiseException {

    StreamInterruptedError(const std::string& msg, std::exception_ptr cause)
        : KruiseException(msg), _cause(std::move(cause))
    {
    }

    std::exception_ptr cause() const
    {
      return _cause;
    }

  private:
    std::exception_ptr _cause;
  };

  struct RetryExhaustedError : KruiseException {

    RetryExhaustedError(
        const std::string& policy, int attempts, const std::string& last_error,
        std::exception_ptr last_exception
    );

    const std::string& policy() const
    {
      return _policy;
    }

    const std::string& last_error() const
    {
      return _last_error;
    }

    std::exception_ptr last_exception() const
    {
      return _last_exception;
    }

  private:
    std::string _policy;
    std::string _last_error;
    std::exception_ptr _last_exception;
  };

} // namespace kruise::common

#endif
