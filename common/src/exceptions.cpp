#include <kruise/common/exceptions.hpp>

#include <fmt/format.h>

namespace kruise::common {

  RetryExhaustedError::RetryExhaustedError(
      const std::string& policy, int attempts, const std::string& last_error,
      std::exception_ptr last_exception
  )
      : KruiseException(
            fmt::format("{} failed after {} attempts, last error: {}", policy, attempts, last_error)
        ),
        _policy(policy), _last_error(last_error), _last_exception(std::move(last_exception))
  {
    this->attempts(attempts);
  }

} // namespace kruise::common
