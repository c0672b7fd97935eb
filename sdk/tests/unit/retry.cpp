#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/config.hpp>
#include <kruise/sdk/retry.hpp>

#include <gtest/gtest.h>

using namespace kruise::sdk;
using namespace kruise::common;
using namespace std::chrono_literals;

TEST(Retry, SucceedsAfterTransientFailures)
{
  auto policy = retry::Policy::execution(5, 0ms);

  int calls = 0;
  auto result = retry::execute_with_retry(
      [&]() {
        if (++calls < 3) {
          throw TransportError{"connection reset"};
        }
        return 42;
      },
      policy
  );

  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 3);
}

TEST(Retry, AttemptBound)
{
  for (int max_attempts : {1, 3, 5}) {

    auto policy = retry::Policy::execution(max_attempts, 0ms);
    int calls = 0;

    try {
      retry::execute_with_retry(
          [&]() -> int { ++calls; throw TransportError{fmt::format("failure {}", calls)}; },
          policy
      );
      FAIL() << "Exhaustion was not reported";
    } catch (RetryExhaustedError& err) {
      EXPECT_EQ(err.attempts(), max_attempts);
      EXPECT_EQ(err.policy(), "execution");
      // The error of the final attempt is the one surfaced.
      EXPECT_EQ(err.last_error(), fmt::format("failure {}", max_attempts));
      EXPECT_THROW(std::rethrow_exception(err.last_exception()), TransportError);
    }

    EXPECT_EQ(calls, max_attempts);
  }
}

TEST(Retry, NoRetryOnTerminal)
{
  auto policy = retry::Policy::execution(5, 0ms);

  int calls = 0;
  try {
    retry::execute_with_retry(
        [&]() {
          ++calls;
          throw CommandExitError{1, "", "", "", "Command exited with code 1"};
        },
        policy
    );
    FAIL() << "Terminal error was not propagated";
  } catch (CommandExitError& err) {
    EXPECT_EQ(err.exit_code, 1);
    EXPECT_EQ(err.attempts(), 1);
  }
  EXPECT_EQ(calls, 1);

  calls = 0;
  EXPECT_THROW(
      retry::execute_with_retry(
          [&]() {
            ++calls;
            throw NotFoundError{"", "sandbox not found"};
          },
          policy
      ),
      NotFoundError
  );
  EXPECT_EQ(calls, 1);
}

TEST(Retry, TerminalAfterTransientIsAnnotated)
{
  auto policy = retry::Policy::pausing(30, 0ms);

  int calls = 0;
  try {
    retry::execute_with_retry(
        [&]() {
          if (++calls < 4) {
            throw SandboxPausingError{400, "", "sandbox is pausing, please wait a moment"};
          }
          throw NotFoundError{"", "sandbox not found"};
        },
        policy
    );
    FAIL() << "Terminal error was not propagated";
  } catch (NotFoundError& err) {
    EXPECT_EQ(err.attempts(), 4);
  }
  EXPECT_EQ(calls, 4);
}

TEST(Retry, PausingPredicate)
{
  EXPECT_TRUE(retry::is_pausing_transient(SandboxPausingError{400, "", "pausing"}));
  EXPECT_TRUE(retry::is_pausing_transient(
      ApiError{400, "", "Connecting failed: sandbox is pausing, please wait a moment and try again"}
  ));
  EXPECT_FALSE(retry::is_pausing_transient(TransportError{"connection refused"}));
  EXPECT_FALSE(retry::is_pausing_transient(NotFoundError{"", "sandbox not found"}));

  auto policy = retry::Policy::pausing(3, 0ms);
  int calls = 0;
  EXPECT_THROW(
      retry::execute_with_retry(
          [&]() {
            ++calls;
            throw TransportError{"connection refused"};
          },
          policy
      ),
      TransportError
  );
  EXPECT_EQ(calls, 1);
}

TEST(Retry, ExecutionPredicate)
{
  EXPECT_TRUE(retry::is_execution_transient(TransportError{"timeout"}));
  EXPECT_TRUE(retry::is_execution_transient(ApiError{502, "", "bad gateway"}));
  EXPECT_TRUE(retry::is_execution_transient(std::runtime_error{"anything"}));

  EXPECT_FALSE(retry::is_execution_transient(RetryExhaustedError{"connect", 30, "pausing", nullptr}));
  EXPECT_FALSE(retry::is_execution_transient(CommandExitError{2, "", "", "", "exit 2"}));
  EXPECT_FALSE(retry::is_execution_transient(NotFoundError{"", "gone"}));
  EXPECT_FALSE(retry::is_execution_transient(InvalidConfigurationError{"no domain"}));
  EXPECT_FALSE(retry::is_execution_transient(StreamInterruptedError{"interrupted", nullptr}));
}

TEST(Retry, Policies)
{
  auto pausing = retry::Policy::pausing();
  EXPECT_EQ(pausing.max_attempts, 30);
  EXPECT_EQ(pausing.delay, 2s);

  auto execution = retry::Policy::execution();
  EXPECT_EQ(execution.max_attempts, 5);
  EXPECT_EQ(execution.delay, 5s);

  config::ConnectRetry cfg;
  cfg.max_attempts = 7;
  cfg.delay_ms = 100;
  auto configured = retry::Policy::pausing(cfg);
  EXPECT_EQ(configured.max_attempts, 7);
  EXPECT_EQ(configured.delay, 100ms);
}

TEST(Retry, InvalidPolicy)
{
  auto policy = retry::Policy::execution(0, 0ms);
  int calls = 0;
  EXPECT_THROW(retry::execute_with_retry([&]() { return ++calls; }, policy), InvalidConfigurationError);
  EXPECT_EQ(calls, 0);
}

TEST(Retry, Delay)
{
  auto policy = retry::Policy::execution(3, 20ms);

  auto begin = std::chrono::steady_clock::now();
  EXPECT_THROW(
      retry::execute_with_retry([]() -> int { throw TransportError{"down"}; }, policy),
      RetryExhaustedError
  );
  auto elapsed = std::chrono::steady_clock::now() - begin;

  // Two sleeps between three attempts, none after the last one.
  EXPECT_GE(elapsed, 40ms);
}
