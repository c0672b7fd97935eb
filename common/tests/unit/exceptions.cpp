#include <kruise/common/exceptions.hpp>

#include <gtest/gtest.h>

using namespace kruise::common;

TEST(Exceptions, Hierarchy)
{
  try {
    throw NotFoundError{R"({"code":404,"message":"sandbox not found"})", "Querying failed"};
  } catch (ApiError& err) {
    EXPECT_EQ(err.status(), 404);
    EXPECT_EQ(err.body(), R"({"code":404,"message":"sandbox not found"})");
    EXPECT_EQ(err.attempts(), 1);
  }

  try {
    throw SandboxPausingError{409, "sandbox is pausing", "Connecting failed"};
  } catch (KruiseException& err) {
    EXPECT_STREQ(err.what(), "Connecting failed");
  }
}

TEST(Exceptions, RetryExhausted)
{
  auto last = std::make_exception_ptr(TransportError{"connection refused"});
  RetryExhaustedError err{"execution", 5, "connection refused", last};

  EXPECT_EQ(err.attempts(), 5);
  EXPECT_EQ(err.policy(), "execution");
  EXPECT_EQ(err.last_error(), "connection refused");
  EXPECT_STREQ(err.what(), "execution failed after 5 attempts, last error: connection refused");
  EXPECT_THROW(std::rethrow_exception(err.last_exception()), TransportError);
}

TEST(Exceptions, CommandExit)
{
  CommandExitError err{127, "", "bash: foo: command not found\n", "", "Command exited with code 127"};

  EXPECT_EQ(err.exit_code, 127);
  EXPECT_TRUE(err.std_out.empty());
  EXPECT_NE(err.std_err.find("command not found"), std::string::npos);
}

TEST(Exceptions, StreamInterrupted)
{
  auto cause = std::make_exception_ptr(KruiseException{"Code execution ended unexpectedly!"});
  StreamInterruptedError err{"Execution in sandbox sbx-001 was interrupted", cause};

  EXPECT_EQ(err.attempts(), 1);
  EXPECT_THROW(std::rethrow_exception(err.cause()), KruiseException);
}
