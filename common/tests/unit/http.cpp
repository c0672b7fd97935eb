#include <kruise/common/exceptions.hpp>
#include <kruise/common/http.hpp>

#include <gtest/gtest.h>

using namespace kruise::common;

TEST(HTTP, SplitUrl)
{
  {
    auto [origin, prefix] = http::split_url("http://sandbox.example.com/kruise/api");
    EXPECT_EQ(origin, "http://sandbox.example.com");
    EXPECT_EQ(prefix, "/kruise/api");
  }

  {
    auto [origin, prefix] = http::split_url("https://api.e2b.app");
    EXPECT_EQ(origin, "https://api.e2b.app");
    EXPECT_EQ(prefix, "");
  }

  {
    auto [origin, prefix] = http::split_url("http://localhost:8080/kruise/sbx-1/49983/");
    EXPECT_EQ(origin, "http://localhost:8080");
    EXPECT_EQ(prefix, "/kruise/sbx-1/49983");
  }
}

TEST(HTTP, SplitUrlWithoutScheme)
{
  EXPECT_THROW(http::split_url("sandbox.example.com/kruise/api"), InvalidConfigurationError);
}

TEST(HTTP, ResponseHeaders)
{
  http::Response response;
  response.status = 200;
  response.headers["x-next-token"] = "token-2";

  EXPECT_TRUE(response.ok());
  EXPECT_EQ(response.header("X-Next-Token"), "token-2");
  EXPECT_FALSE(response.header("x-missing").has_value());

  response.status = 409;
  EXPECT_FALSE(response.ok());
}

TEST(HTTP, MethodNames)
{
  EXPECT_EQ(http::to_string(http::Method::GET), "GET");
  EXPECT_EQ(http::to_string(http::Method::DELETE), "DELETE");
}

TEST(HTTP, EncodeQuery)
{
  EXPECT_EQ(http::encode_query({}), "");
  EXPECT_EQ(
      http::encode_query({{"path", "/tmp/a.txt"}, {"username", "user"}}),
      "path=%2Ftmp%2Fa.txt&username=user"
  );
  // Values are encoded once, an already encoded value keeps its escapes visible.
  EXPECT_EQ(http::encode_query({{"metadata", "case%3DA"}}), "metadata=case%253DA");
  EXPECT_EQ(http::encode_query({{"nextToken", "YWJj+ZA=="}}), "nextToken=YWJj%2BZA%3D%3D");
}
