#ifndef KRUISE_COMMON_HTTP_HPP
#define KRUISE_COMMON_HTTP_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace drogon {
  struct HttpRequest;
  struct HttpResponse;
  enum class ReqResult;
  struct HttpClient;
} // namespace drogon

namespace trantor {
  struct EventLoop;
  struct EventLoopThreadPool;
} // namespace trantor

namespace kruise::common::http {

  enum class Method { GET = 0, POST, PUT, DELETE };

  std::string_view to_string(Method method);

  struct Request {

    using pairs_t = std::vector<std::pair<std::string, std::string>>;

    Method method = Method::GET;
    std::string path;
    pairs_t parameters{};
    pairs_t headers{};
    std::string body{};
    std::string content_type{};
    // Seconds; zero disables the per-request timeout.
    double timeout = 0;
  };

  struct Response {

    int status = 0;
    std::string body{};
    // Header names are stored lowercase.
    std::map<std::string, std::string> headers{};

    bool ok() const
    {
      return status >= 200 && status < 300;
    }

    std::optional<std::string> header(std::string_view name) const;
  };

  /**
   * @brief Splits an absolute URL into the origin used to open a connection and
   * the path prefix that must be prepended to every request path.
   *
   * "http://example.com/kruise/api" -> {"http://example.com", "/kruise/api"}
   */
  std::pair<std::string, std::string> split_url(std::string_view url);

  /**
   * @brief Builds a query string, encoding every key and value exactly once.
   * drogon only serializes the parameters of body-less requests. Requests with a
   * body carry their query in the path.
   */
  std::string encode_query(const Request::pairs_t& parameters);

  struct HTTPClient {

    using callback_t = std::function<void(std::optional<Response>&&, const std::string& error)>;

    HTTPClient();

    HTTPClient(const std::string& address, trantor::EventLoop* loop, bool verify_certificates);

    void send(Request&& request, callback_t&& callback);

    // Loop running the callbacks of this client.
    trantor::EventLoop* loop() const
    {
      return _loop;
    }

  private:
    std::shared_ptr<drogon::HttpClient> _http_client;
    trantor::EventLoop* _loop;
  };

  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();
    static bool initialized();

    static HTTPClient create_client(const std::string& address, bool verify_certificates = true);

  private:
    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
  };

} // namespace kruise::common::http

#endif
