#include <kruise/common/http.hpp>

#include <kruise/common/exceptions.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/utils/Utilities.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace kruise::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;

  namespace {

    std::mutex factory_mutex;

    drogon::HttpMethod convert(Method method)
    {
      switch (method) {
      case Method::GET:
        return drogon::Get;
      case Method::POST:
        return drogon::Post;
      case Method::PUT:
        return drogon::Put;
      case Method::DELETE:
        return drogon::Delete;
      }
      return drogon::Invalid;
    }

    std::string describe(drogon::ReqResult result)
    {
      switch (result) {
      case drogon::ReqResult::Ok:
        return "ok";
      case drogon::ReqResult::BadResponse:
        return "bad response";
      case drogon::ReqResult::NetworkFailure:
        return "network failure";
      case drogon::ReqResult::BadServerAddress:
        return "bad server address";
      case drogon::ReqResult::Timeout:
        return "timeout";
      case drogon::ReqResult::HandshakeError:
        return "TLS handshake error";
      case drogon::ReqResult::InvalidCertificate:
        return "invalid certificate";
      default:
        return "unknown error";
      }
    }

  } // namespace

  std::string_view to_string(Method method)
  {
    switch (method) {
    case Method::GET:
      return "GET";
    case Method::POST:
      return "POST";
    case Method::PUT:
      return "PUT";
    case Method::DELETE:
      return "DELETE";
    }
    return "UNKNOWN";
  }

  std::optional<std::string> Response::header(std::string_view name) const
  {
    std::string key{name};
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
      return std::tolower(c);
    });

    auto it = headers.find(key);
    if (it == headers.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::pair<std::string, std::string> split_url(std::string_view url)
  {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
      throw InvalidConfigurationError(fmt::format("URL {} has no scheme", url));
    }

    auto path_begin = url.find('/', scheme_end + 3);
    if (path_begin == std::string_view::npos) {
      return {std::string{url}, ""};
    }

    std::string_view prefix = url.substr(path_begin);
    while (!prefix.empty() && prefix.back() == '/') {
      prefix.remove_suffix(1);
    }
    return {std::string{url.substr(0, path_begin)}, std::string{prefix}};
  }

  std::string encode_query(const Request::pairs_t& parameters)
  {
    std::string query;
    for (const auto& [key, value] : parameters) {
      if (!query.empty()) {
        query += '&';
      }
      query += drogon::utils::urlEncodeComponent(key);
      query += '=';
      query += drogon::utils::urlEncodeComponent(value);
    }
    return query;
  }

  HTTPClient::HTTPClient() : _http_client(nullptr), _loop(nullptr) {}

  HTTPClient::HTTPClient(
      const std::string& address, trantor::EventLoop* loop, bool verify_certificates
  )
      : _loop(loop)
  {
    this->_http_client =
        drogon::HttpClient::newHttpClient(address, loop, false, verify_certificates);
  }

  void HTTPClient::send(Request&& request, callback_t&& callback)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(convert(request.method));

    if (request.method == Method::GET || request.method == Method::DELETE) {
      req->setPath(request.path);
      for (const auto& param : request.parameters) {
        req->setParameter(param.first, param.second);
      }
    } else if (!request.parameters.empty()) {
      req->setPathEncode(false);
      req->setPath(fmt::format("{}?{}", request.path, encode_query(request.parameters)));
    } else {
      req->setPath(request.path);
    }
    for (const auto& header : request.headers) {
      req->addHeader(header.first, header.second);
    }
    if (!request.content_type.empty()) {
      req->setContentTypeString(request.content_type.data(), request.content_type.size());
    }
    if (!request.body.empty()) {
      req->setBody(std::move(request.body));
    }

    spdlog::debug("HTTP {} {}", to_string(request.method), request.path);

    _http_client->sendRequest(
        req,
        [callback = std::move(callback)](
            drogon::ReqResult result, const drogon::HttpResponsePtr& response
        ) {
          if (result != drogon::ReqResult::Ok || !response) {
            callback(std::nullopt, describe(result));
            return;
          }

          Response resp;
          resp.status = static_cast<int>(response->getStatusCode());
          resp.body = std::string{response->body()};
          for (const auto& [key, value] : response->headers()) {
            resp.headers[key] = value;
          }
          callback(std::move(resp), "");
        },
        request.timeout
    );
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    std::lock_guard<std::mutex> lock{factory_mutex};

    // The pool is process-wide; the first caller decides its size.
    if (HTTPClientFactory::_pool) {
      return;
    }
    HTTPClientFactory::_pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num);
    HTTPClientFactory::_pool->start();
  }

  void HTTPClientFactory::shutdown()
  {
    std::lock_guard<std::mutex> lock{factory_mutex};
    HTTPClientFactory::_pool.reset();
  }

  bool HTTPClientFactory::initialized()
  {
    std::lock_guard<std::mutex> lock{factory_mutex};
    return HTTPClientFactory::_pool != nullptr;
  }

  HTTPClient HTTPClientFactory::create_client(const std::string& address, bool verify_certificates)
  {
    std::lock_guard<std::mutex> lock{factory_mutex};
    if (!_pool) {
      throw common::KruiseException("Uninitialized HTTPClientFactory!");
    }

    if (!verify_certificates) {
      spdlog::warn("Certificate verification is disabled for {}", address);
    }
    return HTTPClient{address, _pool->getNextLoop(), verify_certificates};
  }

} // namespace kruise::common::http
