#include <kruise/sdk/transport.hpp>

#include <kruise/common/exceptions.hpp>

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <trantor/net/EventLoop.h>

namespace kruise::sdk {

  common::http::Response
  Transport::send(const std::string& base_url, common::http::Request&& req)
  {
    auto target = fmt::format("{} {}{}", common::http::to_string(req.method), base_url, req.path);

    // The promise is shared with the callback, which may still run on the I/O thread
    // after the waiting caller has returned.
    auto p = std::make_shared<std::promise<common::http::Response>>();
    auto fut = p->get_future();

    this->request(
        base_url, std::move(req),
        [p, target](std::optional<common::http::Response>&& response, const std::string& error) {
          if (response.has_value()) {
            p->set_value(std::move(response.value()));
          } else {
            p->set_exception(std::make_exception_ptr(
                common::TransportError{fmt::format("Request {} failed: {}", target, error)}
            ));
          }
        }
    );

    return fut.get();
  }

  common::http::Response Transport::send_streaming(
      const std::string& base_url, common::http::Request&& req, chunk_callback_t&& on_chunk
  )
  {
    auto target = fmt::format("{} {}{}", common::http::to_string(req.method), base_url, req.path);

    // Chunks are queued by the I/O thread and handed to on_chunk on the calling thread.
    struct Pending {
      std::mutex mutex;
      std::condition_variable cv;
      std::deque<std::string> chunks;
      std::optional<common::http::Response> response;
      std::string error;
      bool done = false;
    };
    auto pending = std::make_shared<Pending>();

    this->stream(
        base_url, std::move(req),
        [pending](std::string_view chunk) {
          {
            std::unique_lock<std::mutex> lock{pending->mutex};
            pending->chunks.emplace_back(chunk);
          }
          pending->cv.notify_all();
        },
        [pending](std::optional<common::http::Response>&& response, const std::string& error) {
          {
            std::unique_lock<std::mutex> lock{pending->mutex};
            pending->response = std::move(response);
            pending->error = error;
            pending->done = true;
          }
          pending->cv.notify_all();
        }
    );

    std::unique_lock<std::mutex> lock{pending->mutex};
    while (true) {
      pending->cv.wait(lock, [&pending]() { return !pending->chunks.empty() || pending->done; });

      while (!pending->chunks.empty()) {
        auto chunk = std::move(pending->chunks.front());
        pending->chunks.pop_front();
        lock.unlock();
        on_chunk(chunk);
        lock.lock();
      }

      if (pending->done && pending->chunks.empty()) {
        break;
      }
    }

    if (!pending->response.has_value()) {
      throw common::TransportError{fmt::format("Request {} failed: {}", target, pending->error)};
    }
    return std::move(pending->response.value());
  }

  HTTPTransport::HTTPTransport(bool verify_certificates, int io_threads)
      : _verify_certificates(verify_certificates)
  {
    common::http::HTTPClientFactory::initialize(io_threads);
  }

  common::http::HTTPClient& HTTPTransport::_client(const std::string& origin)
  {
    std::unique_lock<std::mutex> lock{_clients_mutex};

    auto it = _clients.find(origin);
    if (it == _clients.end()) {
      spdlog::debug("Opening HTTP client for {}", origin);
      it = _clients
               .emplace(
                   origin,
                   common::http::HTTPClientFactory::create_client(origin, _verify_certificates)
               )
               .first;
    }
    return it->second;
  }

  void HTTPTransport::request(
      const std::string& base_url, common::http::Request&& req, callback_t&& callback
  )
  {
    auto [origin, prefix] = common::http::split_url(base_url);
    req.path = prefix + req.path;
    _client(origin).send(std::move(req), std::move(callback));
  }

  void HTTPTransport::stream(
      const std::string& base_url, common::http::Request&& req, chunk_callback_t&& on_chunk,
      callback_t&& callback
  )
  {
    auto [origin, prefix] = common::http::split_url(base_url);
    req.path = prefix + req.path;

    // A stream may stay open for as long as the process runs. drogon sends one request
    // at a time per client, so each stream gets a connection of its own.
    auto client = std::make_shared<common::http::HTTPClient>(
        common::http::HTTPClientFactory::create_client(origin, _verify_certificates)
    );

    // drogon hands over complete responses, so the whole body arrives as one chunk.
    client->send(
        std::move(req),
        [client, on_chunk = std::move(on_chunk), callback = std::move(callback)](
            std::optional<common::http::Response>&& response, const std::string& error
        ) mutable {
          if (response.has_value() && response->ok()) {
            on_chunk(response->body);
            response->body.clear();
          }
          callback(std::move(response), error);

          // The client may not be destroyed while it is still dispatching this response.
          auto* loop = client->loop();
          loop->queueInLoop([client = std::move(client)]() {});
        }
    );
  }

} // namespace kruise::sdk
