#ifndef KRUISE_SDK_TRANSPORT_HPP
#define KRUISE_SDK_TRANSPORT_HPP

#include <kruise/common/http.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kruise::sdk {

  /**
   * @brief Network seam of the SDK. Every control-plane and data-plane call goes through
   * a transport, which lets the lifecycle and execution code run against an in-memory
   * service in tests.
   *
   * Callbacks may be invoked from an I/O thread. A response is delivered for every
   * HTTP status; the callback receives an empty response and an error message only
   * when no response was obtained at all.
   */
  struct Transport {

    using chunk_callback_t = std::function<void(std::string_view)>;
    using callback_t =
        std::function<void(std::optional<common::http::Response>&&, const std::string& error)>;

    Transport() = default;
    Transport(const Transport&) = delete;
    Transport(Transport&&) = delete;
    Transport& operator=(const Transport&) = delete;
    Transport& operator=(Transport&&) = delete;
    virtual ~Transport() = default;

    virtual void
    request(const std::string& base_url, common::http::Request&& request, callback_t&& callback) = 0;

    /**
     * @brief Like request, but passes the response body to on_chunk in arrival order
     * before the completion callback runs. The body of a successful final response is
     * empty; a non-2xx response keeps its body and nothing is streamed.
     */
    virtual void stream(
        const std::string& base_url, common::http::Request&& request, chunk_callback_t&& on_chunk,
        callback_t&& callback
    ) = 0;

    // Blocking variants; throw common::TransportError when no response was received.
    common::http::Response send(const std::string& base_url, common::http::Request&& request);

    // on_chunk runs on the calling thread, and an exception it throws ends the wait.

    common::http::Response send_streaming(
        const std::string& base_url, common::http::Request&& request, chunk_callback_t&& on_chunk
    );
  };

  struct HTTPTransport : Transport {

    HTTPTransport(bool verify_certificates, int io_threads);

    void request(
        const std::string& base_url, common::http::Request&& request, callback_t&& callback
    ) override;

    void stream(
        const std::string& base_url, common::http::Request&& request, chunk_callback_t&& on_chunk,
        callback_t&& callback
    ) override;

  private:
    common::http::HTTPClient& _client(const std::string& origin);

    bool _verify_certificates;

    std::mutex _clients_mutex;
    std::unordered_map<std::string, common::http::HTTPClient> _clients;
  };

} // namespace kruise::sdk

#endif
