#ifndef KRUISE_SDK_PAGINATOR_HPP
#define KRUISE_SDK_PAGINATOR_HPP

#include <kruise/sdk/info.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kruise::sdk {

  struct Lifecycle;

  /**
   * @brief Lazy, page-by-page view of the sandboxes matching a query.
   *
   * Nothing is fetched until next_items() is called. Stopping before has_next() turns
   * false yields a partial result; to start over, create a new paginator.
   */
  class SandboxPaginator {
  public:
    static constexpr int DEFAULT_LIMIT = 100;

    SandboxPaginator(std::shared_ptr<Lifecycle> lifecycle, SandboxQuery query, int limit = DEFAULT_LIMIT);

    bool has_next() const
    {
      return _has_next;
    }

    const std::optional<std::string>& next_token() const
    {
      return _next_token;
    }

    std::vector<SandboxInfo> next_items();

    // Consumes all remaining pages.
    std::vector<SandboxInfo> all();

  private:
    std::shared_ptr<Lifecycle> _lifecycle;
    SandboxQuery _query;
    int _limit;

    bool _has_next = true;
    std::optional<std::string> _next_token{};
  };

} // namespace kruise::sdk

#endif
