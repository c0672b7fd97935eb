#include <kruise/sdk/paginator.hpp>

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/lifecycle.hpp>

#include <iterator>

namespace kruise::sdk {

  SandboxPaginator::SandboxPaginator(
      std::shared_ptr<Lifecycle> lifecycle, SandboxQuery query, int limit
  )
      : _lifecycle(std::move(lifecycle)), _query(std::move(query)), _limit(limit)
  {
    if (_limit <= 0) {
      throw common::InvalidConfigurationError("Page size must be positive!");
    }
  }

  std::vector<SandboxInfo> SandboxPaginator::next_items()
  {
    if (!_has_next) {
      throw common::KruiseException("No more sandboxes to list!");
    }

    auto page = _lifecycle->list(_query, _next_token, _limit);
    _next_token = std::move(page.next_token);
    _has_next = _next_token.has_value();

    return std::move(page.sandboxes);
  }

  std::vector<SandboxInfo> SandboxPaginator::all()
  {
    std::vector<SandboxInfo> result;
    while (_has_next) {
      auto items = next_items();
      result.insert(
          result.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end())
      );
    }
    return result;
  }

} // namespace kruise::sdk
