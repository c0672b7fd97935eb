#include <kruise/sdk/sandbox.hpp>

#include <kruise/common/exceptions.hpp>
#include <kruise/sdk/context.hpp>
#include <kruise/sdk/endpoint.hpp>
#include <kruise/sdk/lifecycle.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk {

  Sandbox::Sandbox(
      std::shared_ptr<Lifecycle> lifecycle, std::shared_ptr<const SandboxContext> context,
      SandboxConnection connection
  )
      : _lifecycle(std::move(lifecycle)), _context(std::move(context)),
        _connection(std::move(connection)), _interpreter(_context), _commands(_context),
        _files(_context)
  {
  }

  std::string Sandbox::get_host(int port) const
  {
    return _context->endpoint->port_host(id(), port);
  }

  SandboxInfo Sandbox::get_info() const
  {
    return _lifecycle->get_info(id());
  }

  bool Sandbox::is_running() const
  {
    try {
      return get_info().state == SandboxState::RUNNING;
    } catch (common::NotFoundError& err) {
      spdlog::debug("Sandbox {} does not exist: {}", id(), err.what());
      return false;
    }
  }

  void Sandbox::pause() const
  {
    _lifecycle->pause(id());
  }

  Sandbox& Sandbox::connect(std::optional<int> timeout)
  {
    auto connection = _lifecycle->connect(id(), timeout);
    if (connection.sandbox_id != id()) {
      throw common::KruiseException(fmt::format(
          "Connecting to sandbox {} returned a different sandbox {}", id(), connection.sandbox_id
      ));
    }

    auto context = std::make_shared<SandboxContext>(*_context);
    context->access_token = connection.envd_access_token;

    *this = Sandbox{_lifecycle, std::move(context), std::move(connection)};
    return *this;
  }

  void Sandbox::kill() const
  {
    _lifecycle->kill(id());
  }

  void Sandbox::set_timeout(int timeout) const
  {
    _lifecycle->set_timeout(id(), timeout);
  }

  Execution Sandbox::run_code(const std::string& code, const RunCodeOptions& options) const
  {
    return _interpreter.run_code(code, options);
  }

  CodeContext Sandbox::create_code_context(
      const std::optional<std::string>& language, const std::optional<std::string>& cwd
  ) const
  {
    return _interpreter.create_code_context(language, cwd);
  }

} // namespace kruise::sdk
