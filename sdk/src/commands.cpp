#include <kruise/sdk/commands.hpp>

#include "api.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/common/uuid.hpp>
#include <kruise/sdk/context.hpp>
#include <kruise/sdk/endpoint.hpp>
#include <kruise/sdk/envelope.hpp>
#include <kruise/sdk/retry.hpp>
#include <kruise/sdk/transport.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

#include <drogon/utils/Utilities.h>
#include <fmt/format.h>
#include <json/value.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk {

  namespace {

    std::string generate_tag()
    {
      static common::UUID uuid_generator;
      return uuid_generator.str();
    }

    bool send_kill(const SandboxContext& context, const Json::Value& selector, const std::string& user)
    {
      Json::Value body;
      body["process"] = selector;
      body["signal"] = "SIGNAL_SIGKILL";

      auto req = context.request(common::http::Method::POST, "/process.Process/SendSignal");
      req.body = api::to_json(body);
      req.content_type = "application/json";
      req.headers.emplace_back("Authorization", SandboxContext::user_authorization(user));
      req.headers.emplace_back("Connect-Protocol-Version", "1");

      auto response = context.transport->send(context.url(endpoint::ENVD_PORT), std::move(req));
      if (response.ok()) {
        spdlog::debug("Killed process {} in sandbox {}", api::to_json(selector), context.sandbox_id);
        return true;
      }

      try {
        api::raise(response, fmt::format("Killing process in sandbox {}", context.sandbox_id));
      } catch (common::NotFoundError& err) {
        // The process has already exited.
        spdlog::debug("Process {} is not running: {}", api::to_json(selector), err.what());
        return false;
      }
    }

  } // namespace

  struct CommandHandle::State {

    std::mutex mutex;
    std::condition_variable cv;

    std::deque<CommandOutput> pending;
    std::optional<int> pid;
    CommandResult result;
    bool exited = false;
    bool finished = false;
    std::exception_ptr error;

    std::function<void(const std::string&)> on_stdout;
    std::function<void(const std::string&)> on_stderr;
    // Set once a segment has been passed to a callback.
    std::atomic<bool> delivered{false};

    // Touched only by the thread delivering the stream.
    envelope::Decoder decoder;
    std::exception_ptr stream_error;
    std::exception_ptr end_error;

    void on_chunk(std::string_view chunk)
    {
      if (stream_error) {
        return;
      }

      try {
        decoder.feed(chunk, [this](uint8_t flags, std::string_view payload) {
          on_message(flags, payload);
        });
      } catch (std::exception&) {
        stream_error = std::current_exception();
      }
    }

    void on_message(uint8_t flags, std::string_view payload)
    {
      auto json = api::parse_json(payload);

      if (flags & envelope::FLAG_END_STREAM) {
        if (json.isMember("error")) {
          auto code = json["error"]["code"].asString();
          auto msg = fmt::format(
              "Command stream failed with {}: {}", code, json["error"]["message"].asString()
          );
          if (code == "not_found") {
            end_error = std::make_exception_ptr(common::NotFoundError{std::string{payload}, msg});
          } else {
            end_error = std::make_exception_ptr(common::KruiseException{msg});
          }
        }
        return;
      }

      const auto& event = json["event"];
      if (event.isMember("start")) {

        std::unique_lock<std::mutex> lock{mutex};
        pid = event["start"]["pid"].asInt();

      } else if (event.isMember("data")) {

        const auto& data = event["data"];
        if (data.isMember("stdout")) {
          deliver(CommandOutput::Stream::STDOUT, drogon::utils::base64Decode(data["stdout"].asString()));
        }
        if (data.isMember("stderr")) {
          deliver(CommandOutput::Stream::STDERR, drogon::utils::base64Decode(data["stderr"].asString()));
        }

      } else if (event.isMember("end")) {

        const auto& end = event["end"];
        std::unique_lock<std::mutex> lock{mutex};
        result.exit_code = end["exitCode"].asInt();
        result.error = end["error"].asString();
        exited = true;
      }
    }

    void deliver(CommandOutput::Stream stream, std::string data)
    {
      {
        std::unique_lock<std::mutex> lock{mutex};
        if (stream == CommandOutput::Stream::STDOUT) {
          result.std_out += data;
        } else {
          result.std_err += data;
        }
        pending.push_back(CommandOutput{stream, std::move(data)});
      }
      cv.notify_all();
    }

    // Runs on the consuming thread, never on the I/O thread.
    void notify(const CommandOutput& output)
    {
      const auto& callback = output.stream == CommandOutput::Stream::STDOUT ? on_stdout : on_stderr;
      if (callback) {
        delivered = true;
        callback(output.data);
      }
    }

    void complete(
        std::optional<common::http::Response>&& response, const std::string& error,
        const std::string& sandbox_id
    )
    {
      std::exception_ptr failure;
      if (!response.has_value()) {
        failure = std::make_exception_ptr(common::TransportError{
            fmt::format("Command stream of sandbox {} failed: {}", sandbox_id, error)});
      } else if (!response->ok()) {
        try {
          api::raise(response.value(), fmt::format("Running command in sandbox {}", sandbox_id));
        } catch (std::exception&) {
          failure = std::current_exception();
        }
      } else if (stream_error) {
        failure = stream_error;
      } else if (end_error) {
        failure = end_error;
      } else if (!exited) {
        failure = std::make_exception_ptr(
            common::KruiseException{"Command stream ended before the process exited!"}
        );
      }

      {
        std::unique_lock<std::mutex> lock{mutex};
        this->error = failure;
        finished = true;
      }
      cv.notify_all();
    }
  };

  CommandHandle::CommandHandle(
      std::shared_ptr<const SandboxContext> context, std::string tag, std::string user
  )
      : _context(std::move(context)), _tag(std::move(tag)), _user(std::move(user)),
        _state(std::make_shared<State>())
  {
  }

  std::optional<CommandOutput> CommandHandle::next()
  {
    std::unique_lock<std::mutex> lock{_state->mutex};
    _state->cv.wait(lock, [this]() { return !_state->pending.empty() || _state->finished; });

    if (!_state->pending.empty()) {
      auto output = std::move(_state->pending.front());
      _state->pending.pop_front();
      lock.unlock();
      _state->notify(output);
      return output;
    }

    if (_state->error) {
      std::rethrow_exception(_state->error);
    }
    return std::nullopt;
  }

  CommandResult CommandHandle::wait()
  {
    std::unique_lock<std::mutex> lock{_state->mutex};
    while (true) {
      _state->cv.wait(lock, [this]() { return !_state->pending.empty() || _state->finished; });

      // Segments nobody consumed with next() still reach the callbacks.
      while (!_state->pending.empty()) {
        auto output = std::move(_state->pending.front());
        _state->pending.pop_front();
        lock.unlock();
        _state->notify(output);
        lock.lock();
      }

      if (_state->finished && _state->pending.empty()) {
        break;
      }
    }

    if (_state->error) {
      std::rethrow_exception(_state->error);
    }
    auto result = _state->result;
    lock.unlock();

    if (result.exit_code != 0) {
      throw common::CommandExitError{
          result.exit_code, result.std_out, result.std_err, result.error,
          fmt::format("Command exited with code {} and error:\n{}", result.exit_code, result.std_err)};
    }
    return result;
  }

  bool CommandHandle::kill()
  {
    if (finished()) {
      spdlog::debug("Command {} has already exited", _tag);
      return false;
    }

    Json::Value selector;
    selector["tag"] = _tag;
    return send_kill(*_context, selector, _user);
  }

  std::optional<int> CommandHandle::pid() const
  {
    std::unique_lock<std::mutex> lock{_state->mutex};
    return _state->pid;
  }

  bool CommandHandle::finished() const
  {
    std::unique_lock<std::mutex> lock{_state->mutex};
    return _state->finished;
  }

  bool CommandHandle::_delivered() const
  {
    return _state->delivered;
  }

  Commands::Commands(std::shared_ptr<const SandboxContext> context) : _context(std::move(context)) {}

  CommandResult Commands::run(const std::string& cmd, const CommandOptions& options) const
  {
    return retry::execute_with_retry(
        [&]() {
          auto handle = _start(cmd, options);
          try {
            return handle.wait();
          } catch (common::CommandExitError&) {
            throw;
          } catch (common::KruiseException& err) {
            if (!handle._delivered()) {
              throw;
            }
            throw common::StreamInterruptedError{
                fmt::format(
                    "Command in sandbox {} failed after delivering output: {}", _context->sandbox_id,
                    err.what()
                ),
                std::current_exception()};
          }
        },
        _context->execution_policy
    );
  }

  CommandHandle Commands::run_background(const std::string& cmd, const CommandOptions& options) const
  {
    return _start(cmd, options);
  }

  bool Commands::kill(int pid) const
  {
    Json::Value selector;
    selector["pid"] = pid;
    return send_kill(*_context, selector, CommandOptions::DEFAULT_USER);
  }

  CommandHandle Commands::_start(const std::string& cmd, const CommandOptions& options) const
  {
    auto tag = generate_tag();

    Json::Value process;
    process["cmd"] = SHELL;
    process["args"] = Json::Value{Json::arrayValue};
    process["args"].append("-l");
    process["args"].append("-c");
    process["args"].append(cmd);
    process["envs"] = Json::Value{Json::objectValue};
    for (const auto& [key, value] : options.envs) {
      process["envs"][key] = value;
    }
    if (!options.cwd.empty()) {
      process["cwd"] = options.cwd;
    }

    Json::Value body;
    body["process"] = process;
    body["tag"] = tag;

    auto req = _context->request(common::http::Method::POST, "/process.Process/Start");
    req.body = envelope::encode(api::to_json(body));
    req.content_type = "application/connect+json";
    req.headers.emplace_back("Authorization", SandboxContext::user_authorization(options.user));
    req.timeout = options.timeout;

    CommandHandle handle{_context, tag, options.user};
    handle._state->on_stdout = options.on_stdout;
    handle._state->on_stderr = options.on_stderr;

    spdlog::debug("Starting command {} in sandbox {}: {}", tag, _context->sandbox_id, cmd);

    auto state = handle._state;
    _context->transport->stream(
        _context->url(endpoint::ENVD_PORT), std::move(req),
        [state](std::string_view chunk) { state->on_chunk(chunk); },
        [state, sandbox_id = _context->sandbox_id](
            std::optional<common::http::Response>&& response, const std::string& error
        ) { state->complete(std::move(response), error, sandbox_id); }
    );

    return handle;
  }

} // namespace kruise::sdk
