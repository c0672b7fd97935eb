#include <kruise/sdk/filesystem.hpp>

#include "api.hpp"

#include <kruise/common/exceptions.hpp>
#include <kruise/common/uuid.hpp>
#include <kruise/sdk/context.hpp>
#include <kruise/sdk/endpoint.hpp>
#include <kruise/sdk/transport.hpp>

#include <fmt/format.h>
#include <json/value.h>
#include <spdlog/spdlog.h>

namespace kruise::sdk {

  namespace {

    std::string generate_boundary()
    {
      static common::UUID uuid_generator;
      return fmt::format("----KruiseBoundary{}", uuid_generator.str());
    }

  } // namespace

  Filesystem::Filesystem(std::shared_ptr<const SandboxContext> context) : _context(std::move(context))
  {
  }

  std::string Filesystem::read(const std::string& path, const std::string& user) const
  {
    auto req = _context->request(common::http::Method::GET, "/files");
    req.parameters.emplace_back("path", path);
    req.parameters.emplace_back("username", user);
    req.headers.emplace_back("Authorization", SandboxContext::user_authorization(user));

    auto response = _context->transport->send(_context->url(endpoint::ENVD_PORT), std::move(req));
    if (!response.ok()) {
      api::raise(response, fmt::format("Reading {} in sandbox {}", path, _context->sandbox_id));
    }

    spdlog::debug("Read {} bytes from {} in sandbox {}", response.body.size(), path, _context->sandbox_id);
    return std::move(response.body);
  }

  EntryInfo
  Filesystem::write(const std::string& path, const std::string& data, const std::string& user) const
  {
    auto boundary = generate_boundary();

    std::string body;
    body.reserve(data.size() + 256);
    body += fmt::format("--{}\r\n", boundary);
    body += fmt::format(
        "Content-Disposition: form-data; name=\"file\"; filename=\"{}\"\r\n", path
    );
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body += data;
    body += fmt::format("\r\n--{}--\r\n", boundary);

    auto req = _context->request(common::http::Method::POST, "/files");
    req.parameters.emplace_back("path", path);
    req.parameters.emplace_back("username", user);
    req.headers.emplace_back("Authorization", SandboxContext::user_authorization(user));
    req.body = std::move(body);
    req.content_type = fmt::format("multipart/form-data; boundary={}", boundary);

    auto response = _context->transport->send(_context->url(endpoint::ENVD_PORT), std::move(req));
    if (!response.ok()) {
      api::raise(response, fmt::format("Writing {} in sandbox {}", path, _context->sandbox_id));
    }

    auto json = api::parse_json(response.body);
    const auto& entry = json.isArray() ? json[0u] : json;
    if (!entry.isObject()) {
      throw common::KruiseException(
          fmt::format("Unexpected reply to writing {}: {}", path, response.body)
      );
    }

    EntryInfo info{entry["name"].asString(), entry["type"].asString(), entry["path"].asString()};
    spdlog::debug("Wrote {} bytes to {} in sandbox {}", data.size(), info.path, _context->sandbox_id);
    return info;
  }

  std::vector<EntryInfo>
  Filesystem::write_files(const std::vector<WriteEntry>& files, const std::string& user) const
  {
    std::vector<EntryInfo> entries;
    entries.reserve(files.size());
    for (const auto& file : files) {
      entries.emplace_back(write(file.path, file.data, user));
    }
    return entries;
  }

} // namespace kruise::sdk
