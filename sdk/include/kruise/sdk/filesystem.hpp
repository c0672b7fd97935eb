#ifndef KRUISE_SDK_FILESYSTEM_HPP
#define KRUISE_SDK_FILESYSTEM_HPP

#include <memory>
#include <string>
#include <vector>

namespace kruise::sdk {

  struct SandboxContext;

  struct EntryInfo {

    std::string name;
    // "file" or "dir"
    std::string type;
    std::string path;
  };

  struct WriteEntry {

    std::string path;
    std::string data;
  };

  /**
   * @brief File transfer through the sandbox daemon. Relative paths are resolved
   * against the home directory of the user.
   */
  class Filesystem {
  public:
    static constexpr const char* DEFAULT_USER = "user";

    explicit Filesystem(std::shared_ptr<const SandboxContext> context);

    // @throws common::NotFoundError when the file does not exist
    std::string read(const std::string& path, const std::string& user = DEFAULT_USER) const;

    // Creates missing parent directories and overwrites existing files.
    EntryInfo
    write(const std::string& path, const std::string& data, const std::string& user = DEFAULT_USER)
        const;

    std::vector<EntryInfo>
    write_files(const std::vector<WriteEntry>& files, const std::string& user = DEFAULT_USER) const;

  private:
    std::shared_ptr<const SandboxContext> _context;
  };

} // namespace kruise::sdk

#endif
