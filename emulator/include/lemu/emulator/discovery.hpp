#ifndef LEMU_EMULATOR_DISCOVERY_HPP
#define LEMU_EMULATOR_DISCOVERY_HPP

#include <lemu/emulator/environment.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace lemu::emulator::config {
  struct Config;
} // namespace lemu::emulator::config

namespace lemu::emulator::discovery {

  struct Descriptor {
    std::string name;
    std::filesystem::path source_root;
    environment::Environment environment;
    // MiB
    int memory;
    std::chrono::seconds timeout;
  };

  class Discovery {
  public:
    Discovery(const config::Config& cfg);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Looks up a function by name. Explicitly configured functions take
    /// precedence over the sub-directories of the functions directory. The
    /// workspace is inspected again on every call, so functions added at run time
    /// are found.
    ///
    /// @param[in] name function name
    /// @return descriptor of the function; empty optional if the name is unknown
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<Descriptor> find(const std::string& name) const;

    // All functions known at the time of the call, sorted by name.
    std::vector<Descriptor> discover() const;

    // Name of the function whose source root contains the path, if any.
    std::optional<std::string> owner(const std::filesystem::path& path) const;

    // True when any component of the path, relative to the workspace, is ignored.
    bool ignored(const std::filesystem::path& path) const;

    const std::filesystem::path& workspace() const
    {
      return _workspace;
    }

    const std::vector<std::string>& ignore_list() const
    {
      return _ignore;
    }

  private:
    Descriptor _descriptor(const std::string& name, std::filesystem::path source_root) const;

    const config::Config& _config;
    std::filesystem::path _workspace;
    std::filesystem::path _functions_dir;
    std::vector<std::string> _ignore;

    std::shared_ptr<spdlog::logger> _logger;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Digest over the relative path, modification time and size of every
  /// regular file below the root. Directories with an ignored name are skipped.
  /// Files below any of the excluded paths are skipped as well.
  ///
  /// @return hex digest; empty when the root does not exist
  ////////////////////////////////////////////////////////////////////////////////
  std::string fingerprint(
      const std::filesystem::path& root, const std::vector<std::string>& ignore,
      const std::vector<std::filesystem::path>& excluded = {}
  );

} // namespace lemu::emulator::discovery

#endif
