#ifndef LEMU_EMULATOR_BUILDER_HPP
#define LEMU_EMULATOR_BUILDER_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

#include <spdlog/spdlog.h>

namespace lemu::emulator::config {
  struct Build;
} // namespace lemu::emulator::config

namespace lemu::emulator::builder {

  static constexpr const char* TARGET_X86_64 = "x86_64-unknown-linux-gnu";
  static constexpr const char* TARGET_AARCH64 = "aarch64-unknown-linux-gnu";

  struct BuildRequest {
    std::string function;
    std::string source_root;
    std::string target;
    std::string profile;
  };

  class Builder {
  public:
    virtual ~Builder() = default;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Compiles a function for the requested target. Blocks until the build
    /// finishes.
    ///
    /// @param[in] request function, source root, target triple and profile
    /// @return absolute path of the executable artifact
    /// @throws common::CompileError on a failed or cancelled build
    ////////////////////////////////////////////////////////////////////////////////
    virtual std::string build(const BuildRequest& request) = 0;

    // Stops a running build of the function; no-op when nothing runs.
    virtual void cancel(const std::string& function) = 0;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Maps an explicit target, the arm64 shortcut and the host architecture
  /// to one of the supported triples. A glibc version suffix, e.g. ".2.17", is
  /// preserved.
  ///
  /// @throws common::InvalidConfigurationError for unsupported targets
  ////////////////////////////////////////////////////////////////////////////////
  std::string resolve_target(const std::string& target, bool arm64);

  std::string resolve_target(const std::string& target, bool arm64, const std::string& host_machine);

  // dev and test map to debug; release and bench map to release.
  std::string normalize_profile(const std::string& profile);

  // Replaces {function}, {source}, {workspace}, {target} and {profile}.
  std::string expand(const std::string& templ, const std::map<std::string, std::string>& values);

  class CommandBuilder : public Builder {
  public:
    // Diagnostics beyond this size keep only the tail.
    static constexpr size_t MAX_DIAGNOSTICS = 64 * 1024;

    CommandBuilder(const config::Build& cfg, std::string workspace);

    std::string build(const BuildRequest& request) override;

    void cancel(const std::string& function) override;

    std::string default_target() const
    {
      return _target;
    }

    std::string default_profile() const
    {
      return _profile;
    }

  private:
    std::vector<std::string> _command;
    std::string _artifact;
    std::string _target;
    std::string _profile;
    std::string _workspace;

    std::mutex _mutex;
    // Process groups of running builds.
    std::map<std::string, pid_t> _running;
    std::map<std::string, bool> _cancelled;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator::builder

#endif
