#include <lemu/emulator/builder.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>
#include <lemu/emulator/config.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace lemu::emulator::builder {

  std::string resolve_target(const std::string& target, bool arm64, const std::string& host_machine)
  {
    if (target.empty()) {
      if (arm64 || host_machine == "aarch64" || host_machine == "arm64") {
        return TARGET_AARCH64;
      }
      return TARGET_X86_64;
    }

    auto pos = target.find('.');
    std::string base = target.substr(0, pos);
    if (base != TARGET_X86_64 && base != TARGET_AARCH64) {
      throw common::InvalidConfigurationError(fmt::format(
          "UnsupportedTarget: {}, supported targets are {} and {}", target, TARGET_X86_64,
          TARGET_AARCH64
      ));
    }

    if (pos != std::string::npos && pos + 1 == target.length()) {
      throw common::InvalidConfigurationError(
          fmt::format("UnsupportedTarget: {}, missing glibc version", target)
      );
    }

    return target;
  }

  std::string resolve_target(const std::string& target, bool arm64)
  {
    struct utsname name {};
    std::string machine;
    if (uname(&name) == 0) {
      machine = name.machine;
    }
    return resolve_target(target, arm64, machine);
  }

  std::string normalize_profile(const std::string& profile)
  {
    if (profile.empty() || profile == "dev" || profile == "test") {
      return "debug";
    }
    if (profile == "bench") {
      return "release";
    }
    return profile;
  }

  std::string expand(const std::string& templ, const std::map<std::string, std::string>& values)
  {
    std::string result;
    result.reserve(templ.size());

    size_t pos = 0;
    while (pos < templ.size()) {

      auto begin = templ.find('{', pos);
      if (begin == std::string::npos) {
        result.append(templ, pos, std::string::npos);
        break;
      }

      auto end = templ.find('}', begin);
      if (end == std::string::npos) {
        result.append(templ, pos, std::string::npos);
        break;
      }

      result.append(templ, pos, begin - pos);
      auto it = values.find(templ.substr(begin + 1, end - begin - 1));
      if (it != values.end()) {
        result.append(it->second);
      } else {
        // Not a placeholder; braces are kept.
        result.append(templ, begin, end - begin + 1);
      }
      pos = end + 1;
    }

    return result;
  }

  CommandBuilder::CommandBuilder(const config::Build& cfg, std::string workspace)
      : _command(cfg.command), _artifact(cfg.artifact),
        _target(resolve_target(cfg.target, cfg.arm64)), _profile(normalize_profile(cfg.profile)),
        _workspace(std::move(workspace))
  {
    _logger = common::util::create_logger("CommandBuilder");

    if (_command.empty()) {
      throw common::InvalidConfigurationError("Build command cannot be empty!");
    }
  }

  std::string CommandBuilder::build(const BuildRequest& request)
  {
    std::map<std::string, std::string> values{
        {"function", request.function},
        {"source", request.source_root},
        {"workspace", _workspace},
        {"target", request.target.empty() ? _target : resolve_target(request.target, false)},
        {"profile", request.profile.empty() ? _profile : normalize_profile(request.profile)}};

    std::vector<std::string> args;
    for (const auto& arg : _command) {
      args.emplace_back(expand(arg, values));
    }
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    _logger->info("Building function {}: {}", request.function, fmt::join(args, " "));

    // Close-on-exec: processes forked concurrently must not hold the write end.
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
      throw common::CompileError(
          request.function, -1, fmt::format("Could not create pipe, reason {}", strerror(errno))
      );
    }

    pid_t mypid = fork();
    if (mypid < 0) {
      close(fds[0]);
      close(fds[1]);
      throw common::CompileError(
          request.function, -1, fmt::format("Fork failed, reason {}", strerror(errno))
      );
    }

    if (mypid == 0) {

      // Own process group: cancellation stops the whole build tree.
      setpgid(0, 0);
      close(fds[0]);
      dup2(fds[1], 1);
      dup2(fds[1], 2);
      close(fds[1]);

      if (chdir(_workspace.c_str()) == -1) {
        _exit(127);
      }

      execvp(argv[0], argv.data());
      const char msg[] = "lemu: could not execute build command\n";
      [[maybe_unused]] auto written = write(2, msg, sizeof(msg) - 1);
      _exit(127);
    }

    // Both sides set the group to avoid racing with an early cancel.
    setpgid(mypid, mypid);
    close(fds[1]);

    {
      std::lock_guard<std::mutex> lock{_mutex};
      _running[request.function] = mypid;
      _cancelled[request.function] = false;
    }

    std::string diagnostics;
    char buffer[4096];
    while (true) {
      ssize_t len = read(fds[0], buffer, sizeof(buffer));
      if (len == -1 && errno == EINTR) {
        continue;
      }
      if (len <= 0) {
        break;
      }
      diagnostics.append(buffer, len);
      if (diagnostics.size() > 2 * MAX_DIAGNOSTICS) {
        diagnostics.erase(0, diagnostics.size() - MAX_DIAGNOSTICS);
      }
    }
    close(fds[0]);

    if (diagnostics.size() > MAX_DIAGNOSTICS) {
      diagnostics.erase(0, diagnostics.size() - MAX_DIAGNOSTICS);
    }

    int status = 0;
    pid_t ret = 0;
    do {
      ret = waitpid(mypid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    bool cancelled = false;
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _running.erase(request.function);
      cancelled = _cancelled[request.function];
      _cancelled.erase(request.function);
    }

    if (cancelled) {
      _logger->info("Build of function {} has been cancelled", request.function);
      throw common::CompileError(request.function, -1, "Build cancelled");
    }

    int exit_status = -1;
    if (ret != -1 && WIFEXITED(status)) {
      exit_status = WEXITSTATUS(status);
    }
    if (exit_status != 0) {
      _logger->error("Build of function {} failed with status {}", request.function, exit_status);
      throw common::CompileError(request.function, exit_status, std::move(diagnostics));
    }

    std::filesystem::path artifact{expand(_artifact, values)};
    if (artifact.is_relative()) {
      artifact = std::filesystem::path{_workspace} / artifact;
    }
    artifact = artifact.lexically_normal();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(artifact, ec)) {
      diagnostics.append(fmt::format("\nBuild artifact {} does not exist", artifact.string()));
      throw common::CompileError(request.function, 0, std::move(diagnostics));
    }

    _logger->info("Built function {}, artifact {}", request.function, artifact.string());
    return artifact.string();
  }

  void CommandBuilder::cancel(const std::string& function)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    auto it = _running.find(function);
    if (it == _running.end()) {
      return;
    }

    _cancelled[function] = true;
    common::util::expect_zero(kill(-it->second, SIGTERM));
  }

} // namespace lemu::emulator::builder
