#ifndef LEMU_EMULATOR_LAUNCHER_HPP
#define LEMU_EMULATOR_LAUNCHER_HPP

#include <lemu/emulator/environment.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <spdlog/spdlog.h>

namespace lemu::emulator::discovery {
  struct Descriptor;
} // namespace lemu::emulator::discovery

namespace lemu::emulator::launcher {

  struct LaunchSpec {
    std::string function;
    std::string executable;
    std::vector<std::string> arguments;
    std::string working_directory;
    // Complete environment of the child; nothing else is inherited.
    environment::Environment environment;
    std::optional<std::string> log_file;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Builds the environment of a function process. Layers, from the lowest
  /// priority: the inherited environment, package-wide defaults merged with the
  /// function overrides (the descriptor), and the reserved AWS_LAMBDA_* variables.
  ////////////////////////////////////////////////////////////////////////////////
  environment::Environment runtime_environment(
      const environment::Environment& inherited, const discovery::Descriptor& desc,
      const std::string& runtime_api_address
  );

  class ProcessHandle {
  public:
    virtual ~ProcessHandle() = default;

    virtual pid_t pid() const = 0;

    virtual bool running() const = 0;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Stops the process: SIGTERM, wait for the grace period, then SIGKILL.
    /// Returns once the process has been reaped.
    ////////////////////////////////////////////////////////////////////////////////
    virtual void terminate(std::chrono::milliseconds grace) = 0;
  };

  class Launcher {
  public:
    // Exit status as returned by waitpid.
    using exit_callback_t = std::function<void(int)>;

    virtual ~Launcher() = default;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Starts a process. The exit callback is invoked exactly once, from a
    /// monitoring thread, after the process has been reaped. This includes exits
    /// caused by terminate(), which returns only after the callback has finished.
    ///
    /// @throws common::LemuException when the process cannot be created
    ////////////////////////////////////////////////////////////////////////////////
    virtual std::unique_ptr<ProcessHandle>
    launch(const LaunchSpec& spec, exit_callback_t&& on_exit) = 0;
  };

  class ChildProcess : public ProcessHandle {
  public:
    ChildProcess(pid_t pid, std::string function, Launcher::exit_callback_t&& on_exit);

    pid_t pid() const override
    {
      return _pid;
    }

    bool running() const override;

    void terminate(std::chrono::milliseconds grace) override;

  private:
    // Shared with the detached monitor thread, which may outlive the handle.
    struct State {
      std::mutex mutex;
      std::condition_variable cv;
      // Reaped, exit callback may still be running.
      bool reaped = false;
      bool exited = false;
      int status = 0;
    };

    pid_t _pid;
    std::string _function;
    std::shared_ptr<State> _state;

    std::shared_ptr<spdlog::logger> _logger;
  };

  class ProcessLauncher : public Launcher {
  public:
    ProcessLauncher();

    std::unique_ptr<ProcessHandle>
    launch(const LaunchSpec& spec, exit_callback_t&& on_exit) override;

  private:
    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator::launcher

#endif
