#include <lemu/emulator/launcher.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>
#include <lemu/emulator/discovery.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

namespace lemu::emulator::launcher {

  environment::Environment runtime_environment(
      const environment::Environment& inherited, const discovery::Descriptor& desc,
      const std::string& runtime_api_address
  )
  {
    auto env = environment::merge(inherited, desc.environment);

    auto& vars = env.variables;
    vars["AWS_LAMBDA_RUNTIME_API"] = fmt::format("{}/{}", runtime_api_address, desc.name);
    vars["AWS_LAMBDA_FUNCTION_NAME"] = desc.name;
    vars["AWS_LAMBDA_FUNCTION_VERSION"] = "$LATEST";
    vars["AWS_LAMBDA_FUNCTION_MEMORY_SIZE"] = std::to_string(desc.memory);
    vars["AWS_LAMBDA_FUNCTION_TIMEOUT"] = std::to_string(desc.timeout.count());
    vars["AWS_LAMBDA_LOG_GROUP_NAME"] = fmt::format("/aws/lambda/{}", desc.name);

    return env;
  }

  ChildProcess::ChildProcess(pid_t pid, std::string function, Launcher::exit_callback_t&& on_exit)
      : _pid(pid), _function(std::move(function)), _state(std::make_shared<State>())
  {
    _logger = common::util::create_logger("ChildProcess");

    std::thread monitor{[pid, state = _state, on_exit = std::move(on_exit), logger = _logger]() {
      int status = 0;
      pid_t ret = 0;
      do {
        ret = waitpid(pid, &status, 0);
      } while (ret == -1 && errno == EINTR);

      if (ret == -1) {
        logger->error("Waiting for child {} failed, reason {}", pid, strerror(errno));
      } else if (WIFEXITED(status)) {
        logger->info("Child {} exited with status {}", pid, WEXITSTATUS(status));
      } else if (WIFSIGNALED(status)) {
        logger->info("Child {} killed by signal {}", pid, WTERMSIG(status));
      }

      {
        std::lock_guard<std::mutex> lock{state->mutex};
        state->reaped = true;
        state->status = status;
      }

      if (on_exit) {
        on_exit(status);
      }

      {
        std::lock_guard<std::mutex> lock{state->mutex};
        state->exited = true;
      }
      state->cv.notify_all();
    }};
    monitor.detach();
  }

  bool ChildProcess::running() const
  {
    std::lock_guard<std::mutex> lock{_state->mutex};
    return !_state->reaped;
  }

  void ChildProcess::terminate(std::chrono::milliseconds grace)
  {
    std::unique_lock<std::mutex> lock{_state->mutex};
    if (_state->exited) {
      return;
    }

    if (!_state->reaped) {
      _logger->debug("Stopping process {} of function {}", _pid, _function);
      common::util::expect_zero(kill(_pid, SIGTERM));
    }

    if (_state->cv.wait_for(lock, grace, [this]() { return _state->exited; })) {
      return;
    }

    if (_state->reaped) {
      _state->cv.wait(lock, [this]() { return _state->exited; });
      return;
    }

    _logger->warn(
        "Process {} of function {} did not stop within {} ms, killing", _pid, _function,
        grace.count()
    );
    common::util::expect_zero(kill(_pid, SIGKILL));
    _state->cv.wait(lock, [this]() { return _state->exited; });
  }

  ProcessLauncher::ProcessLauncher()
  {
    _logger = common::util::create_logger("ProcessLauncher");
  }

  std::unique_ptr<ProcessHandle>
  ProcessLauncher::launch(const LaunchSpec& spec, exit_callback_t&& on_exit)
  {
    // Everything the child needs is prepared before fork.
    std::vector<std::string> env_strings = environment::serialize(spec.environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& var : env_strings) {
      envp.push_back(var.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> args_strings;
    args_strings.push_back(spec.executable);
    args_strings.insert(args_strings.end(), spec.arguments.begin(), spec.arguments.end());
    std::vector<char*> argv;
    for (auto& arg : args_strings) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int log_fd = -1;
    if (spec.log_file.has_value()) {
      log_fd = open(spec.log_file->c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, S_IRUSR | S_IWUSR);
      if (log_fd == -1) {
        _logger->warn(
            "Could not open log file {}, reason {}, output goes to the console",
            spec.log_file.value(), strerror(errno)
        );
      }
    }

    pid_t mypid = fork();
    if (mypid < 0) {
      if (log_fd != -1) {
        close(log_fd);
      }
      throw common::LemuException{
          fmt::format("Fork failed! {}, reason {} {}", mypid, errno, strerror(errno))};
    }

    if (mypid == 0) {

      if (log_fd != -1) {
        dup2(log_fd, 1);
        dup2(log_fd, 2);
        close(log_fd);
      }

      if (!spec.working_directory.empty() && chdir(spec.working_directory.c_str()) == -1) {
        _exit(127);
      }

      execve(argv[0], argv.data(), envp.data());
      // Only async-signal-safe calls are allowed here.
      const char msg[] = "lemu: exec of function process failed\n";
      [[maybe_unused]] auto written = write(2, msg, sizeof(msg) - 1);
      _exit(127);
    }

    if (log_fd != -1) {
      close(log_fd);
    }

    _logger->info("Started process {} of function {}, PID {}", spec.executable, spec.function, mypid);

    return std::make_unique<ChildProcess>(mypid, spec.function, std::move(on_exit));
  }

} // namespace lemu::emulator::launcher
