#include <lemu/emulator/registry.hpp>

#include <lemu/common/exceptions.hpp>
#include <lemu/common/util.hpp>
#include <lemu/emulator/builder.hpp>
#include <lemu/emulator/config.hpp>
#include <lemu/emulator/discovery.hpp>
#include <lemu/emulator/launcher.hpp>
#include <lemu/emulator/worker.hpp>

#include <filesystem>
#include <map>

#include <sys/wait.h>

#include <fmt/format.h>

namespace lemu::emulator::registry {

  using function::Function;
  using function::FunctionPtr;
  using function::State;
  using invocation::Error;
  using invocation::ErrorKind;
  using invocation::InvocationResult;

  Registry::Registry(
      const config::Config& cfg, discovery::Discovery& discovery, builder::Builder& builder,
      launcher::Launcher& launcher, worker::Workers& workers
  )
      : _config(cfg), _discovery(discovery), _builder(builder), _launcher(launcher),
        _workers(workers), _inherited(environment::inherited()),
        _runtime_api_address(cfg.runtime_api_address()), _loop_thread("StartupTimers")
  {
    _logger = common::util::create_logger("Registry");
    _loop_thread.run();
  }

  Registry::~Registry()
  {
    shutdown();
  }

  void Registry::_run(deferred_t& deferred)
  {
    for (auto& func : deferred) {
      func();
    }
    deferred.clear();
  }

  FunctionPtr Registry::resolve(const std::string& name)
  {
    {
      ConcurrentTable<FunctionPtr>::ro_acc_t acc;
      if (_functions.find(acc, name)) {
        return acc->second;
      }
    }

    auto desc = _discovery.find(name);
    if (!desc.has_value()) {
      throw common::UnknownFunction(name);
    }

    ConcurrentTable<FunctionPtr>::rw_acc_t acc;
    if (_functions.insert(acc, name)) {
      _logger->info("Registered function {}, sources {}", name, desc->source_root.string());
      acc->second = std::make_shared<Function>(std::move(desc.value()));

      std::unique_lock<std::shared_mutex> lock{_names_mutex};
      _names.emplace_back(name);
    }
    return acc->second;
  }

  FunctionPtr Registry::find(const std::string& name) const
  {
    ConcurrentTable<FunctionPtr>::ro_acc_t acc;
    if (_functions.find(acc, name)) {
      return acc->second;
    }
    return nullptr;
  }

  bool Registry::_retry_allowed(const Function& fn) const
  {
    return fn._crashes < _config.lifecycle.retry_budget;
  }

  Error Registry::_unavailable(const Function& fn) const
  {
    return Error{
        ErrorKind::FUNCTION_UNAVAILABLE,
        fmt::format(
            "Function {} is unavailable after {} consecutive failures, last error: {}", fn.name(),
            fn._crashes, fn._last_error.has_value() ? fn._last_error->message : "none"
        )};
  }

  void Registry::_fail_waiting(Function& fn, const Error& error, deferred_t& deferred)
  {
    for (auto& inv : fn._pending) {
      deferred.emplace_back([inv, error]() { inv->fulfill(InvocationResult::failure(error)); });
    }
    fn._pending.clear();

    _fire_waiters(fn, error, deferred);
  }

  void Registry::_fire_waiters(
      Function& fn, const std::optional<Error>& error, deferred_t& deferred
  )
  {
    for (auto& waiter : fn._ready_waiters) {
      deferred.emplace_back([waiter = std::move(waiter), error]() { waiter(error); });
    }
    fn._ready_waiters.clear();
  }

  void Registry::_cancel_startup_timer(Function& fn)
  {
    if (fn._startup_timer.has_value()) {
      _loop_thread.getLoop()->invalidateTimer(fn._startup_timer.value());
      fn._startup_timer.reset();
    }
  }

  void Registry::_retire(Function& fn, deferred_t& deferred)
  {
    _cancel_startup_timer(fn);

    if (auto poller = fn._queue.take_poller(); poller.has_value()) {
      deferred.emplace_back([poller = std::move(poller.value()), name = fn.name()]() {
        poller(
            nullptr,
            Error{ErrorKind::FUNCTION_UNAVAILABLE, fmt::format("Process of {} is stopping", name)}
        );
      });
    }

    if (!fn._process) {
      return;
    }

    // The exit of the retired process is expected.
    fn._generation++;
    fn._retiring = std::shared_ptr<launcher::ProcessHandle>{std::move(fn._process)};

    _workers.add_task([retiring = fn._retiring, grace = _config.lifecycle.shutdown_grace]() {
      retiring->terminate(std::chrono::milliseconds{grace});
    });
  }

  void Registry::_start_build(const FunctionPtr& fn, deferred_t& deferred)
  {
    _logger->info("Building function {}", fn->name());
    fn->_state = State::BUILDING;
    fn->_stale = false;
    _retire(*fn, deferred);

    _workers.add_provisioning_task([this, fn, retiring = fn->_retiring]() {
      _provision(fn, retiring, true);
    });
  }

  void Registry::_respawn(const FunctionPtr& fn, deferred_t& deferred)
  {
    _logger->info("Restarting function {}, consecutive failures {}", fn->name(), fn->_crashes);
    fn->_state = State::STARTING;
    _retire(*fn, deferred);

    _workers.add_provisioning_task([this, fn, retiring = fn->_retiring]() {
      _provision(fn, retiring, false);
    });
  }

  std::optional<Error> Registry::_wake(const FunctionPtr& fn, deferred_t& deferred)
  {
    switch (fn->_state) {
    case State::UNBUILT:
    case State::REBUILDING:
      _start_build(fn, deferred);
      return std::nullopt;
    case State::CRASHED:
      if (_retry_allowed(*fn)) {
        _respawn(fn, deferred);
        return std::nullopt;
      }
      return _unavailable(*fn);
    default:
      return std::nullopt;
    }
  }

  void Registry::_provision(
      const FunctionPtr& fn, std::shared_ptr<launcher::ProcessHandle> retiring, bool rebuild
  )
  {
    // At most one live process per function.
    if (retiring) {
      retiring->terminate(std::chrono::milliseconds{_config.lifecycle.shutdown_grace});
    }

    // Shutdown has already failed every waiting caller.
    if (_shutting_down) {
      return;
    }

    std::string artifact;
    std::string fingerprint;
    std::optional<Error> build_error;
    if (rebuild) {

      // Taken before the build; changes made while building are seen as new.
      fingerprint =
          discovery::fingerprint(fn->descriptor().source_root, _config.watcher.ignore);

      builder::BuildRequest request{
          fn->name(), fn->descriptor().source_root.string(), _config.build.target,
          _config.build.profile};

      try {
        artifact = _builder.build(request);
      } catch (const common::CompileError& err) {
        build_error = Error{
            ErrorKind::COMPILE_ERROR,
            fmt::format("{}, exit status {}\n{}", err.what(), err.exit_status, err.diagnostics)};
      } catch (const common::LemuException& err) {
        build_error = Error{ErrorKind::COMPILE_ERROR, err.what()};
      }
    }

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};

      if (_shutting_down) {
        return;
      }

      // Sources changed while building or starting: start over.
      if (fn->_stale) {
        _logger->info("Sources of function {} changed, rebuilding", fn->name());
        fn->_stale = false;
        fn->_state = State::BUILDING;
        _workers.add_provisioning_task([this, fn]() { _provision(fn, nullptr, true); });
        return;
      }

      if (build_error.has_value()) {
        _logger->error("Build of function {} failed", fn->name());
        fn->_state = State::UNBUILT;
        fn->_last_error = build_error;
        _fail_waiting(*fn, build_error.value(), deferred);
      } else {

        if (rebuild) {
          fn->_artifact = artifact;
          fn->_fingerprint = fingerprint;
        }
        _spawn(fn, lock, deferred);
      }
    }
    _run(deferred);
  }

  void Registry::_spawn(const FunctionPtr& fn, lock_t&, deferred_t& deferred)
  {
    fn->_state = State::STARTING;
    uint64_t generation = ++fn->_generation;

    const auto& desc = fn->descriptor();
    launcher::LaunchSpec spec;
    spec.function = fn->name();
    spec.executable = fn->_artifact;
    spec.working_directory = desc.source_root.string();
    spec.environment = launcher::runtime_environment(_inherited, desc, _runtime_api_address);
    if (_config.log_directory.has_value()) {
      spec.log_file =
          (std::filesystem::path{_config.log_directory.value()} / (fn->name() + ".log")).string();
    }

    std::weak_ptr<Function> weak{fn};
    try {
      fn->_process = _launcher.launch(spec, [this, weak, generation](int status) {
        _process_exited(weak, generation, status);
      });
    } catch (const common::LemuException& err) {
      _logger->error("Could not start function {}, reason {}", fn->name(), err.what());
      _crash(fn, Error{ErrorKind::FUNCTION_UNAVAILABLE, err.what()}, true, deferred);
      return;
    }
    fn->_retiring.reset();

    double timeout = _config.lifecycle.startup_timeout / 1000.0;
    fn->_startup_timer = _loop_thread.getLoop()->runAfter(timeout, [this, weak, generation]() {
      _startup_timeout(weak, generation);
    });
  }

  void Registry::_crash(
      const FunctionPtr& fn, const Error& error, bool fail_waiting, deferred_t& deferred
  )
  {
    _logger->warn("Function {} crashed: {}", fn->name(), error.message);

    fn->_state = State::CRASHED;
    fn->_crashes++;
    fn->_last_error = error;
    _retire(*fn, deferred);

    if (auto inv = fn->_queue.take_outstanding(); inv) {
      deferred.emplace_back([inv, error]() { inv->fulfill(InvocationResult::failure(error)); });
    }

    // Undelivered invocations return to the front of the pending list, in order.
    auto queued = fn->_queue.drain();
    fn->_pending.insert(fn->_pending.begin(), queued.begin(), queued.end());

    if (fail_waiting) {
      _fail_waiting(*fn, error, deferred);
    }

    // New sources might fix the crash.
    if (fn->_stale) {
      fn->_stale = false;
      fn->_crashes = 0;
      fn->_state = State::REBUILDING;
    }

    if (fn->_pending.empty() && fn->_ready_waiters.empty()) {
      return;
    }

    auto wake_error = _wake(fn, deferred);
    if (wake_error.has_value()) {
      _fail_waiting(*fn, wake_error.value(), deferred);
    }
  }

  void Registry::_process_exited(const std::weak_ptr<Function>& ptr, uint64_t generation, int status)
  {
    auto fn = ptr.lock();
    if (!fn) {
      return;
    }

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};
      if (generation != fn->_generation || _shutting_down) {
        SPDLOG_LOGGER_DEBUG(_logger, "Ignoring exit of a previous process of {}", fn->name());
        return;
      }

      std::string reason = WIFSIGNALED(status)
                               ? fmt::format("killed by signal {}", WTERMSIG(status))
                               : fmt::format("exit status {}", WEXITSTATUS(status));

      fn->_generation++;
      fn->_process.reset();
      _crash(
          fn,
          Error{
              ErrorKind::FUNCTION_UNAVAILABLE,
              fmt::format("Process of function {} exited unexpectedly, {}", fn->name(), reason)},
          false, deferred
      );
    }
    _run(deferred);
  }

  void Registry::_startup_timeout(const std::weak_ptr<Function>& ptr, uint64_t generation)
  {
    auto fn = ptr.lock();
    if (!fn) {
      return;
    }

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};
      if (generation != fn->_generation || fn->_state != State::STARTING || _shutting_down) {
        return;
      }

      fn->_startup_timer.reset();
      _crash(
          fn,
          Error{
              ErrorKind::STARTUP_TIMEOUT,
              fmt::format(
                  "Function {} did not contact the Runtime API within {} ms", fn->name(),
                  _config.lifecycle.startup_timeout
              )},
          true, deferred
      );
    }
    _run(deferred);
  }

  void Registry::ensure_ready(const std::string& name, ready_callback_t&& callback)
  {
    auto fn = resolve(name);

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};

      if (_shutting_down) {
        deferred.emplace_back([callback = std::move(callback)]() {
          callback(Error{ErrorKind::FUNCTION_UNAVAILABLE, "Emulator is shutting down"});
        });
      } else if ((fn->_state == State::READY || fn->_state == State::INVOKING) && !fn->_stale) {
        deferred.emplace_back([callback = std::move(callback)]() { callback(std::nullopt); });
      } else {

        auto error = _wake(fn, deferred);
        if (error.has_value()) {
          deferred.emplace_back([callback = std::move(callback), error]() { callback(error); });
        } else {
          fn->_ready_waiters.emplace_back(std::move(callback));
        }
      }
    }
    _run(deferred);
  }

  void Registry::dispatch(const invocation::InvocationPtr& inv)
  {
    auto fn = resolve(inv->function());

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};

      if (_shutting_down) {
        deferred.emplace_back([inv]() {
          inv->fulfill(
              InvocationResult::failure(ErrorKind::FUNCTION_UNAVAILABLE, "Emulator is shutting down")
          );
        });
      } else if ((fn->_state == State::READY || fn->_state == State::INVOKING) && !fn->_stale) {

        auto handoff = fn->_queue.push(inv);
        if (handoff.has_value()) {
          fn->_state = State::INVOKING;
          deferred.emplace_back(std::move(handoff.value()));
        }
      } else {

        auto error = _wake(fn, deferred);
        if (error.has_value()) {
          deferred.emplace_back([inv, error = error.value()]() {
            inv->fulfill(InvocationResult::failure(error));
          });
        } else {
          fn->_pending.push_back(inv);
        }
      }
    }
    _run(deferred);

    SPDLOG_LOGGER_DEBUG(_logger, "Dispatched invocation {} of {}", inv->id(), inv->function());
  }

  void Registry::next_invocation(const std::string& name, poller_t&& poller)
  {
    auto fn = find(name);
    if (!fn) {
      throw common::UnknownFunction(name);
    }

    deferred_t deferred;
    auto reject = [&](std::string reason) {
      deferred.emplace_back([poller = std::move(poller), reason = std::move(reason)]() {
        poller(nullptr, Error{ErrorKind::FUNCTION_UNAVAILABLE, reason});
      });
    };

    {
      lock_t lock{fn->_mutex};

      // First contact of a starting process.
      if (fn->_state == State::STARTING && fn->_process && !_shutting_down) {

        _cancel_startup_timer(*fn);

        if (fn->_stale) {
          _start_build(fn, deferred);
        } else {

          _logger->info("Function {} is ready", fn->name());
          fn->_state = State::READY;
          for (auto& inv : fn->_pending) {
            auto handoff = fn->_queue.push(inv);
            if (handoff.has_value()) {
              deferred.emplace_back(std::move(handoff.value()));
            }
          }
          fn->_pending.clear();
          _fire_waiters(*fn, std::nullopt, deferred);
        }
      }

      if (_shutting_down) {
        reject("Emulator is shutting down");
      } else if ((fn->_state != State::READY && fn->_state != State::INVOKING) || fn->_stale) {
        reject(fmt::format(
            "Function {} is not accepting invocations, state {}", fn->name(),
            function::to_string(fn->_state)
        ));
      } else {

        if (auto inv = fn->_queue.take_outstanding(); inv) {
          _logger->warn("Process of {} abandoned invocation {}", fn->name(), inv->id());
          deferred.emplace_back([inv]() {
            inv->fulfill(InvocationResult::failure(
                ErrorKind::FUNCTION_UNAVAILABLE, "Invocation abandoned by the function process"
            ));
          });
        }

        if (auto old = fn->_queue.take_poller(); old.has_value()) {
          deferred.emplace_back([old = std::move(old.value())]() {
            old(nullptr, Error{ErrorKind::FUNCTION_UNAVAILABLE, "Superseded by a newer poll"});
          });
        }

        auto handoff = fn->_queue.poll(std::move(poller));
        if (handoff.has_value()) {
          fn->_state = State::INVOKING;
          deferred.emplace_back(std::move(handoff.value()));
        } else {
          fn->_state = State::READY;
        }
      }
    }
    _run(deferred);
  }

  bool Registry::complete(
      const std::string& name, const std::string& id, invocation::InvocationResult&& result
  )
  {
    auto fn = find(name);
    if (!fn) {
      throw common::UnknownFunction(name);
    }

    invocation::InvocationPtr inv;
    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};
      inv = fn->_queue.finish(id);

      fn->_crashes = 0;
      fn->_last_error.reset();

      if (fn->_stale) {

        _logger->info("Function {} finished invocation, rebuilding", fn->name());
        fn->_stale = false;
        auto queued = fn->_queue.drain();
        fn->_pending.insert(fn->_pending.begin(), queued.begin(), queued.end());

        if (!fn->_pending.empty() || !fn->_ready_waiters.empty()) {
          _start_build(fn, deferred);
        } else {
          fn->_state = State::REBUILDING;
          _retire(*fn, deferred);
        }
      } else if (fn->_state == State::INVOKING) {
        fn->_state = State::READY;
      }
    }
    _run(deferred);

    bool delivered = inv->fulfill(std::move(result));
    if (!delivered) {
      _logger->info("Discarding late result of invocation {} of function {}", id, name);
    }
    return delivered;
  }

  void Registry::init_error(const std::string& name, const invocation::ErrorInfo& info)
  {
    auto fn = find(name);
    if (!fn) {
      throw common::UnknownFunction(name);
    }

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};

      if (fn->_state != State::STARTING && fn->_state != State::READY &&
          fn->_state != State::INVOKING) {
        _logger->warn(
            "Ignoring initialization error of {} in state {}", fn->name(),
            function::to_string(fn->_state)
        );
        return;
      }

      _crash(
          fn,
          Error{
              ErrorKind::INITIALIZATION_ERROR,
              fmt::format("{}: {}", info.error_type, info.error_message)},
          true, deferred
      );
    }
    _run(deferred);
  }

  void Registry::invalidate(const std::string& name)
  {
    auto fn = find(name);
    if (!fn) {
      return;
    }

    deferred_t deferred;
    {
      lock_t lock{fn->_mutex};

      switch (fn->_state) {
      case State::UNBUILT:
      case State::REBUILDING:
        break;
      case State::READY:
        _logger->info("Sources of function {} changed, stopping idle process", fn->name());
        if (!fn->_pending.empty() || !fn->_ready_waiters.empty()) {
          _start_build(fn, deferred);
        } else {
          fn->_state = State::REBUILDING;
          _retire(*fn, deferred);
        }
        break;
      case State::INVOKING: {
        // The outstanding invocation completes first.
        fn->_stale = true;
        auto queued = fn->_queue.drain();
        fn->_pending.insert(fn->_pending.begin(), queued.begin(), queued.end());
        break;
      }
      case State::BUILDING:
        fn->_stale = true;
        _builder.cancel(fn->name());
        break;
      case State::STARTING:
        fn->_stale = true;
        break;
      case State::CRASHED:
        fn->_crashes = 0;
        if (!fn->_pending.empty() || !fn->_ready_waiters.empty()) {
          _start_build(fn, deferred);
        } else {
          fn->_state = State::REBUILDING;
        }
        break;
      }
    }
    _run(deferred);
  }

  bool Registry::invalidate_changed(const std::string& name)
  {
    auto fn = find(name);
    if (!fn) {
      return false;
    }

    auto current = discovery::fingerprint(fn->descriptor().source_root, _config.watcher.ignore);
    {
      lock_t lock{fn->_mutex};
      bool serving = fn->_state == State::READY || fn->_state == State::INVOKING;
      if (serving && !fn->_stale && !fn->_fingerprint.empty() && fn->_fingerprint == current) {
        SPDLOG_LOGGER_DEBUG(_logger, "Sources of {} match the running build", fn->name());
        return false;
      }
    }

    invalidate(name);
    return true;
  }

  std::vector<FunctionPtr> Registry::_entries() const
  {
    std::vector<std::string> names;
    {
      std::shared_lock<std::shared_mutex> lock{_names_mutex};
      names = _names;
    }

    std::vector<FunctionPtr> entries;
    entries.reserve(names.size());
    for (const auto& name : names) {
      if (auto fn = find(name); fn) {
        entries.emplace_back(std::move(fn));
      }
    }
    return entries;
  }

  void Registry::invalidate_all()
  {
    for (const auto& fn : _entries()) {
      invalidate(fn->name());
    }
  }

  std::optional<State> Registry::state(const std::string& name) const
  {
    auto fn = find(name);
    if (!fn) {
      return std::nullopt;
    }
    return fn->state();
  }

  std::vector<std::pair<std::string, State>> Registry::functions() const
  {
    std::map<std::string, State> states;
    for (const auto& desc : _discovery.discover()) {
      states.emplace(desc.name, State::UNBUILT);
    }
    for (const auto& fn : _entries()) {
      states[fn->name()] = fn->state();
    }
    return {states.begin(), states.end()};
  }

  void Registry::shutdown()
  {
    if (_shutting_down.exchange(true)) {
      return;
    }
    _logger->info("Stopping all functions");

    auto entries = _entries();

    Error error{ErrorKind::FUNCTION_UNAVAILABLE, "Emulator is shutting down"};
    std::vector<std::shared_ptr<launcher::ProcessHandle>> processes;
    for (const auto& fn : entries) {

      _builder.cancel(fn->name());

      deferred_t deferred;
      {
        lock_t lock{fn->_mutex};

        _cancel_startup_timer(*fn);

        if (auto inv = fn->_queue.take_outstanding(); inv) {
          deferred.emplace_back([inv, error]() { inv->fulfill(InvocationResult::failure(error)); });
        }
        auto queued = fn->_queue.drain();
        fn->_pending.insert(fn->_pending.begin(), queued.begin(), queued.end());
        _fail_waiting(*fn, error, deferred);

        if (auto poller = fn->_queue.take_poller(); poller.has_value()) {
          deferred.emplace_back([poller = std::move(poller.value()), error]() {
            poller(nullptr, error);
          });
        }

        fn->_generation++;
        if (fn->_process) {
          processes.emplace_back(std::move(fn->_process));
        }
        if (fn->_retiring) {
          processes.emplace_back(fn->_retiring);
        }
      }
      _run(deferred);
    }

    for (auto& process : processes) {
      process->terminate(std::chrono::milliseconds{_config.lifecycle.shutdown_grace});
    }

    _workers.wait();

    _loop_thread.getLoop()->quit();
    _loop_thread.wait();
  }

} // namespace lemu::emulator::registry
