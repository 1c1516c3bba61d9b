#ifndef LEMU_EMULATOR_REGISTRY_HPP
#define LEMU_EMULATOR_REGISTRY_HPP

#include <lemu/emulator/concurrent_table.hpp>
#include <lemu/emulator/environment.hpp>
#include <lemu/emulator/function.hpp>
#include <lemu/emulator/invocation.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <trantor/net/EventLoopThread.h>

namespace lemu::emulator::config {
  struct Config;
} // namespace lemu::emulator::config

namespace lemu::emulator::discovery {
  class Discovery;
} // namespace lemu::emulator::discovery

namespace lemu::emulator::builder {
  class Builder;
} // namespace lemu::emulator::builder

namespace lemu::emulator::launcher {
  class Launcher;
} // namespace lemu::emulator::launcher

namespace lemu::emulator::worker {
  class Workers;
} // namespace lemu::emulator::worker

namespace lemu::emulator::registry {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Owns the function entries and drives their lifecycle:
  /// Unbuilt -> Building -> Starting -> Ready <-> Invoking, with Crashed and
  /// Rebuilding reachable on failures and source changes.
  ///
  /// Each entry is protected by its own mutex; the table lock is only held for
  /// lookups and insertions. Builds, process starts and teardowns run on the
  /// worker pool, and all callbacks are invoked after the entry lock is released.
  ////////////////////////////////////////////////////////////////////////////////
  class Registry {
  public:
    using table_t = ConcurrentTable<function::FunctionPtr>::table_t;
    using ready_callback_t = function::Function::ready_callback_t;
    using poller_t = function::InvocationQueue::poller_t;

    Registry(
        const config::Config& cfg, discovery::Discovery& discovery, builder::Builder& builder,
        launcher::Launcher& launcher, worker::Workers& workers
    );

    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Returns the entry of a function, creating it from the discovery
    /// descriptor on first use.
    ///
    /// @throws common::UnknownFunction
    ////////////////////////////////////////////////////////////////////////////////
    function::FunctionPtr resolve(const std::string& name);

    // Existing entry only; nullptr when the function has never been resolved.
    function::FunctionPtr find(const std::string& name) const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Drives the function towards Ready. The callback receives an empty
    /// optional once the process has contacted the Runtime API, or the error that
    /// prevented it (compile error, startup timeout, initialization error,
    /// exhausted retry budget).
    ///
    /// @throws common::UnknownFunction
    ////////////////////////////////////////////////////////////////////////////////
    void ensure_ready(const std::string& name, ready_callback_t&& callback);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Appends the invocation to the function's FIFO. Invocations arriving
    /// before the function is ready wait in the pending list and are moved to the
    /// queue, in order, on readiness. Failures are delivered through the
    /// invocation's response slot.
    ///
    /// @throws common::UnknownFunction
    ////////////////////////////////////////////////////////////////////////////////
    void dispatch(const invocation::InvocationPtr& inv);

    // Long-poll of a function process. The poller is answered with the next
    // invocation, or with an error when the function is not accepting work.
    void next_invocation(const std::string& name, poller_t&& poller);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Completes the outstanding invocation with a result reported by the
    /// process.
    ///
    /// @return false when the invocation had already been fulfilled (timeout) and
    /// the result was discarded
    /// @throws common::UnknownFunction, common::UnknownInvocationId
    ////////////////////////////////////////////////////////////////////////////////
    bool complete(
        const std::string& name, const std::string& id, invocation::InvocationResult&& result
    );

    void init_error(const std::string& name, const invocation::ErrorInfo& info);

    void invalidate(const std::string& name);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Invalidates the function unless its running process was built from
    /// sources with the same fingerprint. Used for changes scoped to a single
    /// function; notifications delayed past a rebuild do not restart it again.
    ///
    /// @return true when the entry has been invalidated
    ////////////////////////////////////////////////////////////////////////////////
    bool invalidate_changed(const std::string& name);

    void invalidate_all();

    std::optional<function::State> state(const std::string& name) const;

    // Every discovered function with the state of its entry, sorted by name.
    std::vector<std::pair<std::string, function::State>> functions() const;

    void shutdown();

  private:
    using deferred_t = std::vector<std::function<void()>>;
    using lock_t = std::unique_lock<function::Function::lock_t>;

    static void _run(deferred_t& deferred);

    // Resolved entries; traversing the TBB table is unsafe next to insertions.
    std::vector<function::FunctionPtr> _entries() const;

    void _fail_waiting(function::Function& fn, const invocation::Error& error, deferred_t& deferred);

    void _fire_waiters(
        function::Function& fn, const std::optional<invocation::Error>& error, deferred_t& deferred
    );

    // Stops the current process in the background; its exit is not a crash.
    void _retire(function::Function& fn, deferred_t& deferred);

    void _start_build(const function::FunctionPtr& fn, deferred_t& deferred);

    void _respawn(const function::FunctionPtr& fn, deferred_t& deferred);

    // Starts a build or a respawn for a waiting caller; error if none is allowed.
    std::optional<invocation::Error> _wake(const function::FunctionPtr& fn, deferred_t& deferred);

    void _provision(
        const function::FunctionPtr& fn, std::shared_ptr<launcher::ProcessHandle> retiring,
        bool rebuild
    );

    void _spawn(const function::FunctionPtr& fn, lock_t& lock, deferred_t& deferred);

    void _crash(
        const function::FunctionPtr& fn, const invocation::Error& error, bool fail_waiting,
        deferred_t& deferred
    );

    void _process_exited(const std::weak_ptr<function::Function>& ptr, uint64_t generation, int status);

    void _startup_timeout(const std::weak_ptr<function::Function>& ptr, uint64_t generation);

    void _cancel_startup_timer(function::Function& fn);

    bool _retry_allowed(const function::Function& fn) const;

    invocation::Error _unavailable(const function::Function& fn) const;

    const config::Config& _config;
    discovery::Discovery& _discovery;
    builder::Builder& _builder;
    launcher::Launcher& _launcher;
    worker::Workers& _workers;

    environment::Environment _inherited;
    std::string _runtime_api_address;

    std::atomic<bool> _shutting_down{false};

    table_t _functions;

    mutable std::shared_mutex _names_mutex;
    std::vector<std::string> _names;

    // Startup timers.
    trantor::EventLoopThread _loop_thread;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace lemu::emulator::registry

#endif
