#ifndef LEMU_EMULATOR_FUNCTION_HPP
#define LEMU_EMULATOR_FUNCTION_HPP

#include <lemu/emulator/discovery.hpp>
#include <lemu/emulator/invocation.hpp>
#include <lemu/emulator/launcher.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lemu::emulator::registry {
  class Registry;
} // namespace lemu::emulator::registry

namespace lemu::emulator::function {

  enum class State {

    UNBUILT = 0,
    BUILDING,
    STARTING,
    READY,
    INVOKING,
    CRASHED,
    REBUILDING

  };

  std::string to_string(State state);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Rendezvous between invocations and the next-invocation polls of a
  /// function process.
  ///
  /// Holds the FIFO of queued invocations, the single outstanding invocation that
  /// has been handed to the process, and at most one parked poll. A hand-off pairs
  /// a poll with the queue head; invocations fulfilled in the meantime (timeouts)
  /// are skipped.
  ///
  /// Not synchronized: callers hold the lock of the owning function entry. The
  /// returned hand-off must be executed after that lock is released.
  ////////////////////////////////////////////////////////////////////////////////
  class InvocationQueue {
  public:
    using poller_t =
        std::function<void(invocation::InvocationPtr, std::optional<invocation::Error>)>;

    struct Handoff {
      poller_t poller;
      invocation::InvocationPtr invocation;

      void operator()()
      {
        poller(invocation, std::nullopt);
      }
    };

    InvocationQueue(std::string function) : _function(std::move(function)) {}

    // Enqueues at the tail; pairs with the parked poll when there is one.
    std::optional<Handoff> push(invocation::InvocationPtr inv);

    // Serves the poll from the queue head or parks it.
    std::optional<Handoff> poll(poller_t&& poller);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Closes the outstanding invocation. The queue is not modified when the
    /// identifier does not match.
    ///
    /// @return the invocation that has been completed
    /// @throws common::UnknownInvocationId when the id is not outstanding
    ////////////////////////////////////////////////////////////////////////////////
    invocation::InvocationPtr finish(const std::string& id);

    // Removes all queued, undelivered invocations in FIFO order.
    std::deque<invocation::InvocationPtr> drain();

    invocation::InvocationPtr take_outstanding();

    std::optional<poller_t> take_poller();

    const invocation::InvocationPtr& outstanding() const
    {
      return _outstanding;
    }

    bool parked() const
    {
      return _poller.has_value();
    }

    bool busy() const
    {
      return _outstanding != nullptr;
    }

    size_t size() const
    {
      return _queue.size();
    }

  private:
    invocation::InvocationPtr _next();

    std::string _function;
    std::deque<invocation::InvocationPtr> _queue;
    invocation::InvocationPtr _outstanding;
    std::optional<poller_t> _poller;
  };

  class Function {
  public:
    friend class registry::Registry;

    using lock_t = std::mutex;
    using ready_callback_t = std::function<void(std::optional<invocation::Error>)>;

    Function(discovery::Descriptor&& desc)
        : _descriptor(std::move(desc)), _queue(_descriptor.name)
    {
    }

    Function(const Function& obj) = delete;
    Function& operator=(const Function& obj) = delete;

    const std::string& name() const
    {
      return _descriptor.name;
    }

    const discovery::Descriptor& descriptor() const
    {
      return _descriptor;
    }

    State state() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _state;
    }

    uint64_t generation() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _generation;
    }

    int crashes() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _crashes;
    }

    bool stale() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _stale;
    }

    size_t pending() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _pending.size();
    }

    size_t queued() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _queue.size();
    }

    // Source fingerprint of the last successful build; empty before the first one.
    std::string fingerprint() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _fingerprint;
    }

    bool running() const
    {
      std::lock_guard<lock_t> lock{_mutex};
      return _process && _process->running();
    }

  private:
    mutable lock_t _mutex;

    discovery::Descriptor _descriptor;

    State _state{State::UNBUILT};
    bool _stale{false};
    int _crashes{0};
    // Incarnation of the process; notifications of older generations are ignored.
    uint64_t _generation{0};

    std::string _artifact;
    std::string _fingerprint;

    std::unique_ptr<launcher::ProcessHandle> _process;
    // Previous process being stopped; a replacement waits for its termination.
    std::shared_ptr<launcher::ProcessHandle> _retiring;

    // Invocations waiting for readiness, not yet visible to the process.
    std::deque<invocation::InvocationPtr> _pending;
    InvocationQueue _queue;

    std::vector<ready_callback_t> _ready_waiters;
    std::optional<uint64_t> _startup_timer;
    std::optional<invocation::Error> _last_error;
  };

  using FunctionPtr = std::shared_ptr<Function>;

} // namespace lemu::emulator::function

#endif
